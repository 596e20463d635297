#ifndef CONFIRMATIONGATE_H
#define CONFIRMATIONGATE_H

#include <iostream>
#include <mutex>
#include <string>

class IConfirmationGate {
public:
  virtual ~IConfirmationGate() = default;

  virtual bool confirm(const std::string &target,
                       const std::string &statementPreview) = 0;
};

// Asks on the terminal before each statement: y(es), n(o), a(ll remaining),
// q(uit, decline all remaining). End of input counts as quit.
class ConsoleConfirmationGate : public IConfirmationGate {
  std::istream &in_;
  std::ostream &out_;
  std::mutex mutex_;
  bool acceptAll_ = false;
  bool declineAll_ = false;

public:
  ConsoleConfirmationGate(std::istream &in = std::cin,
                          std::ostream &out = std::cout)
      : in_(in), out_(out) {}

  bool confirm(const std::string &target,
               const std::string &statementPreview) override;
};

#endif
