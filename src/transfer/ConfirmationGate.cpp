#include "transfer/ConfirmationGate.h"
#include "utils/string_utils.h"

bool ConsoleConfirmationGate::confirm(const std::string &target,
                                      const std::string &statementPreview) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (acceptAll_)
    return true;
  if (declineAll_)
    return false;

  while (true) {
    out_ << "\nTarget: " << target << "\n"
         << statementPreview << "\n"
         << "Apply this statement? [y]es / [n]o / [a]ll / [q]uit: "
         << std::flush;

    std::string answer;
    if (!std::getline(in_, answer)) {
      declineAll_ = true;
      return false;
    }

    answer = StringUtils::toLower(StringUtils::trim(answer));
    if (answer == "y" || answer == "yes")
      return true;
    if (answer == "n" || answer == "no")
      return false;
    if (answer == "a" || answer == "all") {
      acceptAll_ = true;
      return true;
    }
    if (answer == "q" || answer == "quit") {
      declineAll_ = true;
      return false;
    }
  }
}
