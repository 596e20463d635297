#ifndef STRING_UTILS_H
#define STRING_UTILS_H

#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace StringUtils {

inline std::string toLower(std::string_view str) {
  std::string result{str};
  std::transform(result.begin(), result.end(), result.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return result;
}

inline std::string toUpper(std::string_view str) {
  std::string result{str};
  std::transform(result.begin(), result.end(), result.begin(),
                 [](unsigned char c) { return std::toupper(c); });
  return result;
}

inline std::string trim(std::string_view str) {
  const auto start = std::find_if_not(
      str.begin(), str.end(), [](unsigned char c) { return std::isspace(c); });

  const auto end =
      std::find_if_not(str.rbegin(), str.rend(), [](unsigned char c) {
        return std::isspace(c);
      }).base();

  return (start < end) ? std::string(start, end) : std::string{};
}

inline bool startsWith(std::string_view str, std::string_view prefix) {
  return str.size() >= prefix.size() &&
         str.compare(0, prefix.size(), prefix) == 0;
}

inline bool containsIgnoreCase(std::string_view haystack,
                               std::string_view needle) {
  auto it = std::search(haystack.begin(), haystack.end(), needle.begin(),
                        needle.end(), [](char ch1, char ch2) {
                          return std::tolower(static_cast<unsigned char>(ch1)) ==
                                 std::tolower(static_cast<unsigned char>(ch2));
                        });
  return it != haystack.end();
}

inline std::string join(const std::vector<std::string> &parts,
                        std::string_view separator) {
  std::string result;
  for (size_t i = 0; i < parts.size(); ++i) {
    if (i > 0)
      result += separator;
    result += parts[i];
  }
  return result;
}

// T-SQL QUOTENAME: wraps in brackets and doubles any closing bracket.
inline std::string quoteName(std::string_view identifier) {
  if (identifier.empty()) {
    throw std::invalid_argument("Identifier cannot be empty");
  }

  std::string quoted = "[";
  for (char c : identifier) {
    quoted += c;
    if (c == ']')
      quoted += ']';
  }
  quoted += "]";
  return quoted;
}

inline std::string escapeSQL(std::string_view value) {
  std::string escaped;
  escaped.reserve(value.size());
  for (char c : value) {
    escaped += c;
    if (c == '\'')
      escaped += '\'';
  }
  return escaped;
}

// N'...' literal with embedded quotes doubled.
inline std::string quoteLiteral(std::string_view value) {
  return "N'" + escapeSQL(value) + "'";
}

// Drops invalid UTF-8 byte sequences, keeping printable ASCII, common
// whitespace and well-formed multi-byte sequences.
inline std::string sanitizeUTF8(const std::string &input) {
  std::string result;
  result.reserve(input.size());

  for (size_t i = 0; i < input.size(); ++i) {
    unsigned char c = static_cast<unsigned char>(input[i]);

    if ((c >= 0x20 && c <= 0x7E) || c == '\n' || c == '\r' || c == '\t') {
      result += static_cast<char>(c);
      continue;
    }

    size_t extra = 0;
    if ((c & 0xE0) == 0xC0)
      extra = 1;
    else if ((c & 0xF0) == 0xE0)
      extra = 2;
    else if ((c & 0xF8) == 0xF0)
      extra = 3;
    else
      continue;

    if (i + extra >= input.size())
      continue;

    bool valid = true;
    for (size_t k = 1; k <= extra; ++k) {
      if ((static_cast<unsigned char>(input[i + k]) & 0xC0) != 0x80) {
        valid = false;
        break;
      }
    }
    if (!valid)
      continue;

    result.append(input, i, extra + 1);
    i += extra;
  }

  return result;
}

// First line of a statement, shortened for log and report previews.
inline std::string previewStatement(const std::string &statement,
                                    size_t maxLength = 120) {
  std::string firstLine = trim(statement.substr(0, statement.find('\n')));
  if (firstLine.length() > maxLength) {
    firstLine = firstLine.substr(0, maxLength - 3) + "...";
  }
  return firstLine;
}

} // namespace StringUtils

#endif
