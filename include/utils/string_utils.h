#ifndef STRING_UTILS_H
#define STRING_UTILS_H

#include <algorithm>
#include <cctype>
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

// Splits on the delimiter, trimming each item and dropping empty ones.
inline std::vector<std::string> splitList(std::string_view str,
                                          char delimiter = ',') {
  std::vector<std::string> items;
  size_t pos = 0;
  while (pos <= str.size()) {
    size_t next = str.find(delimiter, pos);
    if (next == std::string_view::npos)
      next = str.size();
    std::string item = trim(str.substr(pos, next - pos));
    if (!item.empty())
      items.push_back(item);
    pos = next + 1;
  }
  return items;
}

inline std::string join(const std::vector<std::string> &items,
                        const std::string &separator) {
  std::string result;
  for (size_t i = 0; i < items.size(); ++i) {
    if (i > 0)
      result += separator;
    result += items[i];
  }
  return result;
}

// Glob match over the whole text: '*' matches any run of characters, '?'
// exactly one.
inline bool matchesWildcard(std::string_view text, std::string_view pattern) {
  size_t t = 0;
  size_t p = 0;
  size_t starPattern = std::string_view::npos;
  size_t starText = 0;
  while (t < text.size()) {
    if (p < pattern.size() && (pattern[p] == '?' || pattern[p] == text[t])) {
      ++t;
      ++p;
    } else if (p < pattern.size() && pattern[p] == '*') {
      starPattern = p++;
      starText = t;
    } else if (starPattern != std::string_view::npos) {
      p = starPattern + 1;
      t = ++starText;
    } else {
      return false;
    }
  }
  while (p < pattern.size() && pattern[p] == '*')
    ++p;
  return p == pattern.size();
}

inline bool parseBool(std::string_view value, bool &out) {
  std::string lower = toLower(trim(value));
  if (lower == "1" || lower == "true" || lower == "yes" || lower == "on") {
    out = true;
    return true;
  }
  if (lower == "0" || lower == "false" || lower == "no" || lower == "off") {
    out = false;
    return true;
  }
  return false;
}

// Accepts names PostgreSQL would take unquoted after lowercasing: letters,
// digits, underscore and dollar, not starting with a digit.
inline bool isValidDatabaseIdentifier(const std::string &identifier,
                                      size_t maxLength = 63) {
  if (identifier.empty() || identifier.length() > maxLength) {
    return false;
  }

  for (char c : identifier) {
    if (!((c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
          (c >= '0' && c <= '9') || c == '_' || c == '$')) {
      return false;
    }
  }

  return !(identifier[0] >= '0' && identifier[0] <= '9');
}

// Turns an arbitrary VCS branch name into a database-name-safe fragment:
// lowercase, path separators, dashes and dots become underscores, anything
// else outside [a-z0-9_] is dropped, a leading digit gets a "br_" prefix and
// the result is capped at 63 characters.
inline std::string sanitizeIdentifier(std::string_view name) {
  std::string cleaned;
  for (unsigned char c : toLower(name)) {
    if (c == '/' || c == '-' || c == '.') {
      cleaned += '_';
    } else if ((c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '_') {
      cleaned += static_cast<char>(c);
    }
  }

  if (!cleaned.empty() && cleaned[0] >= '0' && cleaned[0] <= '9') {
    cleaned = "br_" + cleaned;
  }

  if (cleaned.length() > 63) {
    cleaned = cleaned.substr(0, 63);
  }
  return cleaned;
}

} // namespace StringUtils

#endif
