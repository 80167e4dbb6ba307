#include "util/misc.hpp"

#include <algorithm>
#include <cctype>

#include "absl/strings/ascii.h"
#include "absl/strings/str_split.h"

namespace util {

std::vector<std::string> split(const std::string& s, char delim) {
  return absl::StrSplit(s, delim, absl::SkipEmpty());
}

std::string Trim(const std::string& s) {
  return std::string(absl::StripAsciiWhitespace(s));
}

std::string ToLower(std::string s) {
  absl::AsciiStrToLower(&s);
  return s;
}

std::string SanitizeName(const std::string& s) {
  std::string out;
  for (char c : s) {
    if (isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_' ||
        c == '.') {
      out += static_cast<char>(tolower(static_cast<unsigned char>(c)));
    } else {
      out += '-';
    }
  }
  if (out.empty() || !isalnum(static_cast<unsigned char>(out[0])))
    out = "x" + out;
  return out;
}

}  // namespace util
