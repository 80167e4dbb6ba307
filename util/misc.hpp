#ifndef UTIL_MISC_HPP
#define UTIL_MISC_HPP
#include <string>
#include <vector>

namespace util {

// Splits s on delim, dropping empty items.
std::vector<std::string> split(const std::string& s, char delim);

// Removes leading and trailing whitespace.
std::string Trim(const std::string& s);

std::string ToLower(std::string s);

// Keeps only the characters that are valid in an image or container name,
// lowercasing the rest.
std::string SanitizeName(const std::string& s);

}  // namespace util
#endif
