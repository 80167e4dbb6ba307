#ifndef UTIL_WHICH_HPP
#define UTIL_WHICH_HPP

#include <string>

namespace util {

// Equivalent to the command-line utility which. Returns an empty string if
// cmd cannot be found in PATH. Found commands are cached.
std::string which(const std::string& cmd, bool use_cache = true);

}  // namespace util

#endif
