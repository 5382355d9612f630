#ifndef UTIL_WHICH_HPP
#define UTIL_WHICH_HPP

#include <string>

namespace util {

// Equivalent to the command-line utility which: returns the first executable
// file called cmd in the folders of PATH, or an empty string. A cmd that
// contains a slash is returned as-is if it is executable. Found commands are
// cached unless use_cache is false.
std::string which(const std::string& cmd, bool use_cache = true);

}  // namespace util

#endif
