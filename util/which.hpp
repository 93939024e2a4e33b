#ifndef UTIL_WHICH_HPP
#define UTIL_WHICH_HPP

#include <string>

namespace util {

// Equivalent to the command-line utility which. Returns the empty string if
// cmd cannot be found and throws if PATH is not set. Commands containing a
// slash are returned as they are if they name an executable file.
// Once a command is found it is served from a cache, even if the file
// disappears later.
std::string which(const std::string& cmd);

}  // namespace util

#endif
