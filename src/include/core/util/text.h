#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace tailkit::core {

namespace text {

// Strips spaces, tabs, CR and LF (and the other ASCII whitespace) from both ends
std::string_view Trim(std::string_view value);

bool IsValidUtf8(std::string_view bytes);

// "program arg1 arg2", for logging only
std::string JoinCommandLine(std::string_view program, const std::vector<std::string>& args);

} // namespace text

} // namespace tailkit::core
