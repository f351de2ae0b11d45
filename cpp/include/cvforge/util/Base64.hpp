#pragma once

#include <string>
#include <string_view>

namespace cvforge::util {

// Standard alphabet with '=' padding, no line breaks.
std::string base64Encode(std::string_view data);

} // namespace cvforge::util
