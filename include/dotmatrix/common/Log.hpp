#pragma once

#include <string_view>

namespace dotmatrix::common {

/// Plain console output for the command line tools.
void logInfo(std::string_view message);

}  // namespace dotmatrix::common
