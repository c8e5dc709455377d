#include "dotmatrix/common/Log.hpp"

#include <iostream>

namespace dotmatrix::common {

void logInfo(std::string_view message) {
    std::cout << "[info] " << message << '\n';
}

}  // namespace dotmatrix::common
