#pragma once

#include <string>

namespace dotmatrix::common {

/// Timestamped diagnostic log shared by the emulator core and the tools.
/// Writes to $DOTMATRIX_LOG_FILE when set, otherwise dotmatrix_debug.log in the executable directory.
/// Calls made before init() or after shutdown() are dropped, except that logError always reaches stderr.
class Logger {
public:
    static void init();
    static void log(const std::string& message);
    static void logError(const std::string& message);
    static void shutdown();

private:
    Logger() = default;
};

}  // namespace dotmatrix::common
