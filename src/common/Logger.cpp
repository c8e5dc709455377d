#include "dotmatrix/common/Logger.hpp"
#include "dotmatrix/common/Paths.hpp"

#include <chrono>
#include <cstdlib>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace dotmatrix::common {
namespace {

std::ofstream logFile;
std::mutex logMutex;

std::string timestamp() {
    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

    std::tm tm_buf{};
#ifdef _WIN32
    localtime_s(&tm_buf, &time);
#else
    localtime_r(&time, &tm_buf);
#endif

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
    oss << '.' << std::setfill('0') << std::setw(3) << ms.count();
    return oss.str();
}

std::filesystem::path logFilePath() {
    if (const char* overridePath = std::getenv("DOTMATRIX_LOG_FILE"); overridePath != nullptr && overridePath[0] != '\0') {
        return std::filesystem::path(overridePath);
    }
    return executableDir() / "dotmatrix_debug.log";
}

}  // namespace

void Logger::init() {
    std::lock_guard<std::mutex> lock(logMutex);
    if (logFile.is_open()) {
        return;
    }
    logFile.open(logFilePath(), std::ios::out | std::ios::app);
    if (logFile.is_open()) {
        logFile << "\n=== dotmatrix startup " << timestamp() << " ===\n";
        logFile.flush();
    }
}

void Logger::log(const std::string& message) {
    std::lock_guard<std::mutex> lock(logMutex);
    if (logFile.is_open()) {
        logFile << "[INFO ] " << timestamp() << " - " << message << '\n';
        logFile.flush();
    }
}

void Logger::logError(const std::string& message) {
    std::lock_guard<std::mutex> lock(logMutex);
    if (logFile.is_open()) {
        logFile << "[ERROR] " << timestamp() << " - " << message << '\n';
        logFile.flush();
    }
    std::cerr << "[error] " << message << '\n';
}

void Logger::shutdown() {
    std::lock_guard<std::mutex> lock(logMutex);
    if (logFile.is_open()) {
        logFile << "=== dotmatrix shutdown " << timestamp() << " ===\n\n";
        logFile.close();
    }
}

}  // namespace dotmatrix::common
