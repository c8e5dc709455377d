#include "dotmatrix/common/Paths.hpp"

#include <cstdlib>

#ifdef _WIN32
#include <Windows.h>
#else
#include <unistd.h>

#include <climits>
#endif

namespace dotmatrix::common {
namespace {

#ifdef _WIN32
std::filesystem::path getExecutablePath() {
    wchar_t buf[MAX_PATH];
    const DWORD len = GetModuleFileNameW(nullptr, buf, MAX_PATH);
    if (len == 0 || len >= MAX_PATH) {
        return {};
    }
    return std::filesystem::path(buf);
}
#else
std::filesystem::path getExecutablePath() {
    char buf[PATH_MAX];
    const ssize_t len = readlink("/proc/self/exe", buf, sizeof(buf) - 1);
    if (len <= 0) {
        return {};
    }
    buf[len] = '\0';
    return std::filesystem::path(buf);
}
#endif

std::filesystem::path vectorSubdir() {
    return std::filesystem::path("test_data") / "single_step_tests" / "v1";
}

}  // namespace

std::filesystem::path executableDir() {
    static const std::filesystem::path dir = getExecutablePath().parent_path();
    return dir;
}

std::filesystem::path testDataDir() {
    if (const char* env = std::getenv("DOTMATRIX_TEST_DATA"); env != nullptr && env[0] != '\0') {
        return std::filesystem::path(env);
    }

#ifndef _WIN32
    if (const char* appDir = std::getenv("APPDIR"); appDir != nullptr) {
        auto candidate = std::filesystem::path(appDir) / "usr" / "share" / "dotmatrix" / vectorSubdir();
        std::error_code ec;
        if (std::filesystem::is_directory(candidate, ec) && !ec) {
            return candidate;
        }
    }
#endif

    return executableDir() / vectorSubdir();
}

std::filesystem::path userConfigPath() {
#ifdef _WIN32
    return {};
#else
    if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg != nullptr && xdg[0] != '\0') {
        return std::filesystem::path(xdg) / "dotmatrix" / "config.json";
    }
    if (const char* home = std::getenv("HOME"); home != nullptr && home[0] != '\0') {
        return std::filesystem::path(home) / ".config" / "dotmatrix" / "config.json";
    }
    return {};
#endif
}

}  // namespace dotmatrix::common
