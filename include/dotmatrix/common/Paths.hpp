#pragma once

#include <filesystem>

namespace dotmatrix::common {

/// Returns the directory containing the running executable.
std::filesystem::path executableDir();

/// Resolves the SingleStepTests sm83 vector directory.
/// Search order: $DOTMATRIX_TEST_DATA -> $APPDIR/usr/share/dotmatrix/test_data/single_step_tests/v1 ->
/// <exe_dir>/test_data/single_step_tests/v1
std::filesystem::path testDataDir();

/// Resolves the full path to the optional user emulator config.
/// On Linux: $XDG_CONFIG_HOME/dotmatrix/config.json or ~/.config/dotmatrix/config.json.
/// Returns an empty path when no user config location is available.
std::filesystem::path userConfigPath();

}  // namespace dotmatrix::common
