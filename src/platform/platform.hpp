#pragma once

#include <filesystem>

namespace platform {

// Returns the system temporary directory (/tmp on Unix, GetTempPath on Windows).
std::filesystem::path temp_dir();

} // namespace platform
