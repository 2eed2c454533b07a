#pragma once

#include "mirror/core/result.hpp"

#include <filesystem>

namespace mirror {

/// fsync an existing regular file so its contents survive a power loss. ERRORS: Io
Result<void> sync_file(const std::filesystem::path& path);

/// fsync a directory so renames into it survive a power loss. ERRORS: Io
Result<void> sync_directory(const std::filesystem::path& directory);

} // namespace mirror
