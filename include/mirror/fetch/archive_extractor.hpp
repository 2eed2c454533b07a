#pragma once

#include "mirror/core/result.hpp"

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace mirror::fetch {

enum class ArchiveFormat {
    None,
    Zip
};

const char* to_string(ArchiveFormat format);

/// Archive format implied by a file name; matching is case-insensitive on the extension.
ArchiveFormat detect_archive_format(const std::string& name);

struct ExtractionReport {
    std::vector<std::filesystem::path> files;   ///< Regular files written, in archive order
    std::uint64_t bytes = 0;
};

/**
 * @brief Unpacks zip archives with libarchive
 *
 * extract() makes two passes over the archive. The first reads every entry to
 * the end so CRC and truncation errors surface before anything is written.
 * The second writes entries below the target directory, each through a
 * temporary file renamed into place. If the second pass fails, the files it
 * created are removed again.
 *
 * Entries with absolute paths or ".." segments make the whole archive invalid,
 * as does an entry that would land on the archive file itself.
 * Links and device entries are skipped.
 */
class ArchiveExtractor {
public:
    /// Read the whole archive without writing anything. ERRORS: CorruptArchive
    Result<std::size_t> validate(const std::filesystem::path& archive) const;

    /// ERRORS: CorruptArchive for bad input, Io for disk failures
    Result<ExtractionReport> extract(const std::filesystem::path& archive,
                                     const std::filesystem::path& target_directory) const;

    /// True for empty or absolute entry names and names with ".." segments.
    static bool is_unsafe_entry_path(const std::string& entry_path);
};

} // namespace mirror::fetch
