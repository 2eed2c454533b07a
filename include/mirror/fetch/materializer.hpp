#pragma once

#include "mirror/core/byte_stream.hpp"
#include "mirror/core/result.hpp"
#include "mirror/fetch/archive_extractor.hpp"

#include <cstdint>
#include <filesystem>

namespace mirror::fetch {

struct MaterializeResult {
    std::uint64_t byte_size = 0;            ///< Bytes received from the stream
    ArchiveFormat format = ArchiveFormat::None;
    std::size_t extracted_entries = 0;      ///< Files unpacked when format != None
};

/**
 * @brief Places transferred bytes at their final path, then unpacks archives
 *
 * The stream goes to "<destination>.part" next to the destination and is
 * renamed into place only after the stream finished without error. Nothing
 * ever appears at the destination path half-written.
 */
class Materializer {
public:
    /**
     * ERRORS:
     * - Transfer / Cancelled: the stream failed (temporary file removed)
     * - Io: the disk write, flush or rename failed (temporary file removed)
     * - CorruptArchive: the file was placed but is not a readable archive;
     *   it stays at @p destination
     */
    Result<MaterializeResult> materialize(const ByteStream& stream,
                                          const std::filesystem::path& destination) const;

    /// Atomic write only, without the archive step.
    Result<std::uint64_t> place(const ByteStream& stream,
                                const std::filesystem::path& destination) const;

    /**
     * @brief Unpack @p archive into its own directory and delete it
     *
     * The archive is deleted only after every entry was written.
     */
    Result<ExtractionReport> extract_and_replace(const std::filesystem::path& archive) const;

    static std::filesystem::path temporary_path_for(const std::filesystem::path& destination);

private:
    static Result<void> ensure_parent_exists(const std::filesystem::path& path);

    ArchiveExtractor extractor_;
};

} // namespace mirror::fetch
