#include "mirror/fetch/materializer.hpp"

#include "mirror/core/durable_file.hpp"

#include <spdlog/spdlog.h>

#include <fstream>

namespace mirror::fetch {
namespace fs = std::filesystem;

namespace {

// Deletes the temporary file unless the rename succeeded
class TemporaryFile {
public:
    explicit TemporaryFile(fs::path path) : path_(std::move(path)) {}
    ~TemporaryFile() {
        if (!released_) {
            std::error_code ec;
            fs::remove(path_, ec);
        }
    }

    TemporaryFile(const TemporaryFile&) = delete;
    TemporaryFile& operator=(const TemporaryFile&) = delete;

    const fs::path& path() const { return path_; }
    void release() { released_ = true; }

private:
    fs::path path_;
    bool released_ = false;
};

} // namespace

fs::path Materializer::temporary_path_for(const fs::path& destination) {
    fs::path temporary = destination;
    temporary += ".part";
    return temporary;
}

Result<MaterializeResult> Materializer::materialize(const ByteStream& stream,
                                                    const fs::path& destination) const {
    auto placed = place(stream, destination);
    if (placed.is_error()) {
        return Err<MaterializeResult>(placed.error());
    }

    MaterializeResult result;
    result.byte_size = placed.value();
    result.format = detect_archive_format(destination.filename().string());

    if (result.format == ArchiveFormat::None) {
        return Ok(result);
    }

    auto extracted = extract_and_replace(destination);
    if (extracted.is_error()) {
        return Err<MaterializeResult>(extracted.error());
    }
    result.extracted_entries = extracted.value().files.size();
    return Ok(result);
}

Result<std::uint64_t> Materializer::place(const ByteStream& stream, const fs::path& destination) const {
    if (auto res = ensure_parent_exists(destination); res.is_error()) {
        return Err<std::uint64_t>(res.error());
    }

    TemporaryFile temporary(temporary_path_for(destination));
    std::uint64_t written = 0;

    {
        std::ofstream output(temporary.path(), std::ios::binary | std::ios::trunc);
        if (!output) {
            return Err<std::uint64_t>(ErrorKind::Io, "cannot create " + temporary.path().string());
        }

        auto sink = [&](const char* data, std::size_t size) -> Result<void> {
            output.write(data, static_cast<std::streamsize>(size));
            if (!output) {
                return Err<void>(ErrorKind::Io, "write failed for " + temporary.path().string());
            }
            written += size;
            return Ok();
        };

        if (auto res = stream(sink); res.is_error()) {
            return Err<std::uint64_t>(res.error());
        }

        output.flush();
        if (!output) {
            return Err<std::uint64_t>(ErrorKind::Io, "flush failed for " + temporary.path().string());
        }
    }

    // Data reaches disk before the name does, and the name before the ledger record
    if (auto res = sync_file(temporary.path()); res.is_error()) {
        return Err<std::uint64_t>(res.error());
    }

    std::error_code ec;
    fs::rename(temporary.path(), destination, ec);
    if (ec) {
        return Err<std::uint64_t>(ErrorKind::Io,
            "cannot move " + temporary.path().string() + " into place: " + ec.message());
    }
    temporary.release();

    if (auto res = sync_directory(destination.parent_path()); res.is_error()) {
        return Err<std::uint64_t>(res.error());
    }
    return Ok(written);
}

Result<ExtractionReport> Materializer::extract_and_replace(const fs::path& archive) const {
    const fs::path target = archive.parent_path();
    auto extracted = extractor_.extract(archive, target);
    if (extracted.is_error()) {
        return extracted;
    }

    std::error_code ec;
    fs::remove(archive, ec);
    if (ec) {
        return Err<ExtractionReport>(ErrorKind::Io,
            "extracted but could not delete " + archive.string() + ": " + ec.message());
    }
    if (auto res = sync_directory(target); res.is_error()) {
        return Err<ExtractionReport>(res.error());
    }

    spdlog::debug("Extracted {} files ({} bytes) from {}",
                  extracted.value().files.size(), extracted.value().bytes, archive.string());
    return extracted;
}

Result<void> Materializer::ensure_parent_exists(const fs::path& path) {
    const auto parent = path.parent_path();
    if (parent.empty()) {
        return Ok();
    }
    std::error_code ec;
    fs::create_directories(parent, ec);
    if (ec && !fs::is_directory(parent)) {
        return Err<void>(ErrorKind::Io, "cannot create directory " + parent.string() + ": " + ec.message());
    }
    return Ok();
}

} // namespace mirror::fetch
