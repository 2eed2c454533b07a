#include "mirror/fetch/archive_extractor.hpp"

#include "mirror/core/durable_file.hpp"

#include <archive.h>
#include <archive_entry.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <memory>
#include <set>

namespace mirror::fetch {
namespace fs = std::filesystem;

namespace {

constexpr std::size_t kReadBlockSize = 64 * 1024;

using archive_ptr = std::unique_ptr<struct ::archive, int (*)(struct ::archive*)>;

std::string lowercase(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

std::string archive_message(struct ::archive* a) {
    const char* text = ::archive_error_string(a);
    return text != nullptr ? text : "unknown archive error";
}

Result<archive_ptr> open_zip(const fs::path& path) {
    archive_ptr a(::archive_read_new(), ::archive_read_free);
    if (!a) {
        return Err<archive_ptr>(ErrorKind::Io, "archive_read_new failed");
    }
    // The seekable reader trusts the central directory, which a truncated file lacks
    ::archive_read_support_format_zip_seekable(a.get());

    if (::archive_read_open_filename(a.get(), path.string().c_str(), kReadBlockSize) != ARCHIVE_OK) {
        return Err<archive_ptr>(ErrorKind::CorruptArchive,
            path.filename().string() + ": " + archive_message(a.get()));
    }
    return Ok(std::move(a));
}

// ARCHIVE_WARN still yields a usable header; everything below it does not
bool header_usable(int rc) {
    return rc == ARCHIVE_OK || rc == ARCHIVE_WARN;
}

std::string entry_name(struct ::archive_entry* entry) {
    const char* name = ::archive_entry_pathname(entry);
    return name != nullptr ? name : std::string();
}

std::string trim_trailing_slashes(std::string name) {
    while (!name.empty() && name.back() == '/') {
        name.pop_back();
    }
    return name;
}

// Undoes the writes of one extraction attempt
class ExtractionRollback {
public:
    void created_file(fs::path path) { files_.push_back(std::move(path)); }
    void created_directory(fs::path path) { directories_.push_back(std::move(path)); }
    void commit() { committed_ = true; }

    ~ExtractionRollback() {
        if (committed_) {
            return;
        }
        std::error_code ec;
        for (auto it = files_.rbegin(); it != files_.rend(); ++it) {
            fs::remove(*it, ec);
        }
        // Deepest first; only directories left empty are removed
        for (auto it = directories_.rbegin(); it != directories_.rend(); ++it) {
            if (fs::is_empty(*it, ec) && !ec) {
                fs::remove(*it, ec);
            }
        }
    }

private:
    std::vector<fs::path> files_;
    std::vector<fs::path> directories_;
    bool committed_ = false;
};

Result<void> create_parents(const fs::path& target_root, const fs::path& path, ExtractionRollback& rollback) {
    std::vector<fs::path> missing;
    for (fs::path dir = path.parent_path(); dir != target_root && !dir.empty(); dir = dir.parent_path()) {
        std::error_code ec;
        if (fs::exists(dir, ec)) {
            break;
        }
        missing.push_back(dir);
    }

    for (auto it = missing.rbegin(); it != missing.rend(); ++it) {
        std::error_code ec;
        fs::create_directory(*it, ec);
        if (ec) {
            return Err<void>(ErrorKind::Io, "cannot create directory " + it->string() + ": " + ec.message());
        }
        rollback.created_directory(*it);
    }
    return Ok();
}

bool is_same_file(const fs::path& candidate, const fs::path& archive) {
    if (candidate == archive.lexically_normal()) {
        return true;
    }
    std::error_code ec;
    return fs::exists(candidate, ec) && fs::equivalent(candidate, archive, ec);
}

} // namespace

const char* to_string(ArchiveFormat format) {
    switch (format) {
        case ArchiveFormat::None: return "none";
        case ArchiveFormat::Zip: return "zip";
    }
    return "unknown";
}

ArchiveFormat detect_archive_format(const std::string& name) {
    const std::string extension = lowercase(fs::path(name).extension().string());
    if (extension == ".zip") {
        return ArchiveFormat::Zip;
    }
    return ArchiveFormat::None;
}

bool ArchiveExtractor::is_unsafe_entry_path(const std::string& entry_path) {
    const std::string name = trim_trailing_slashes(entry_path);
    if (name.empty() || name.front() == '/' || name.front() == '\\') {
        return true;
    }
    // Drive-letter names such as "C:foo"
    if (name.size() >= 2 && name[1] == ':' && std::isalpha(static_cast<unsigned char>(name[0]))) {
        return true;
    }

    std::size_t start = 0;
    while (start <= name.size()) {
        auto end = name.find_first_of("/\\", start);
        if (end == std::string::npos) {
            end = name.size();
        }
        if (name.compare(start, end - start, "..") == 0) {
            return true;
        }
        start = end + 1;
    }
    return false;
}

Result<std::size_t> ArchiveExtractor::validate(const fs::path& archive) const {
    auto opened = open_zip(archive);
    if (opened.is_error()) {
        return Err<std::size_t>(opened.error());
    }
    auto& a = opened.value();

    std::vector<char> buffer(kReadBlockSize);
    std::size_t entries = 0;

    while (true) {
        struct ::archive_entry* entry = nullptr;
        const int rc = ::archive_read_next_header(a.get(), &entry);
        if (rc == ARCHIVE_EOF) {
            break;
        }
        if (!header_usable(rc)) {
            return Err<std::size_t>(ErrorKind::CorruptArchive,
                archive.filename().string() + ": " + archive_message(a.get()));
        }

        const std::string name = entry_name(entry);
        if (is_unsafe_entry_path(name)) {
            return Err<std::size_t>(ErrorKind::CorruptArchive,
                archive.filename().string() + ": unsafe entry path '" + name + "'");
        }

        // Reading the data is what triggers the CRC check
        while (true) {
            const la_ssize_t n = ::archive_read_data(a.get(), buffer.data(), buffer.size());
            if (n == 0) {
                break;
            }
            if (n < 0 && n != ARCHIVE_WARN) {
                return Err<std::size_t>(ErrorKind::CorruptArchive,
                    archive.filename().string() + ": " + name + ": " + archive_message(a.get()));
            }
        }
        ++entries;
    }

    if (entries == 0) {
        spdlog::warn("Archive {} has no entries", archive.string());
    }
    return Ok(entries);
}

Result<ExtractionReport> ArchiveExtractor::extract(const fs::path& archive,
                                                   const fs::path& target_directory) const {
    if (auto valid = validate(archive); valid.is_error()) {
        return Err<ExtractionReport>(valid.error());
    }

    auto opened = open_zip(archive);
    if (opened.is_error()) {
        return Err<ExtractionReport>(opened.error());
    }
    auto& a = opened.value();

    ExtractionRollback rollback;
    ExtractionReport report;
    std::set<fs::path> written_directories;
    std::vector<char> buffer(kReadBlockSize);

    while (true) {
        struct ::archive_entry* entry = nullptr;
        const int rc = ::archive_read_next_header(a.get(), &entry);
        if (rc == ARCHIVE_EOF) {
            break;
        }
        if (!header_usable(rc)) {
            return Err<ExtractionReport>(ErrorKind::CorruptArchive,
                archive.filename().string() + ": " + archive_message(a.get()));
        }

        const std::string name = trim_trailing_slashes(entry_name(entry));
        const fs::path destination = (target_directory / fs::path(name)).lexically_normal();
        const auto type = ::archive_entry_filetype(entry);

        if (is_same_file(destination, archive)) {
            return Err<ExtractionReport>(ErrorKind::CorruptArchive,
                archive.filename().string() + ": entry '" + name + "' would overwrite the archive");
        }

        if (type == AE_IFDIR) {
            if (auto res = create_parents(target_directory, destination / "x", rollback); res.is_error()) {
                return Err<ExtractionReport>(res.error());
            }
            continue;
        }
        if (type != AE_IFREG) {
            spdlog::warn("Skipping non-regular entry '{}' in {}", name, archive.filename().string());
            continue;
        }

        if (auto res = create_parents(target_directory, destination, rollback); res.is_error()) {
            return Err<ExtractionReport>(res.error());
        }

        std::error_code ec;
        const bool existed = fs::exists(destination, ec);
        fs::path temporary = destination;
        temporary += ".part";

        {
            std::ofstream output(temporary, std::ios::binary | std::ios::trunc);
            if (!output) {
                return Err<ExtractionReport>(ErrorKind::Io, "cannot create " + temporary.string());
            }
            rollback.created_file(temporary);

            while (true) {
                const la_ssize_t n = ::archive_read_data(a.get(), buffer.data(), buffer.size());
                if (n == 0) {
                    break;
                }
                if (n < 0) {
                    if (n == ARCHIVE_WARN) {
                        continue;
                    }
                    return Err<ExtractionReport>(ErrorKind::CorruptArchive,
                        archive.filename().string() + ": " + name + ": " + archive_message(a.get()));
                }
                output.write(buffer.data(), static_cast<std::streamsize>(n));
                if (!output) {
                    return Err<ExtractionReport>(ErrorKind::Io, "write failed for " + temporary.string());
                }
                report.bytes += static_cast<std::uint64_t>(n);
            }

            output.flush();
            if (!output) {
                return Err<ExtractionReport>(ErrorKind::Io, "flush failed for " + temporary.string());
            }
        }

        if (auto res = sync_file(temporary); res.is_error()) {
            return Err<ExtractionReport>(res.error());
        }
        fs::rename(temporary, destination, ec);
        if (ec) {
            return Err<ExtractionReport>(ErrorKind::Io,
                "cannot move " + temporary.string() + " into place: " + ec.message());
        }
        // An overwritten file from an earlier attempt is not ours to roll back
        if (!existed) {
            rollback.created_file(destination);
        }
        report.files.push_back(destination);
        written_directories.insert(destination.parent_path());
    }

    for (const auto& directory : written_directories) {
        if (auto res = sync_directory(directory); res.is_error()) {
            return Err<ExtractionReport>(res.error());
        }
    }
    rollback.commit();
    return Ok(std::move(report));
}

} // namespace mirror::fetch
