#include "mirror/core/durable_file.hpp"

#include <cerrno>
#include <cstring>
#include <string>

#include <fcntl.h>
#include <unistd.h>

namespace mirror {
namespace {

Result<void> sync_descriptor(const std::filesystem::path& path, int flags) {
    const int fd = ::open(path.c_str(), flags);
    if (fd < 0) {
        return Err<void>(ErrorKind::Io, "cannot open " + path.string() + ": " + std::strerror(errno));
    }
    const int rc = ::fsync(fd);
    const int sync_errno = errno;
    ::close(fd);
    if (rc != 0) {
        return Err<void>(ErrorKind::Io, "fsync failed for " + path.string() + ": " + std::strerror(sync_errno));
    }
    return Ok();
}

} // namespace

Result<void> sync_file(const std::filesystem::path& path) {
    return sync_descriptor(path, O_RDONLY);
}

Result<void> sync_directory(const std::filesystem::path& directory) {
    return sync_descriptor(directory.empty() ? std::filesystem::path(".") : directory, O_RDONLY | O_DIRECTORY);
}

} // namespace mirror
