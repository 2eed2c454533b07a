#pragma once

#include "mirror/core/byte_stream.hpp"
#include "mirror/core/result.hpp"

#include <string>

namespace mirror::net {

/**
 * @brief Transport used by the crawler and the fetch workers
 *
 * Implementations must be callable from several worker threads at once.
 * Failures are reported as ErrorKind::Transfer (or Cancelled when aborted).
 */
class RemoteSource {
public:
    virtual ~RemoteSource() = default;

    /// Download a whole listing page.
    virtual Result<std::string> fetch_text(const std::string& url) = 0;

    /// Stream the body of @p url into @p sink; an error from the sink aborts the transfer.
    virtual Result<void> stream(const std::string& url, const ChunkSink& sink) = 0;
};

} // namespace mirror::net
