#pragma once

#include "mirror/core/result.hpp"

#include <cstddef>
#include <functional>

namespace mirror {

/// Receives consecutive chunks of a transfer; an error stops the producer.
using ChunkSink = std::function<Result<void>(const char* data, std::size_t size)>;

/// Pushes a whole payload into the sink it is given, chunk by chunk.
using ByteStream = std::function<Result<void>(const ChunkSink& sink)>;

} // namespace mirror
