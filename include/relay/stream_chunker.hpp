#pragma once

#include "relay/config.hpp"
#include "relay/message.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace relay {

// One bounded fragment of a payload. `bytes` borrows from the payload.
struct Chunk {
    std::span<const std::byte> bytes;
    std::uint64_t index;
};

// ============================================================================
// StreamChunker
//
// Splits a borrowed payload into consecutive chunks of at most chunk_size
// bytes, produced on demand.
//
// Invariants:
// - Indices start at 0 and increase by 1, no gaps
// - Every chunk except the last has exactly chunk_size bytes
// - Concatenating the chunks in order reproduces the payload
// - An empty payload yields no chunks
//
// The payload must outlive the chunker and every Chunk it returns.
//
// Thread safety: NOT thread-safe. External synchronization required.
// ============================================================================
class StreamChunker {
public:
    // Throws std::invalid_argument if chunk_size == 0
    explicit StreamChunker(std::span<const std::byte> payload,
                           std::size_t chunk_size = kMaxChunkSize);

    // Next chunk, or std::nullopt once the payload is exhausted
    std::optional<Chunk> next() noexcept;

    // Restart from the first chunk
    void reset() noexcept { offset_ = 0; index_ = 0; }

    // ceil(payload.size() / chunk_size)
    [[nodiscard]] std::uint64_t chunk_count() const noexcept;

    [[nodiscard]] bool exhausted() const noexcept { return offset_ >= payload_.size(); }

private:
    std::span<const std::byte> payload_;
    std::size_t chunk_size_;
    std::size_t offset_ = 0;
    std::uint64_t index_ = 0;
};

// Push form: invokes fn for every chunk in order.
// Throws std::invalid_argument if chunk_size == 0
void for_each_chunk(std::span<const std::byte> payload,
                    std::size_t chunk_size,
                    const std::function<void(const Chunk&)>& fn);

// Complete streaming tail for a response body: one http:response:chunk per
// chunk followed by http:response:end. The streaming header is not included.
// Throws std::invalid_argument if chunk_size == 0
std::vector<Envelope> make_chunk_messages(const std::string& request_id,
                                          std::span<const std::byte> payload,
                                          std::size_t chunk_size = kMaxChunkSize);

}  // namespace relay
