#include "relay/stream_chunker.hpp"

#include "relay/message_codec.hpp"

#include <algorithm>  // std::min
#include <stdexcept>

namespace relay {

namespace {

std::size_t checked_chunk_size(std::size_t chunk_size) {
    if (chunk_size == 0) {
        throw std::invalid_argument("chunk size must be greater than zero");
    }
    return chunk_size;
}

}  // namespace

StreamChunker::StreamChunker(std::span<const std::byte> payload, std::size_t chunk_size)
    : payload_(payload)
    , chunk_size_(checked_chunk_size(chunk_size)) {}

std::optional<Chunk> StreamChunker::next() noexcept {
    if (exhausted()) {
        return std::nullopt;
    }
    const std::size_t n = std::min(chunk_size_, payload_.size() - offset_);
    Chunk chunk{
        .bytes = payload_.subspan(offset_, n),
        .index = index_,
    };
    offset_ += n;
    ++index_;
    return chunk;
}

std::uint64_t StreamChunker::chunk_count() const noexcept {
    return (payload_.size() + chunk_size_ - 1) / chunk_size_;
}

void for_each_chunk(std::span<const std::byte> payload,
                    std::size_t chunk_size,
                    const std::function<void(const Chunk&)>& fn) {
    StreamChunker chunker(payload, chunk_size);
    while (auto chunk = chunker.next()) {
        fn(*chunk);
    }
}

std::vector<Envelope> make_chunk_messages(const std::string& request_id,
                                          std::span<const std::byte> payload,
                                          std::size_t chunk_size) {
    StreamChunker chunker(payload, chunk_size);

    std::vector<Envelope> out;
    out.reserve(static_cast<std::size_t>(chunker.chunk_count()) + 1);
    while (auto chunk = chunker.next()) {
        out.push_back(make_http_response_chunk(request_id, chunk->bytes, chunk->index));
    }
    out.push_back(make_http_response_end(request_id));
    return out;
}

}  // namespace relay
