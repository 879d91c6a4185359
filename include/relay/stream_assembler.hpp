#pragma once

#include "relay/config.hpp"
#include "relay/message.hpp"
#include "relay/message_codec.hpp"

#include <cstddef>
#include <cstdint>
#include <list>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <variant>

namespace relay {

// Why a streaming message was rejected
enum class StreamViolation : std::uint8_t {
    DuplicateStream,        // header for a request id that is already open
    IndexGap,               // chunk index ahead of the next expected index
    DuplicateIndex,         // chunk index behind the next expected index
    UnknownRequest,         // no stream was ever opened (or it was forgotten)
    AlreadyEnded,           // stream recently finished, aborted or violated
    InvalidChunkEncoding,   // chunk text is not valid base64
};

// A fully received streaming response
struct AssembledResponse {
    std::string request_id;
    std::int64_t status_code = 0;
    Headers headers;
    Bytes body;
    std::uint64_t chunk_count = 0;
};

using FinishResult = std::variant<AssembledResponse, StreamViolation>;

// Receiver side of a streamed response.
//
// Per request id: unopened -> open (header) -> ended (end, abort, violation).
// Chunks must arrive with contiguous indices starting at 0. Chunk sizes are
// not checked against the sender bound.
//
// Invariants enforced:
// - A violation ends the stream and discards its buffered bytes
// - Ended ids are remembered in an LRU bounded by max_ended_tracked
// - An ended id may be reopened by a new header
//
// Thread safety: NOT thread-safe. External synchronization required.
class StreamAssembler {
public:
    explicit StreamAssembler(StreamConfig config = {});

    // Begin a stream after its header message.
    std::optional<StreamViolation> open(const std::string& request_id,
                                        std::int64_t status_code,
                                        Headers headers);

    // Append one base64 chunk. Returns the violation if it was rejected.
    std::optional<StreamViolation> accept_chunk(const std::string& request_id,
                                                std::uint64_t index,
                                                std::string_view chunk);

    // Complete a stream on its end message.
    FinishResult finish(const std::string& request_id);

    // Discard an open stream (timeout, transport loss).
    // Returns false if the id was not open.
    bool abort(const std::string& request_id);

    [[nodiscard]] bool is_open(const std::string& request_id) const;
    [[nodiscard]] bool is_ended(const std::string& request_id) const;
    [[nodiscard]] std::size_t open_count() const noexcept { return open_.size(); }
    [[nodiscard]] std::size_t ended_tracked() const noexcept { return ended_.size(); }

    // Metrics
    [[nodiscard]] std::uint64_t streams_opened() const noexcept { return streams_opened_; }
    [[nodiscard]] std::uint64_t streams_completed() const noexcept { return streams_completed_; }
    [[nodiscard]] std::uint64_t violations() const noexcept { return violations_; }

private:
    struct OpenStream {
        std::int64_t status_code;
        Headers headers;
        Bytes body;
        std::uint64_t next_index = 0;
    };

    // LRU list stores ended ids in end order (most recent at front)
    using EndedList = std::list<std::string>;
    using EndedMap = std::unordered_map<std::string, EndedList::iterator>;

    // Drop an open stream and remember it as ended
    void end_stream(const std::string& request_id);
    void remember_ended(const std::string& request_id);
    void forget_ended(const std::string& request_id);

    // Classify an id that is not open
    StreamViolation not_open_violation(const std::string& request_id) const;

    StreamViolation violation(StreamViolation v) noexcept {
        ++violations_;
        return v;
    }

    StreamConfig config_;
    std::unordered_map<std::string, OpenStream> open_;
    EndedList ended_list_;
    EndedMap ended_;

    // Metrics
    std::uint64_t streams_opened_ = 0;
    std::uint64_t streams_completed_ = 0;
    std::uint64_t violations_ = 0;
};

// HTTP_ERROR envelope reporting a violation to the other side
// (code PROTOCOL_VIOLATION, status 502).
Envelope make_violation_error(const std::string& request_id, StreamViolation violation);

const char* to_string(StreamViolation violation) noexcept;

}  // namespace relay
