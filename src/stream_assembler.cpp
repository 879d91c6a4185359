#include "relay/stream_assembler.hpp"

#include "relay/base64.hpp"

#include <utility>

namespace relay {

StreamAssembler::StreamAssembler(StreamConfig config)
    : config_(config) {}

std::optional<StreamViolation> StreamAssembler::open(const std::string& request_id,
                                                     std::int64_t status_code,
                                                     Headers headers) {
    if (open_.contains(request_id)) {
        end_stream(request_id);
        return violation(StreamViolation::DuplicateStream);
    }

    // Reuse of a completed id starts a fresh stream
    forget_ended(request_id);
    open_.emplace(request_id, OpenStream{
        .status_code = status_code,
        .headers = std::move(headers),
        .body = {},
    });
    ++streams_opened_;
    return std::nullopt;
}

std::optional<StreamViolation> StreamAssembler::accept_chunk(const std::string& request_id,
                                                             std::uint64_t index,
                                                             std::string_view chunk) {
    auto it = open_.find(request_id);
    if (it == open_.end()) {
        return violation(not_open_violation(request_id));
    }

    OpenStream& stream = it->second;
    if (index != stream.next_index) {
        StreamViolation v = index > stream.next_index
            ? StreamViolation::IndexGap
            : StreamViolation::DuplicateIndex;
        end_stream(request_id);
        return violation(v);
    }

    auto decoded = base64::decode(chunk);
    if (!decoded) {
        end_stream(request_id);
        return violation(StreamViolation::InvalidChunkEncoding);
    }

    stream.body.insert(stream.body.end(), decoded->begin(), decoded->end());
    ++stream.next_index;
    return std::nullopt;
}

FinishResult StreamAssembler::finish(const std::string& request_id) {
    auto it = open_.find(request_id);
    if (it == open_.end()) {
        return violation(not_open_violation(request_id));
    }

    AssembledResponse response{
        .request_id = request_id,
        .status_code = it->second.status_code,
        .headers = std::move(it->second.headers),
        .body = std::move(it->second.body),
        .chunk_count = it->second.next_index,
    };
    end_stream(request_id);
    ++streams_completed_;
    return response;
}

bool StreamAssembler::abort(const std::string& request_id) {
    if (!open_.contains(request_id)) {
        return false;
    }
    end_stream(request_id);
    return true;
}

bool StreamAssembler::is_open(const std::string& request_id) const {
    return open_.contains(request_id);
}

bool StreamAssembler::is_ended(const std::string& request_id) const {
    return ended_.contains(request_id);
}

void StreamAssembler::end_stream(const std::string& request_id) {
    open_.erase(request_id);
    remember_ended(request_id);
}

void StreamAssembler::remember_ended(const std::string& request_id) {
    auto it = ended_.find(request_id);
    if (it != ended_.end()) {
        // Already tracked: move to front of LRU
        ended_list_.erase(it->second);
        ended_list_.push_front(request_id);
        it->second = ended_list_.begin();
        return;
    }

    if (ended_.size() >= config_.max_ended_tracked && !ended_list_.empty()) {
        // Evict least recently ended (back of list)
        ended_.erase(ended_list_.back());
        ended_list_.pop_back();
    }
    ended_list_.push_front(request_id);
    ended_.emplace(request_id, ended_list_.begin());
}

void StreamAssembler::forget_ended(const std::string& request_id) {
    auto it = ended_.find(request_id);
    if (it == ended_.end()) {
        return;
    }
    ended_list_.erase(it->second);
    ended_.erase(it);
}

StreamViolation StreamAssembler::not_open_violation(const std::string& request_id) const {
    return ended_.contains(request_id)
        ? StreamViolation::AlreadyEnded
        : StreamViolation::UnknownRequest;
}

Envelope make_violation_error(const std::string& request_id, StreamViolation violation) {
    return make_http_error(request_id,
                           std::string("Protocol violation: ") + to_string(violation),
                           "PROTOCOL_VIOLATION",
                           502);
}

const char* to_string(StreamViolation violation) noexcept {
    switch (violation) {
        case StreamViolation::DuplicateStream:      return "duplicate stream";
        case StreamViolation::IndexGap:             return "chunk index gap";
        case StreamViolation::DuplicateIndex:       return "duplicate chunk index";
        case StreamViolation::UnknownRequest:       return "unknown request";
        case StreamViolation::AlreadyEnded:         return "stream already ended";
        case StreamViolation::InvalidChunkEncoding: return "invalid chunk encoding";
    }
    return "unknown";
}

}  // namespace relay
