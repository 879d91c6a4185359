#include "relay/base64.hpp"
#include "relay/message_codec.hpp"
#include "relay/stream_assembler.hpp"
#include "relay/stream_chunker.hpp"

#include <cstdio>
#include <cstdlib>
#include <string>
#include <variant>
#include <vector>

namespace {

std::string encode(std::string_view text) {
    return relay::base64::encode(relay::bytes_of(text));
}

bool is_violation(const std::optional<relay::StreamViolation>& r, relay::StreamViolation expected) {
    if (!r) {
        std::printf("  expected violation '%s', got none\n", relay::to_string(expected));
        return false;
    }
    if (*r != expected) {
        std::printf("  expected '%s', got '%s'\n", relay::to_string(expected), relay::to_string(*r));
        return false;
    }
    return true;
}

bool finish_is_violation(const relay::FinishResult& r, relay::StreamViolation expected) {
    const auto* v = std::get_if<relay::StreamViolation>(&r);
    return v != nullptr && *v == expected;
}

bool test_assembles_in_order() {
    relay::StreamAssembler assembler;
    if (assembler.open("r1", 200, {{"content-type", "text/plain"}})) {
        return false;
    }
    if (assembler.accept_chunk("r1", 0, encode("hello ")) ||
        assembler.accept_chunk("r1", 1, encode("streaming ")) ||
        assembler.accept_chunk("r1", 2, encode("world"))) {
        return false;
    }

    auto result = assembler.finish("r1");
    const auto* response = std::get_if<relay::AssembledResponse>(&result);
    if (response == nullptr) {
        return false;
    }
    std::string body(reinterpret_cast<const char*>(response->body.data()), response->body.size());
    return body == "hello streaming world" &&
           response->status_code == 200 &&
           response->chunk_count == 3 &&
           response->headers.at("content-type") == "text/plain" &&
           assembler.open_count() == 0 &&
           assembler.streams_opened() == 1 &&
           assembler.streams_completed() == 1 &&
           assembler.violations() == 0;
}

// End-to-end with the chunker and the codec
bool test_chunker_round_trip() {
    std::vector<std::byte> payload(200000);
    for (std::size_t i = 0; i < payload.size(); ++i) {
        payload[i] = static_cast<std::byte>(i % 251);
    }

    relay::StreamAssembler assembler;
    if (assembler.open("big", 200, {})) {
        return false;
    }
    for (const auto& message : relay::make_chunk_messages("big", payload)) {
        auto parsed = relay::parse_message(relay::serialize_message(message));
        if (!parsed) {
            return false;
        }
        if (const auto* chunk = parsed->get_if<relay::HttpResponseChunk>()) {
            if (assembler.accept_chunk(chunk->request_id, chunk->index, chunk->chunk)) {
                return false;
            }
        } else if (const auto* end = parsed->get_if<relay::HttpResponseEnd>()) {
            auto result = assembler.finish(end->request_id);
            const auto* response = std::get_if<relay::AssembledResponse>(&result);
            return response != nullptr && response->body == payload && response->chunk_count == 4;
        }
    }
    return false;
}

bool test_empty_stream() {
    relay::StreamAssembler assembler;
    if (assembler.open("r0", 204, {})) {
        return false;
    }
    auto result = assembler.finish("r0");
    const auto* response = std::get_if<relay::AssembledResponse>(&result);
    return response != nullptr && response->body.empty() && response->chunk_count == 0;
}

// Receivers are permissive on chunk size: a chunk above the sender bound
// is accepted as long as its index is the next one.
bool test_oversized_chunk_accepted() {
    std::vector<std::byte> payload(relay::kMaxChunkSize + 1);
    for (std::size_t i = 0; i < payload.size(); ++i) {
        payload[i] = static_cast<std::byte>(i % 253);
    }

    relay::StreamAssembler assembler;
    if (assembler.open("wide", 200, {})) {
        return false;
    }
    auto parsed = relay::parse_message(
        relay::serialize_message(relay::make_http_response_chunk("wide", payload, 0)));
    const auto* chunk = parsed ? parsed->get_if<relay::HttpResponseChunk>() : nullptr;
    if (chunk == nullptr) {
        return false;
    }
    if (auto v = assembler.accept_chunk(chunk->request_id, chunk->index, chunk->chunk)) {
        std::printf("  unexpected violation '%s'\n", relay::to_string(*v));
        return false;
    }

    auto result = assembler.finish("wide");
    const auto* response = std::get_if<relay::AssembledResponse>(&result);
    return response != nullptr &&
           response->body == payload &&
           response->chunk_count == 1 &&
           assembler.violations() == 0;
}

bool test_index_gap() {
    relay::StreamAssembler assembler;
    assembler.open("r1", 200, {});
    if (assembler.accept_chunk("r1", 0, encode("a"))) {
        return false;
    }
    if (!is_violation(assembler.accept_chunk("r1", 2, encode("c")), relay::StreamViolation::IndexGap)) {
        return false;
    }
    // The stream is ended: later chunks and the end marker are rejected
    if (!is_violation(assembler.accept_chunk("r1", 1, encode("b")), relay::StreamViolation::AlreadyEnded)) {
        return false;
    }
    return finish_is_violation(assembler.finish("r1"), relay::StreamViolation::AlreadyEnded) &&
           assembler.violations() == 3 &&
           assembler.streams_completed() == 0;
}

bool test_duplicate_index() {
    relay::StreamAssembler assembler;
    assembler.open("r1", 200, {});
    assembler.accept_chunk("r1", 0, encode("a"));
    assembler.accept_chunk("r1", 1, encode("b"));
    return is_violation(assembler.accept_chunk("r1", 1, encode("b")),
                        relay::StreamViolation::DuplicateIndex) &&
           !assembler.is_open("r1");
}

bool test_unknown_request() {
    relay::StreamAssembler assembler;
    return is_violation(assembler.accept_chunk("ghost", 0, encode("a")),
                        relay::StreamViolation::UnknownRequest) &&
           finish_is_violation(assembler.finish("ghost"), relay::StreamViolation::UnknownRequest);
}

bool test_chunk_after_end() {
    relay::StreamAssembler assembler;
    assembler.open("r1", 200, {});
    assembler.accept_chunk("r1", 0, encode("a"));
    if (!std::holds_alternative<relay::AssembledResponse>(assembler.finish("r1"))) {
        return false;
    }
    return is_violation(assembler.accept_chunk("r1", 1, encode("b")),
                        relay::StreamViolation::AlreadyEnded) &&
           finish_is_violation(assembler.finish("r1"), relay::StreamViolation::AlreadyEnded);
}

bool test_duplicate_stream() {
    relay::StreamAssembler assembler;
    assembler.open("r1", 200, {});
    return is_violation(assembler.open("r1", 200, {}), relay::StreamViolation::DuplicateStream) &&
           !assembler.is_open("r1") &&
           assembler.is_ended("r1");
}

bool test_invalid_chunk_encoding() {
    relay::StreamAssembler assembler;
    assembler.open("r1", 200, {});
    return is_violation(assembler.accept_chunk("r1", 0, "%%%"),
                        relay::StreamViolation::InvalidChunkEncoding) &&
           !assembler.is_open("r1");
}

bool test_reopen_after_end() {
    relay::StreamAssembler assembler;
    assembler.open("r1", 200, {});
    assembler.finish("r1");
    if (assembler.open("r1", 201, {})) {
        return false;
    }
    if (assembler.accept_chunk("r1", 0, encode("again"))) {
        return false;
    }
    auto result = assembler.finish("r1");
    const auto* response = std::get_if<relay::AssembledResponse>(&result);
    return response != nullptr && response->status_code == 201 && response->body.size() == 5;
}

bool test_abort() {
    relay::StreamAssembler assembler;
    assembler.open("r1", 200, {});
    assembler.accept_chunk("r1", 0, encode("partial"));
    if (!assembler.abort("r1") || assembler.abort("r1")) {
        return false;
    }
    return is_violation(assembler.accept_chunk("r1", 1, encode("x")),
                        relay::StreamViolation::AlreadyEnded) &&
           assembler.open_count() == 0;
}

bool test_ended_tracking_is_bounded() {
    relay::StreamAssembler assembler(relay::StreamConfig{.max_chunk_bytes = 16, .max_ended_tracked = 3});
    for (int i = 0; i < 5; ++i) {
        std::string id = "r" + std::to_string(i);
        assembler.open(id, 200, {});
        assembler.finish(id);
    }
    if (assembler.ended_tracked() != 3) {
        std::printf("  tracked %zu ended ids\n", assembler.ended_tracked());
        return false;
    }
    // Oldest ids fell out of the LRU and are unknown again
    return is_violation(assembler.accept_chunk("r0", 0, encode("x")), relay::StreamViolation::UnknownRequest) &&
           is_violation(assembler.accept_chunk("r4", 0, encode("x")), relay::StreamViolation::AlreadyEnded);
}

bool test_violation_error_message() {
    auto envelope = relay::make_violation_error("r1", relay::StreamViolation::IndexGap);
    const auto* error = envelope.get_if<relay::HttpError>();
    return error != nullptr &&
           error->request_id == "r1" &&
           error->code == "PROTOCOL_VIOLATION" &&
           error->status_code == 502 &&
           error->error.find(relay::to_string(relay::StreamViolation::IndexGap)) != std::string::npos;
}

} // namespace

int main() {
    if (!test_assembles_in_order()) {
        std::printf("test_assembles_in_order failed\n");
        return EXIT_FAILURE;
    }

    if (!test_chunker_round_trip()) {
        std::printf("test_chunker_round_trip failed\n");
        return EXIT_FAILURE;
    }

    if (!test_empty_stream()) {
        std::printf("test_empty_stream failed\n");
        return EXIT_FAILURE;
    }

    if (!test_oversized_chunk_accepted()) {
        std::printf("test_oversized_chunk_accepted failed\n");
        return EXIT_FAILURE;
    }

    if (!test_index_gap()) {
        std::printf("test_index_gap failed\n");
        return EXIT_FAILURE;
    }

    if (!test_duplicate_index()) {
        std::printf("test_duplicate_index failed\n");
        return EXIT_FAILURE;
    }

    if (!test_unknown_request()) {
        std::printf("test_unknown_request failed\n");
        return EXIT_FAILURE;
    }

    if (!test_chunk_after_end()) {
        std::printf("test_chunk_after_end failed\n");
        return EXIT_FAILURE;
    }

    if (!test_duplicate_stream()) {
        std::printf("test_duplicate_stream failed\n");
        return EXIT_FAILURE;
    }

    if (!test_invalid_chunk_encoding()) {
        std::printf("test_invalid_chunk_encoding failed\n");
        return EXIT_FAILURE;
    }

    if (!test_reopen_after_end()) {
        std::printf("test_reopen_after_end failed\n");
        return EXIT_FAILURE;
    }

    if (!test_abort()) {
        std::printf("test_abort failed\n");
        return EXIT_FAILURE;
    }

    if (!test_ended_tracking_is_bounded()) {
        std::printf("test_ended_tracking_is_bounded failed\n");
        return EXIT_FAILURE;
    }

    if (!test_violation_error_message()) {
        std::printf("test_violation_error_message failed\n");
        return EXIT_FAILURE;
    }

    std::printf("All stream_assembler tests passed\n");
    return EXIT_SUCCESS;
}
