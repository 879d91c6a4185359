#include "relay/base64.hpp"
#include "relay/stream_chunker.hpp"

#include <cstdio>
#include <cstdlib>
#include <stdexcept>
#include <vector>

namespace {

std::vector<std::byte> make_payload(std::size_t size) {
    std::vector<std::byte> data(size);
    for (std::size_t i = 0; i < size; ++i) {
        data[i] = static_cast<std::byte>((i * 7 + 3) & 0xFF);
    }
    return data;
}

// Concatenation in index order reproduces the payload; sizes and indices
// follow the chunking contract.
bool check_chunking(std::size_t payload_size, std::size_t chunk_size) {
    auto payload = make_payload(payload_size);
    relay::StreamChunker chunker(payload, chunk_size);

    std::uint64_t expected_count = (payload_size + chunk_size - 1) / chunk_size;
    if (chunker.chunk_count() != expected_count) {
        std::printf("  count %llu != %llu (payload %zu, chunk %zu)\n",
                    static_cast<unsigned long long>(chunker.chunk_count()),
                    static_cast<unsigned long long>(expected_count),
                    payload_size, chunk_size);
        return false;
    }

    std::vector<std::byte> joined;
    std::uint64_t expected_index = 0;
    while (auto chunk = chunker.next()) {
        if (chunk->index != expected_index) {
            std::printf("  index %llu, expected %llu\n",
                        static_cast<unsigned long long>(chunk->index),
                        static_cast<unsigned long long>(expected_index));
            return false;
        }
        bool last = chunk->index + 1 == expected_count;
        if (!last && chunk->bytes.size() != chunk_size) {
            std::printf("  non-final chunk %llu has %zu bytes\n",
                        static_cast<unsigned long long>(chunk->index), chunk->bytes.size());
            return false;
        }
        if (chunk->bytes.empty() || chunk->bytes.size() > chunk_size) {
            std::printf("  chunk %llu has bad size %zu\n",
                        static_cast<unsigned long long>(chunk->index), chunk->bytes.size());
            return false;
        }
        joined.insert(joined.end(), chunk->bytes.begin(), chunk->bytes.end());
        ++expected_index;
    }

    if (expected_index != expected_count || !chunker.exhausted()) {
        std::printf("  produced %llu chunks\n", static_cast<unsigned long long>(expected_index));
        return false;
    }
    return joined == payload;
}

bool test_chunking_law() {
    struct Case {
        std::size_t payload;
        std::size_t chunk;
    };
    const Case cases[] = {
        {1, 1},
        {10, 3},
        {9, 3},
        {100, 1000},
        {relay::kMaxChunkSize, relay::kMaxChunkSize},
        {relay::kMaxChunkSize + 1, relay::kMaxChunkSize},
        {3 * relay::kMaxChunkSize - 17, relay::kMaxChunkSize},
    };
    for (const auto& c : cases) {
        if (!check_chunking(c.payload, c.chunk)) {
            std::printf("  case payload=%zu chunk=%zu\n", c.payload, c.chunk);
            return false;
        }
    }
    return true;
}

bool test_empty_payload() {
    std::vector<std::byte> empty;
    relay::StreamChunker chunker(empty, 16);
    return chunker.chunk_count() == 0 && chunker.exhausted() && !chunker.next();
}

bool test_final_chunk_size() {
    auto payload = make_payload(10);
    relay::StreamChunker chunker(payload, 4);
    std::vector<std::size_t> sizes;
    while (auto chunk = chunker.next()) {
        sizes.push_back(chunk->bytes.size());
    }
    return sizes == std::vector<std::size_t>{4, 4, 2};
}

bool test_reset_restarts() {
    auto payload = make_payload(5);
    relay::StreamChunker chunker(payload, 2);
    while (chunker.next()) {
    }
    if (!chunker.exhausted()) {
        return false;
    }
    chunker.reset();
    auto first = chunker.next();
    return first && first->index == 0 && first->bytes.size() == 2 &&
           first->bytes.data() == payload.data();
}

bool test_zero_chunk_size_throws() {
    auto payload = make_payload(4);
    try {
        relay::StreamChunker chunker(payload, 0);
        return false;
    } catch (const std::invalid_argument&) {
    }
    try {
        relay::for_each_chunk(payload, 0, [](const relay::Chunk&) {});
        return false;
    } catch (const std::invalid_argument&) {
    }
    return true;
}

bool test_for_each_chunk() {
    auto payload = make_payload(7);
    std::vector<std::uint64_t> indices;
    std::size_t total = 0;
    relay::for_each_chunk(payload, 3, [&](const relay::Chunk& chunk) {
        indices.push_back(chunk.index);
        total += chunk.bytes.size();
    });
    return indices == std::vector<std::uint64_t>{0, 1, 2} && total == 7;
}

bool test_chunk_messages() {
    auto payload = make_payload(10);
    auto messages = relay::make_chunk_messages("req-7", payload, 4);
    if (messages.size() != 4) {
        std::printf("  expected 3 chunks + end, got %zu\n", messages.size());
        return false;
    }

    std::vector<std::byte> joined;
    for (std::size_t i = 0; i < 3; ++i) {
        const auto* chunk = messages[i].get_if<relay::HttpResponseChunk>();
        if (chunk == nullptr || chunk->request_id != "req-7" || chunk->index != i) {
            std::printf("  message %zu is not chunk %zu\n", i, i);
            return false;
        }
        auto bytes = relay::base64::decode(chunk->chunk);
        if (!bytes) {
            return false;
        }
        joined.insert(joined.end(), bytes->begin(), bytes->end());
    }

    const auto* end = messages[3].get_if<relay::HttpResponseEnd>();
    if (end == nullptr || end->request_id != "req-7") {
        std::printf("  last message is not the end marker\n");
        return false;
    }
    return joined == payload;
}

bool test_chunk_messages_empty_payload() {
    std::vector<std::byte> empty;
    auto messages = relay::make_chunk_messages("req-0", empty);
    return messages.size() == 1 && messages[0].get_if<relay::HttpResponseEnd>() != nullptr;
}

} // namespace

int main() {
    if (!test_chunking_law()) {
        std::printf("test_chunking_law failed\n");
        return EXIT_FAILURE;
    }

    if (!test_empty_payload()) {
        std::printf("test_empty_payload failed\n");
        return EXIT_FAILURE;
    }

    if (!test_final_chunk_size()) {
        std::printf("test_final_chunk_size failed\n");
        return EXIT_FAILURE;
    }

    if (!test_reset_restarts()) {
        std::printf("test_reset_restarts failed\n");
        return EXIT_FAILURE;
    }

    if (!test_zero_chunk_size_throws()) {
        std::printf("test_zero_chunk_size_throws failed\n");
        return EXIT_FAILURE;
    }

    if (!test_for_each_chunk()) {
        std::printf("test_for_each_chunk failed\n");
        return EXIT_FAILURE;
    }

    if (!test_chunk_messages()) {
        std::printf("test_chunk_messages failed\n");
        return EXIT_FAILURE;
    }

    if (!test_chunk_messages_empty_payload()) {
        std::printf("test_chunk_messages_empty_payload failed\n");
        return EXIT_FAILURE;
    }

    std::printf("All stream_chunker tests passed\n");
    return EXIT_SUCCESS;
}
