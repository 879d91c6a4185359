#include "relay/base64.hpp"

#include <openssl/evp.h>

#include <algorithm>
#include <cstdint>

namespace relay::base64 {

namespace {

// EVP_*Block take int lengths; work in bounded blocks.
// Encode block is a multiple of 3, decode block a multiple of 4.
constexpr std::size_t kEncodeBlock = 3 * 16384;
constexpr std::size_t kDecodeBlock = 4 * 16384;

bool is_space(char c) noexcept {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r';
}

bool is_alphabet(char c) noexcept {
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
           (c >= '0' && c <= '9') || c == '+' || c == '/';
}

}  // namespace

std::string encode(std::span<const std::byte> data) {
    std::string out;
    out.reserve(((data.size() + 2) / 3) * 4);

    // +1 for the NUL terminator EVP_EncodeBlock writes
    std::vector<unsigned char> buf(((kEncodeBlock + 2) / 3) * 4 + 1);

    std::size_t offset = 0;
    while (offset < data.size()) {
        const std::size_t n = std::min(kEncodeBlock, data.size() - offset);
        const int written = EVP_EncodeBlock(
            buf.data(),
            reinterpret_cast<const unsigned char*>(data.data() + offset),
            static_cast<int>(n));
        out.append(reinterpret_cast<const char*>(buf.data()), static_cast<std::size_t>(written));
        offset += n;
    }
    return out;
}

std::optional<std::vector<std::byte>> decode(std::string_view input) {
    // Trim surrounding whitespace
    while (!input.empty() && is_space(input.front())) {
        input.remove_prefix(1);
    }
    while (!input.empty() && is_space(input.back())) {
        input.remove_suffix(1);
    }

    if (input.empty()) {
        return std::vector<std::byte>{};
    }
    if (input.size() % 4 != 0) {
        return std::nullopt;
    }

    // Padding: at most two '=' and only at the very end
    std::size_t padding = 0;
    if (input.back() == '=') {
        ++padding;
        if (input[input.size() - 2] == '=') {
            ++padding;
        }
    }
    for (std::size_t i = 0; i < input.size() - padding; ++i) {
        if (!is_alphabet(input[i])) {
            return std::nullopt;
        }
    }

    std::vector<std::byte> out((input.size() / 4) * 3);
    std::size_t produced = 0;
    std::size_t offset = 0;
    while (offset < input.size()) {
        const std::size_t n = std::min(kDecodeBlock, input.size() - offset);
        const int written = EVP_DecodeBlock(
            reinterpret_cast<unsigned char*>(out.data() + produced),
            reinterpret_cast<const unsigned char*>(input.data() + offset),
            static_cast<int>(n));
        if (written < 0) {
            return std::nullopt;
        }
        produced += static_cast<std::size_t>(written);
        offset += n;
    }

    // EVP_DecodeBlock counts padding as zero bytes
    out.resize(produced - padding);
    return out;
}

}  // namespace relay::base64
