#include "relay/token.hpp"

#include <openssl/rand.h>

#include <stdexcept>
#include <string_view>

namespace relay {

namespace {

constexpr std::string_view kHexDigits = "0123456789abcdef";
constexpr std::string_view kAlnum = "abcdefghijklmnopqrstuvwxyz0123456789";

// Largest multiple of kAlnum.size() that fits in a byte; bytes at or above
// it are rejected so every character is equally likely.
constexpr unsigned kAlnumLimit = 256 - (256 % kAlnum.size());

}  // namespace

std::vector<unsigned char> random_bytes(std::size_t size) {
    std::vector<unsigned char> out(size);
    if (size == 0) {
        return out;
    }
    if (RAND_bytes(out.data(), static_cast<int>(out.size())) != 1) {
        throw std::runtime_error("RAND_bytes failed");
    }
    return out;
}

std::string random_hex(std::size_t size) {
    std::vector<unsigned char> bytes = random_bytes(size);
    std::string out;
    out.reserve(size * 2);
    for (unsigned char b : bytes) {
        out.push_back(kHexDigits[b >> 4]);
        out.push_back(kHexDigits[b & 0x0F]);
    }
    return out;
}

std::string random_alnum(std::size_t length) {
    std::string out;
    out.reserve(length);
    while (out.size() < length) {
        // Draw with headroom for rejected bytes
        std::vector<unsigned char> bytes = random_bytes(length - out.size() + 8);
        for (unsigned char b : bytes) {
            if (b >= kAlnumLimit) {
                continue;
            }
            out.push_back(kAlnum[b % kAlnum.size()]);
            if (out.size() == length) {
                break;
            }
        }
    }
    return out;
}

}  // namespace relay
