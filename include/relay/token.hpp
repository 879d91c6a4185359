#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace relay {

// ============================================================================
// Credential generation
//
// All randomness comes from the OpenSSL CSPRNG. Every function throws
// std::runtime_error if the generator cannot produce bytes.
// ============================================================================

std::vector<unsigned char> random_bytes(std::size_t size);

// Lowercase hex of `size` random bytes (2 * size characters)
std::string random_hex(std::size_t size);

// `length` characters drawn uniformly from [a-z0-9]
std::string random_alnum(std::size_t length);

}  // namespace relay
