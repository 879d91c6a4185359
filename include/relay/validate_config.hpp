#pragma once

#include "relay/config.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

namespace relay {

// ============================================================================
// Configuration and identifier validation
//
// Checks a RelayConfig before components are built from it, and validates
// client-chosen identifiers (subdomains) before they are admitted.
// ============================================================================

// Problems detected in a RelayConfig
enum class ConfigIssue : std::uint8_t {
    ChunkSizeZero,          // stream.max_chunk_bytes == 0
    ChunkSizeTooLarge,      // stream.max_chunk_bytes > kMaxChunkSize
    EndedTrackingZero,      // stream.max_ended_tracked == 0
    KeyEntropyTooLow,       // auth.key_random_bytes < kMinRandomBytes
    SessionEntropyTooLow,   // auth.session_random_bytes < kMinRandomBytes
    EmptyPublicDomain,      // tunnel.public_domain is empty
};

// Subdomain rules
// Format: ^[a-z0-9][a-z0-9-]{1,61}[a-z0-9]$
// - Lowercase letters, digits, hyphen
// - Must start and end with a letter or digit
// - Length: 3-63 characters
struct SubdomainRules {
    static constexpr std::size_t kMinLength = 3;
    static constexpr std::size_t kMaxLength = 63;
};

// Minimum entropy for generated credentials
inline constexpr std::size_t kMinRandomBytes = 16;

// Validate a full relay configuration.
// Returns the first issue found, or std::nullopt if the config is usable.
std::optional<ConfigIssue> validate_config(const RelayConfig& config) noexcept;

// Validate subdomain format.
// CPU: O(n) where n = subdomain.size(), bounded by kMaxLength
bool validate_subdomain_format(std::string_view subdomain) noexcept;

const char* to_string(ConfigIssue issue) noexcept;

}  // namespace relay
