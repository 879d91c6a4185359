#pragma once

#include <cstddef>
#include <cstdint>
#include <limits>
#include <string_view>

namespace relay {

// Maximum size of a single streamed response chunk (64KB).
// Both ends send at most this much per chunk; receivers stay permissive.
inline constexpr std::size_t kMaxChunkSize = 64 * 1024;

// Codec bounds (compile-time constants for bounded parsing)
// The input bound is opt-in: the codec itself accepts any frame it can
// produce, transports that cap frame size pass kMaxInputBytes.
struct CodecLimits {
    static constexpr std::size_t kUnboundedInput = std::numeric_limits<std::size_t>::max();
    static constexpr std::size_t kMaxInputBytes = 16 * 1024 * 1024;  // 16MB per frame
    static constexpr std::size_t kMaxNestingDepth = 16;
};

// Streaming configuration
// Controls chunk sizing and bounded receiver state
struct StreamConfig {
    std::size_t max_chunk_bytes = kMaxChunkSize;  // chunk size used by senders
    std::size_t max_ended_tracked = 1024;         // LRU of recently ended request ids
};

// Credential configuration
// Controls token entropy and per-key defaults
struct AuthConfig {
    std::size_t key_random_bytes = 32;       // API key entropy (hex-encoded)
    std::size_t session_random_bytes = 32;   // session token entropy (hex-encoded)
    std::uint32_t default_rate_limit = 60;   // requests/min, informational only
    std::uint32_t dev_rate_limit = 100;      // bootstrap key rate limit
};

// Tunnel admission configuration
// Controls how public URLs are built for registered tunnels
struct TunnelConfig {
    std::string_view public_url_scheme = "https";
    std::string_view public_domain = "devtunnel.local";
};

// Top-level relay configuration
struct RelayConfig {
    StreamConfig stream;
    AuthConfig auth;
    TunnelConfig tunnel;
};

// Conservative defaults suitable for development
inline constexpr RelayConfig kDefaultConfig = {};

}  // namespace relay
