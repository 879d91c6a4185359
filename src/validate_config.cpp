#include "relay/validate_config.hpp"

namespace relay {

std::optional<ConfigIssue> validate_config(const RelayConfig& config) noexcept {
    if (config.stream.max_chunk_bytes == 0) {
        return ConfigIssue::ChunkSizeZero;
    }
    if (config.stream.max_chunk_bytes > kMaxChunkSize) {
        return ConfigIssue::ChunkSizeTooLarge;
    }
    if (config.stream.max_ended_tracked == 0) {
        return ConfigIssue::EndedTrackingZero;
    }
    if (config.auth.key_random_bytes < kMinRandomBytes) {
        return ConfigIssue::KeyEntropyTooLow;
    }
    if (config.auth.session_random_bytes < kMinRandomBytes) {
        return ConfigIssue::SessionEntropyTooLow;
    }
    if (config.tunnel.public_domain.empty()) {
        return ConfigIssue::EmptyPublicDomain;
    }
    return std::nullopt;
}

bool validate_subdomain_format(std::string_view subdomain) noexcept {
    // Format: ^[a-z0-9][a-z0-9-]{1,61}[a-z0-9]$

    if (subdomain.size() < SubdomainRules::kMinLength ||
        subdomain.size() > SubdomainRules::kMaxLength) {
        return false;
    }

    auto is_alnum = [](char c) {
        return (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9');
    };

    // First and last character: letter or digit
    if (!is_alnum(subdomain.front()) || !is_alnum(subdomain.back())) {
        return false;
    }

    for (char c : subdomain) {
        if (!is_alnum(c) && c != '-') {
            return false;
        }
    }

    return true;
}

const char* to_string(ConfigIssue issue) noexcept {
    switch (issue) {
        case ConfigIssue::ChunkSizeZero:        return "chunk size must be positive";
        case ConfigIssue::ChunkSizeTooLarge:    return "chunk size exceeds 65536 bytes";
        case ConfigIssue::EndedTrackingZero:    return "ended-stream tracking must be positive";
        case ConfigIssue::KeyEntropyTooLow:     return "api key entropy below 16 bytes";
        case ConfigIssue::SessionEntropyTooLow: return "session token entropy below 16 bytes";
        case ConfigIssue::EmptyPublicDomain:    return "public domain is empty";
    }
    return "unknown";
}

}  // namespace relay
