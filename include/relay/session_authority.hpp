#pragma once

#include "relay/clock.hpp"
#include "relay/config.hpp"
#include "relay/permission.hpp"
#include "relay/store.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace relay {

inline constexpr std::string_view kIssuedKeyPrefix = "dt_";
inline constexpr std::string_view kDevKeyPrefix = "dev_";

// Authentication failure messages
inline constexpr std::string_view kErrorNoApiKey = "No API key provided";
inline constexpr std::string_view kErrorInvalidApiKey = "Invalid API key";
inline constexpr std::string_view kErrorInvalidSession = "Invalid session";

// Stored API key
struct ApiKeyRecord {
    std::string key;
    std::string user_id;
    std::string name;
    std::vector<std::string> permissions;
    std::int64_t created_at = 0;
    std::optional<std::int64_t> last_used;
    std::uint32_t rate_limit = 0;   // informational, never enforced
};

// Stored session: binds an API key to one active tunnel
struct SessionRecord {
    std::string token;
    std::string api_key;
    std::string tunnel_id;
    std::int64_t created_at = 0;
};

// Options for issuing a key. rate_limit falls back to
// AuthConfig::default_rate_limit.
struct ApiKeyOptions {
    std::string user_id = "anonymous";
    std::string name = "API Key";
    std::vector<std::string> permissions = {
        std::string(kPermissionTunnelCreate),
        std::string(kPermissionTunnelRead),
    };
    std::optional<std::uint32_t> rate_limit;
};

struct AuthFailure {
    std::string error;
};

struct KeyValidation {
    std::string user_id;
    std::vector<std::string> permissions;
    std::uint32_t rate_limit = 0;
};

struct SessionValidation {
    std::string api_key;
    std::string tunnel_id;
    std::int64_t created_at = 0;
};

using KeyValidationResult = std::variant<KeyValidation, AuthFailure>;
using SessionValidationResult = std::variant<SessionValidation, AuthFailure>;

// Key listing entry; the key itself is masked
struct KeySummary {
    std::string masked_key;   // first 8 characters + "..."
    std::string user_id;
    std::string name;
    std::int64_t created_at = 0;
    std::optional<std::int64_t> last_used;
};

// Credential and session authority.
//
// Owns the API key and session stores, answers admission (validate) and
// authorization (has_permission) queries, and mints session tokens.
// A development key is issued on construction.
//
// Invariants enforced:
// - No session references a revoked key once revoke_api_key returns
// - Tokens come from the OpenSSL CSPRNG (std::runtime_error on RNG failure)
//
// Thread safety: NOT thread-safe. External synchronization required.
class SessionAuthority {
public:
    using KeyStore = Store<std::string, ApiKeyRecord>;
    using SessionStore = Store<std::string, SessionRecord>;

    explicit SessionAuthority(AuthConfig config = {},
                              WallClock clock = current_time_ms);

    // Throws std::invalid_argument if either store is null
    SessionAuthority(AuthConfig config,
                     WallClock clock,
                     std::unique_ptr<KeyStore> keys,
                     std::unique_ptr<SessionStore> sessions);

    // Issue a new "dt_" key. Returns the key string.
    std::string create_api_key(ApiKeyOptions options = {});

    // Admission check. Stamps last_used on success.
    KeyValidationResult validate_api_key(const std::string& key);

    // Authorization check: false for an invalid key, otherwise whether any
    // grant covers the permission (exact, "*", or "resource:*").
    bool has_permission(const std::string& key, std::string_view permission);

    // Mint a session for a tunnel. Does not re-validate the key.
    std::string create_session(const std::string& key, const std::string& tunnel_id);

    SessionValidationResult validate_session(const std::string& token) const;

    // Idempotent. Returns true if a session was removed.
    bool remove_session(const std::string& token);

    // Delete the key and every session it owns.
    // Returns true if the key existed.
    bool revoke_api_key(const std::string& key);

    // Bootstrap key minted on construction (not production-safe)
    [[nodiscard]] const std::string& dev_key() const noexcept { return dev_key_; }

    // Masked summaries in unspecified order
    [[nodiscard]] std::vector<KeySummary> list_keys() const;

    [[nodiscard]] std::size_t key_count() const noexcept { return keys_->size(); }
    [[nodiscard]] std::size_t session_count() const noexcept { return sessions_->size(); }

    // Record lookup (for inspection and tests)
    [[nodiscard]] std::optional<ApiKeyRecord> find_key(const std::string& key) const;

    // Metrics
    [[nodiscard]] std::uint64_t auth_failures() const noexcept { return auth_failures_; }
    [[nodiscard]] std::uint64_t sessions_revoked() const noexcept { return sessions_revoked_; }

private:
    std::string issue_key(std::string_view prefix,
                          std::string user_id,
                          std::string name,
                          std::vector<std::string> permissions,
                          std::uint32_t rate_limit);

    AuthConfig config_;
    WallClock clock_;
    std::unique_ptr<KeyStore> keys_;
    std::unique_ptr<SessionStore> sessions_;
    std::string dev_key_;

    // Metrics
    std::uint64_t auth_failures_ = 0;
    std::uint64_t sessions_revoked_ = 0;
};

std::string mask_key(std::string_view key);

}  // namespace relay
