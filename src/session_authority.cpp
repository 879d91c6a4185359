#include "relay/session_authority.hpp"

#include "relay/token.hpp"

#include <stdexcept>
#include <utility>

namespace relay {

namespace {

constexpr std::size_t kMaskedPrefixLength = 8;

template <typename Backend>
std::unique_ptr<Backend> checked_store(std::unique_ptr<Backend> store, const char* what) {
    if (!store) {
        throw std::invalid_argument(std::string(what) + " must not be null");
    }
    return store;
}

}  // namespace

SessionAuthority::SessionAuthority(AuthConfig config, WallClock clock)
    : SessionAuthority(config,
                       std::move(clock),
                       std::make_unique<InMemoryStore<std::string, ApiKeyRecord>>(),
                       std::make_unique<InMemoryStore<std::string, SessionRecord>>()) {}

SessionAuthority::SessionAuthority(AuthConfig config,
                                   WallClock clock,
                                   std::unique_ptr<KeyStore> keys,
                                   std::unique_ptr<SessionStore> sessions)
    : config_(config)
    , clock_(std::move(clock))
    , keys_(checked_store(std::move(keys), "key store"))
    , sessions_(checked_store(std::move(sessions), "session store")) {
    dev_key_ = issue_key(kDevKeyPrefix,
                         "dev-user",
                         "Development Key",
                         {
                             std::string(kPermissionTunnelCreate),
                             std::string(kPermissionTunnelRead),
                             std::string(kPermissionReplayAll),
                         },
                         config_.dev_rate_limit);
}

std::string SessionAuthority::create_api_key(ApiKeyOptions options) {
    return issue_key(kIssuedKeyPrefix,
                     std::move(options.user_id),
                     std::move(options.name),
                     std::move(options.permissions),
                     options.rate_limit.value_or(config_.default_rate_limit));
}

std::string SessionAuthority::issue_key(std::string_view prefix,
                                        std::string user_id,
                                        std::string name,
                                        std::vector<std::string> permissions,
                                        std::uint32_t rate_limit) {
    std::string key(prefix);
    key += random_hex(config_.key_random_bytes);

    keys_->set(key, ApiKeyRecord{
        .key = key,
        .user_id = std::move(user_id),
        .name = std::move(name),
        .permissions = std::move(permissions),
        .created_at = clock_(),
        .last_used = std::nullopt,
        .rate_limit = rate_limit,
    });
    return key;
}

KeyValidationResult SessionAuthority::validate_api_key(const std::string& key) {
    if (key.empty()) {
        ++auth_failures_;
        return AuthFailure{std::string(kErrorNoApiKey)};
    }

    auto record = keys_->get(key);
    if (!record) {
        ++auth_failures_;
        return AuthFailure{std::string(kErrorInvalidApiKey)};
    }

    record->last_used = clock_();
    KeyValidation result{
        .user_id = record->user_id,
        .permissions = record->permissions,
        .rate_limit = record->rate_limit,
    };
    keys_->set(key, std::move(*record));
    return result;
}

bool SessionAuthority::has_permission(const std::string& key, std::string_view permission) {
    auto result = validate_api_key(key);
    const auto* valid = std::get_if<KeyValidation>(&result);
    if (valid == nullptr) {
        return false;
    }
    return permits(valid->permissions, permission);
}

std::string SessionAuthority::create_session(const std::string& key, const std::string& tunnel_id) {
    std::string token = random_hex(config_.session_random_bytes);
    sessions_->set(token, SessionRecord{
        .token = token,
        .api_key = key,
        .tunnel_id = tunnel_id,
        .created_at = clock_(),
    });
    return token;
}

SessionValidationResult SessionAuthority::validate_session(const std::string& token) const {
    auto record = sessions_->get(token);
    if (!record) {
        return AuthFailure{std::string(kErrorInvalidSession)};
    }
    return SessionValidation{
        .api_key = std::move(record->api_key),
        .tunnel_id = std::move(record->tunnel_id),
        .created_at = record->created_at,
    };
}

bool SessionAuthority::remove_session(const std::string& token) {
    return sessions_->erase(token);
}

bool SessionAuthority::revoke_api_key(const std::string& key) {
    if (!keys_->erase(key)) {
        return false;
    }
    sessions_revoked_ += sessions_->erase_if(
        [&key](const std::string& /*token*/, const SessionRecord& session) {
            return session.api_key == key;
        });
    return true;
}

std::vector<KeySummary> SessionAuthority::list_keys() const {
    std::vector<KeySummary> out;
    out.reserve(keys_->size());
    keys_->for_each([&out](const std::string& key, const ApiKeyRecord& record) {
        out.push_back(KeySummary{
            .masked_key = mask_key(key),
            .user_id = record.user_id,
            .name = record.name,
            .created_at = record.created_at,
            .last_used = record.last_used,
        });
    });
    return out;
}

std::optional<ApiKeyRecord> SessionAuthority::find_key(const std::string& key) const {
    return keys_->get(key);
}

std::string mask_key(std::string_view key) {
    std::string out(key.substr(0, kMaskedPrefixLength));
    out += "...";
    return out;
}

}  // namespace relay
