#include "relay/tunnel_registry.hpp"

#include "relay/message_codec.hpp"
#include "relay/permission.hpp"
#include "relay/token.hpp"
#include "relay/validate_config.hpp"

#include <array>
#include <utility>

namespace relay {

namespace {

constexpr std::array<std::string_view, 7> kReservedSubdomains = {
    "www", "api", "admin", "app", "dashboard", "mail", "status",
};

constexpr std::int64_t kMinPort = 1;
constexpr std::int64_t kMaxPort = 65535;

}  // namespace

TunnelRegistry::TunnelRegistry(SessionAuthority& authority, TunnelConfig config, WallClock clock)
    : authority_(authority)
    , config_(config)
    , clock_(std::move(clock)) {}

RegistrationResult TunnelRegistry::register_tunnel(const TunnelRegister& request) {
    // 1. Credentials
    if (request.auth_token.empty()) {
        return reject(RegistrationErrorCode::AuthRequired, "Authentication required");
    }
    auto validation = authority_.validate_api_key(request.auth_token);
    if (const auto* failure = std::get_if<AuthFailure>(&validation)) {
        return reject(RegistrationErrorCode::InvalidApiKey, failure->error);
    }
    const auto& key = std::get<KeyValidation>(validation);

    // 2. Permission
    if (!permits(key.permissions, kPermissionTunnelCreate)) {
        return reject(RegistrationErrorCode::PermissionDenied,
                      "API key lacks permission: tunnel:create");
    }

    // 3. Subdomain
    std::string subdomain;
    if (request.subdomain && !request.subdomain->empty()) {
        subdomain = *request.subdomain;
        if (!validate_subdomain_format(subdomain)) {
            return reject(RegistrationErrorCode::InvalidSubdomain,
                          "Subdomain must be 3-63 characters of a-z, 0-9 and '-', "
                          "starting and ending with a letter or digit");
        }
        if (is_reserved_subdomain(subdomain)) {
            return reject(RegistrationErrorCode::SubdomainTaken,
                          "Subdomain '" + subdomain + "' is reserved");
        }
        if (subdomains_.contains(subdomain)) {
            return reject(RegistrationErrorCode::SubdomainTaken,
                          "Subdomain '" + subdomain + "' is already in use");
        }
    } else {
        do {
            subdomain = generate_subdomain();
        } while (subdomains_.contains(subdomain));
    }

    // 4. Port
    if (request.local_port < kMinPort || request.local_port > kMaxPort) {
        return reject(RegistrationErrorCode::InvalidPort,
                      "Local port must be between 1 and 65535");
    }

    // 5. Record
    std::string tunnel_id;
    do {
        tunnel_id = generate_tunnel_id();
    } while (tunnels_.contains(tunnel_id));

    Tunnel tunnel{
        .tunnel_id = tunnel_id,
        .subdomain = subdomain,
        .local_port = request.local_port,
        .session_token = authority_.create_session(request.auth_token, tunnel_id),
        .api_key = request.auth_token,
        .public_url = build_public_url(subdomain),
        .created_at = clock_(),
    };
    subdomains_.emplace(subdomain, tunnel_id);
    tunnels_.emplace(tunnel_id, tunnel);
    ++registrations_;
    return tunnel;
}

std::optional<Envelope> TunnelRegistry::close_tunnel(const std::string& tunnel_id,
                                                     std::string reason) {
    auto it = tunnels_.find(tunnel_id);
    if (it == tunnels_.end()) {
        return std::nullopt;
    }
    Envelope closed = make_tunnel_closed(tunnel_id, std::move(reason), clock_());
    authority_.remove_session(it->second.session_token);
    subdomains_.erase(it->second.subdomain);
    tunnels_.erase(it);
    return closed;
}

std::vector<Envelope> TunnelRegistry::prune_revoked() {
    std::vector<std::string> stale;
    for (const auto& [id, tunnel] : tunnels_) {
        auto session = authority_.validate_session(tunnel.session_token);
        if (std::holds_alternative<AuthFailure>(session)) {
            stale.push_back(id);
        }
    }

    std::vector<Envelope> closed;
    closed.reserve(stale.size());
    for (const auto& id : stale) {
        if (auto message = close_tunnel(id, "Session revoked")) {
            closed.push_back(std::move(*message));
        }
    }
    return closed;
}

const Tunnel* TunnelRegistry::find_by_subdomain(std::string_view subdomain) const {
    auto it = subdomains_.find(std::string(subdomain));
    if (it == subdomains_.end()) {
        return nullptr;
    }
    return find_by_id(it->second);
}

const Tunnel* TunnelRegistry::find_by_id(const std::string& tunnel_id) const {
    auto it = tunnels_.find(tunnel_id);
    if (it == tunnels_.end()) {
        return nullptr;
    }
    return &it->second;
}

RegistrationResult TunnelRegistry::reject(RegistrationErrorCode code, std::string message) {
    ++rejections_;
    return RegistrationError{.code = code, .message = std::move(message)};
}

std::string TunnelRegistry::generate_subdomain() const {
    return random_alnum(kGeneratedSubdomainLength);
}

std::string TunnelRegistry::generate_tunnel_id() const {
    return random_alnum(kTunnelIdLength);
}

std::string TunnelRegistry::build_public_url(std::string_view subdomain) const {
    std::string url(config_.public_url_scheme);
    url += "://";
    url += subdomain;
    url += '.';
    url += config_.public_domain;
    return url;
}

bool is_reserved_subdomain(std::string_view subdomain) noexcept {
    for (auto reserved : kReservedSubdomains) {
        if (subdomain == reserved) {
            return true;
        }
    }
    return false;
}

Envelope make_registered_message(const Tunnel& tunnel) {
    return make_tunnel_registered(tunnel.tunnel_id, tunnel.public_url, tunnel.subdomain);
}

Envelope make_registration_error(const RegistrationError& error) {
    return make_error(error.message, to_string(error.code));
}

const char* to_string(RegistrationErrorCode code) noexcept {
    switch (code) {
        case RegistrationErrorCode::AuthRequired:     return "AUTH_REQUIRED";
        case RegistrationErrorCode::InvalidApiKey:    return "INVALID_API_KEY";
        case RegistrationErrorCode::PermissionDenied: return "PERMISSION_DENIED";
        case RegistrationErrorCode::InvalidSubdomain: return "INVALID_SUBDOMAIN";
        case RegistrationErrorCode::SubdomainTaken:   return "SUBDOMAIN_TAKEN";
        case RegistrationErrorCode::InvalidPort:      return "INVALID_PORT";
    }
    return "UNKNOWN";
}

}  // namespace relay
