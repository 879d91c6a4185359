#pragma once

#include "relay/clock.hpp"
#include "relay/config.hpp"
#include "relay/message.hpp"
#include "relay/session_authority.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <variant>
#include <vector>

namespace relay {

inline constexpr std::size_t kGeneratedSubdomainLength = 8;
inline constexpr std::size_t kTunnelIdLength = 12;

// An admitted tunnel: public subdomain -> client's local port
struct Tunnel {
    std::string tunnel_id;
    std::string subdomain;
    std::int64_t local_port = 0;
    std::string session_token;
    std::string api_key;
    std::string public_url;
    std::int64_t created_at = 0;
};

// Why a registration was refused. to_string gives the wire code.
enum class RegistrationErrorCode : std::uint8_t {
    AuthRequired,       // AUTH_REQUIRED: no token supplied
    InvalidApiKey,      // INVALID_API_KEY: unknown token
    PermissionDenied,   // PERMISSION_DENIED: key lacks tunnel:create
    InvalidSubdomain,   // INVALID_SUBDOMAIN: format check failed
    SubdomainTaken,     // SUBDOMAIN_TAKEN: reserved or in use
    InvalidPort,        // INVALID_PORT: outside 1..65535
};

struct RegistrationError {
    RegistrationErrorCode code;
    std::string message;
};

using RegistrationResult = std::variant<Tunnel, RegistrationError>;

// Relay-side admission of tunnel registrations.
//
// Checks credentials and permission through the SessionAuthority, assigns
// the subdomain, mints a session and records the tunnel.
//
// Invariants enforced:
// - A subdomain maps to at most one tunnel
// - Every recorded tunnel holds a session minted at registration
//
// Thread safety: NOT thread-safe. External synchronization required.
class TunnelRegistry {
public:
    // The authority must outlive the registry
    explicit TunnelRegistry(SessionAuthority& authority,
                            TunnelConfig config = {},
                            WallClock clock = current_time_ms);

    RegistrationResult register_tunnel(const TunnelRegister& request);

    // Remove the tunnel and its session.
    // Returns the tunnel:closed message, or std::nullopt for an unknown id.
    std::optional<Envelope> close_tunnel(const std::string& tunnel_id,
                                         std::string reason = "Client requested close");

    // Close every tunnel whose session no longer validates.
    // Returns one tunnel:closed message per closed tunnel.
    std::vector<Envelope> prune_revoked();

    // Pointers are invalidated by the next registration or close
    [[nodiscard]] const Tunnel* find_by_subdomain(std::string_view subdomain) const;
    [[nodiscard]] const Tunnel* find_by_id(const std::string& tunnel_id) const;

    [[nodiscard]] std::size_t tunnel_count() const noexcept { return tunnels_.size(); }

    // Metrics
    [[nodiscard]] std::uint64_t registrations() const noexcept { return registrations_; }
    [[nodiscard]] std::uint64_t rejections() const noexcept { return rejections_; }

private:
    RegistrationResult reject(RegistrationErrorCode code, std::string message);

    std::string generate_subdomain() const;
    std::string generate_tunnel_id() const;
    std::string build_public_url(std::string_view subdomain) const;

    SessionAuthority& authority_;
    TunnelConfig config_;
    WallClock clock_;
    std::unordered_map<std::string, Tunnel> tunnels_;           // by tunnel id
    std::unordered_map<std::string, std::string> subdomains_;   // subdomain -> tunnel id

    // Metrics
    std::uint64_t registrations_ = 0;
    std::uint64_t rejections_ = 0;
};

// Names that can never be claimed (www, api, admin, ...)
bool is_reserved_subdomain(std::string_view subdomain) noexcept;

// tunnel:registered for an admitted tunnel
Envelope make_registered_message(const Tunnel& tunnel);

// error message carrying the registration code
Envelope make_registration_error(const RegistrationError& error);

// Wire code, e.g. "SUBDOMAIN_TAKEN"
const char* to_string(RegistrationErrorCode code) noexcept;

}  // namespace relay
