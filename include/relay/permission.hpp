#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace relay {

// Permission strings have the form "resource:action".
// Grants may use "*" (everything) or "resource:*" (every action on resource).
inline constexpr std::string_view kPermissionTunnelCreate = "tunnel:create";
inline constexpr std::string_view kPermissionTunnelRead = "tunnel:read";
inline constexpr std::string_view kPermissionReplayAll = "replay:*";
inline constexpr std::string_view kPermissionAll = "*";

struct PermissionParts {
    std::string_view resource;
    std::string_view action;
};

// Split at the first colon. std::nullopt if there is no colon.
std::optional<PermissionParts> split_permission(std::string_view permission) noexcept;

// True if a single grant covers the requested permission.
// A requested permission without a colon is only covered by an exact
// match or by "*".
bool grant_covers(std::string_view grant, std::string_view requested) noexcept;

// True if any grant in the list covers the requested permission
bool permits(const std::vector<std::string>& grants, std::string_view requested) noexcept;

}  // namespace relay
