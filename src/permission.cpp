#include "relay/permission.hpp"

namespace relay {

std::optional<PermissionParts> split_permission(std::string_view permission) noexcept {
    auto colon = permission.find(':');
    if (colon == std::string_view::npos) {
        return std::nullopt;
    }
    return PermissionParts{
        .resource = permission.substr(0, colon),
        .action = permission.substr(colon + 1),
    };
}

bool grant_covers(std::string_view grant, std::string_view requested) noexcept {
    if (grant == requested || grant == kPermissionAll) {
        return true;
    }

    // Resource wildcard: "<resource>:*"
    auto wanted = split_permission(requested);
    if (!wanted || !grant.ends_with(":*")) {
        return false;
    }
    return grant.substr(0, grant.size() - 2) == wanted->resource;
}

bool permits(const std::vector<std::string>& grants, std::string_view requested) noexcept {
    for (const auto& grant : grants) {
        if (grant_covers(grant, requested)) {
            return true;
        }
    }
    return false;
}

}  // namespace relay
