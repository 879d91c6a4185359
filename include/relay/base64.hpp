#pragma once

#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace relay::base64 {

// Standard alphabet with '=' padding (RFC 4648 section 4).
std::string encode(std::span<const std::byte> data);

// Decode standard base64. Surrounding whitespace is ignored.
// Returns std::nullopt on malformed input (bad length, bad characters,
// misplaced padding).
std::optional<std::vector<std::byte>> decode(std::string_view input);

}  // namespace relay::base64
