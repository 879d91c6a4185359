#pragma once

#include "relay/clock.hpp"
#include "relay/config.hpp"
#include "relay/message.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace relay {

// ============================================================================
// Message codec: envelope constructors, serialization and parsing.
//
// Pure data transformation, no state. Constructors stamp the payload with
// `now` (defaults to the wall clock).
//
// Round-trip law: parse_message(serialize_message(m)) == m for every
// envelope the constructors can produce.
// ============================================================================

using Bytes = std::vector<std::byte>;

// View a string's characters as bytes (no copy)
inline std::span<const std::byte> bytes_of(std::string_view text) noexcept {
    return std::as_bytes(std::span<const char>(text.data(), text.size()));
}

// ----------------------------------------------------------------------------
// Body encoding
// ----------------------------------------------------------------------------

// Wire form of an HTTP body: {body, bodyEncoding}
struct EncodedBody {
    std::optional<std::string> body;
    std::optional<std::string> encoding;
};

// A present body (even empty) is base64-encoded with encoding "base64";
// an absent body yields {null, null}.
EncodedBody encode_body(std::optional<std::span<const std::byte>> body);

enum class BodyDropReason : std::uint8_t {
    Absent,          // body is null
    InvalidBase64,   // encoding is base64 but the text is malformed
};

using BodyResult = std::variant<Bytes, BodyDropReason>;

// Inverse of encode_body. Any encoding other than "base64" returns the
// body text's raw bytes.
BodyResult decode_body(const std::optional<std::string>& body,
                       std::string_view encoding = kBase64Encoding);

// ----------------------------------------------------------------------------
// Constructors (one per message kind)
// ----------------------------------------------------------------------------

Envelope make_tunnel_register(std::optional<std::string> subdomain,
                              std::int64_t local_port,
                              std::string auth_token,
                              std::int64_t now = current_time_ms());

Envelope make_tunnel_registered(std::string tunnel_id,
                                std::string public_url,
                                std::string subdomain,
                                std::int64_t now = current_time_ms());

Envelope make_tunnel_close(std::string tunnel_id,
                           std::string reason = "Client requested close",
                           std::int64_t now = current_time_ms());

Envelope make_tunnel_closed(std::string tunnel_id,
                            std::string reason,
                            std::int64_t now = current_time_ms());

Envelope make_http_request(std::string request_id,
                           std::string method,
                           std::string path,
                           Headers headers,
                           std::optional<std::span<const std::byte>> body,
                           QueryParams query = {},
                           std::int64_t now = current_time_ms());

// Unary response carrying the full body
Envelope make_http_response(std::string request_id,
                            std::int64_t status_code,
                            Headers headers,
                            std::optional<std::span<const std::byte>> body,
                            std::int64_t now = current_time_ms());

// Streaming header: chunks and one end message follow
Envelope make_http_response_header(std::string request_id,
                                   std::int64_t status_code,
                                   Headers headers,
                                   std::int64_t now = current_time_ms());

Envelope make_http_response_chunk(std::string request_id,
                                  std::span<const std::byte> chunk,
                                  std::uint64_t index,
                                  std::int64_t now = current_time_ms());

Envelope make_http_response_end(std::string request_id,
                                std::int64_t now = current_time_ms());

// status_code is what the relay answers with when the local target is
// unreachable, fails or times out.
Envelope make_http_error(std::string request_id,
                         std::string error,
                         std::string code,
                         std::int64_t status_code = 502,
                         std::int64_t now = current_time_ms());

Envelope make_ping(std::int64_t now = current_time_ms());

Envelope make_pong(std::int64_t ping_timestamp,
                   std::int64_t now = current_time_ms());

Envelope make_error(std::string error,
                    std::string code = "GENERIC_ERROR",
                    std::int64_t now = current_time_ms());

Envelope make_inspect_request(std::string request_id,
                              std::string tunnel_id,
                              std::int64_t now = current_time_ms());

Envelope make_inspect_response(std::string request_id,
                               std::string tunnel_id,
                               std::string method,
                               std::string path,
                               std::int64_t status_code,
                               std::int64_t response_time_ms,
                               std::int64_t now = current_time_ms());

Envelope make_replay_request(std::string request_id,
                             std::string replay_id,
                             std::string method,
                             std::string path,
                             Headers headers,
                             std::optional<std::span<const std::byte>> body,
                             std::int64_t now = current_time_ms());

Envelope make_replay_response(std::string replay_id,
                              std::string request_id,
                              std::int64_t status_code,
                              Headers headers,
                              std::optional<std::span<const std::byte>> body,
                              std::int64_t response_time_ms,
                              std::int64_t now = current_time_ms());

// ----------------------------------------------------------------------------
// Serialization
// ----------------------------------------------------------------------------

// Deterministic: fixed field order per kind, no insignificant whitespace.
std::string serialize_message(const Envelope& envelope);

// Why a frame was discarded (explicit enum, not attacker-controlled)
enum class MessageDropReason : std::uint8_t {
    InputTooLarge,      // frame exceeds the caller-supplied input limit
    InvalidJson,        // malformed JSON syntax
    NestingTooDeep,     // exceeds CodecLimits::kMaxNestingDepth
    NotAnObject,        // top-level value is not an object
    MissingType,        // no "type" field (or not a string)
    UnknownType,        // "type" outside the catalogue
    InvalidPayload,     // "payload" present but not an object
    InvalidFieldType,   // a known payload field has the wrong JSON type
};

using MessageDecodeResult = std::variant<Envelope, MessageDropReason>;

// Decode a frame, naming the reason on failure.
//
// Contract:
// - Never throws on malformed input
// - Missing payload => empty payload; missing fields take their defaults
// - Unknown payload fields are ignored
// - No size bound unless max_input_bytes is given (e.g.
//   CodecLimits::kMaxInputBytes), so every serialized envelope decodes
MessageDecodeResult decode_message(std::string_view raw,
                                   std::size_t max_input_bytes = CodecLimits::kUnboundedInput);
MessageDecodeResult decode_message(std::span<const std::byte> raw,
                                   std::size_t max_input_bytes = CodecLimits::kUnboundedInput);

// Same as decode_message with the reason discarded: std::nullopt means
// "discard this frame".
std::optional<Envelope> parse_message(std::string_view raw);
std::optional<Envelope> parse_message(std::span<const std::byte> raw);

const char* to_string(MessageDropReason reason) noexcept;
const char* to_string(BodyDropReason reason) noexcept;

}  // namespace relay
