#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace relay {

// ============================================================================
// Wire message model
//
// An envelope is {type, payload}. The payload is a tagged union with one
// record per message kind, so handlers can std::visit exhaustively instead
// of probing for fields at runtime.
//
// Every payload carries a generation timestamp (ms since epoch). It is
// diagnostic only and never used for ordering.
// ============================================================================

enum class MessageType : std::uint8_t {
    // Connection lifecycle
    TunnelRegister,
    TunnelRegistered,
    TunnelClose,
    TunnelClosed,

    // HTTP tunneling
    HttpRequest,
    HttpResponse,        // unary response or streaming header
    HttpResponseChunk,
    HttpResponseEnd,
    HttpError,

    // Heartbeat
    Ping,
    Pong,

    // Error handling
    Error,

    // Inspection and replay (dashboard)
    InspectRequest,
    InspectResponse,
    ReplayRequest,
    ReplayResponse,
};

// Wire name, e.g. "http:response:chunk"
const char* to_string(MessageType type) noexcept;

// Inverse of to_string; std::nullopt for names outside the catalogue
std::optional<MessageType> message_type_from_string(std::string_view name) noexcept;

// Header and query maps: string values, key-ordered on the wire
using Headers = std::map<std::string, std::string>;
using QueryParams = std::map<std::string, std::string>;

inline constexpr std::string_view kBase64Encoding = "base64";

struct TunnelRegister {
    static constexpr MessageType kType = MessageType::TunnelRegister;
    std::optional<std::string> subdomain;   // null = relay picks one
    std::int64_t local_port = 0;
    std::string auth_token;
    std::int64_t timestamp = 0;
    bool operator==(const TunnelRegister&) const = default;
};

struct TunnelRegistered {
    static constexpr MessageType kType = MessageType::TunnelRegistered;
    std::string tunnel_id;
    std::string public_url;
    std::string subdomain;
    std::int64_t timestamp = 0;
    bool operator==(const TunnelRegistered&) const = default;
};

struct TunnelClose {
    static constexpr MessageType kType = MessageType::TunnelClose;
    std::string tunnel_id;
    std::string reason;
    std::int64_t timestamp = 0;
    bool operator==(const TunnelClose&) const = default;
};

struct TunnelClosed {
    static constexpr MessageType kType = MessageType::TunnelClosed;
    std::string tunnel_id;
    std::string reason;
    std::int64_t timestamp = 0;
    bool operator==(const TunnelClosed&) const = default;
};

struct HttpRequest {
    static constexpr MessageType kType = MessageType::HttpRequest;
    std::string request_id;
    std::string method;
    std::string path;
    Headers headers;
    std::optional<std::string> body;            // base64 text
    std::optional<std::string> body_encoding;   // "base64" when body present
    QueryParams query;
    std::int64_t timestamp = 0;
    bool operator==(const HttpRequest&) const = default;
};

// Unary response: status, headers and the full encoded body
struct HttpResponse {
    static constexpr MessageType kType = MessageType::HttpResponse;
    std::string request_id;
    std::int64_t status_code = 0;
    Headers headers;
    std::optional<std::string> body;
    std::optional<std::string> body_encoding;
    std::int64_t timestamp = 0;
    bool operator==(const HttpResponse&) const = default;
};

// Streaming header: same wire type as HttpResponse, "streaming": true, no body
struct HttpResponseHeader {
    static constexpr MessageType kType = MessageType::HttpResponse;
    std::string request_id;
    std::int64_t status_code = 0;
    Headers headers;
    std::int64_t timestamp = 0;
    bool operator==(const HttpResponseHeader&) const = default;
};

struct HttpResponseChunk {
    static constexpr MessageType kType = MessageType::HttpResponseChunk;
    std::string request_id;
    std::string chunk;           // base64 bytes
    std::uint64_t index = 0;
    std::int64_t timestamp = 0;
    bool operator==(const HttpResponseChunk&) const = default;
};

struct HttpResponseEnd {
    static constexpr MessageType kType = MessageType::HttpResponseEnd;
    std::string request_id;
    std::int64_t timestamp = 0;
    bool operator==(const HttpResponseEnd&) const = default;
};

struct HttpError {
    static constexpr MessageType kType = MessageType::HttpError;
    std::string request_id;
    std::string error;           // human-readable
    std::string code;            // machine-readable
    std::int64_t status_code = 502;
    std::int64_t timestamp = 0;
    bool operator==(const HttpError&) const = default;
};

struct Ping {
    static constexpr MessageType kType = MessageType::Ping;
    std::int64_t timestamp = 0;
    bool operator==(const Ping&) const = default;
};

struct Pong {
    static constexpr MessageType kType = MessageType::Pong;
    std::int64_t ping_timestamp = 0;
    std::int64_t timestamp = 0;
    bool operator==(const Pong&) const = default;
};

struct ErrorMessage {
    static constexpr MessageType kType = MessageType::Error;
    std::string error;
    std::string code;
    std::int64_t timestamp = 0;
    bool operator==(const ErrorMessage&) const = default;
};

struct InspectRequest {
    static constexpr MessageType kType = MessageType::InspectRequest;
    std::string request_id;
    std::string tunnel_id;
    std::int64_t timestamp = 0;
    bool operator==(const InspectRequest&) const = default;
};

struct InspectResponse {
    static constexpr MessageType kType = MessageType::InspectResponse;
    std::string request_id;
    std::string tunnel_id;
    std::string method;
    std::string path;
    std::int64_t status_code = 0;
    std::int64_t response_time = 0;   // ms
    std::int64_t timestamp = 0;
    bool operator==(const InspectResponse&) const = default;
};

struct ReplayRequest {
    static constexpr MessageType kType = MessageType::ReplayRequest;
    std::string request_id;           // captured request to replay
    std::string replay_id;            // id of the new exchange
    std::string method;
    std::string path;
    Headers headers;
    std::optional<std::string> body;
    std::optional<std::string> body_encoding;
    std::int64_t timestamp = 0;
    bool operator==(const ReplayRequest&) const = default;
};

struct ReplayResponse {
    static constexpr MessageType kType = MessageType::ReplayResponse;
    std::string replay_id;
    std::string request_id;
    std::int64_t status_code = 0;
    Headers headers;
    std::optional<std::string> body;
    std::optional<std::string> body_encoding;
    std::int64_t response_time = 0;   // ms
    std::int64_t timestamp = 0;
    bool operator==(const ReplayResponse&) const = default;
};

using Payload = std::variant<
    TunnelRegister,
    TunnelRegistered,
    TunnelClose,
    TunnelClosed,
    HttpRequest,
    HttpResponse,
    HttpResponseHeader,
    HttpResponseChunk,
    HttpResponseEnd,
    HttpError,
    Ping,
    Pong,
    ErrorMessage,
    InspectRequest,
    InspectResponse,
    ReplayRequest,
    ReplayResponse>;

struct Envelope {
    Payload payload;

    [[nodiscard]] MessageType type() const noexcept {
        return std::visit([](const auto& p) { return p.kType; }, payload);
    }

    // Typed access, nullptr if the payload holds another kind
    template <class T>
    [[nodiscard]] const T* get_if() const noexcept {
        return std::get_if<T>(&payload);
    }

    bool operator==(const Envelope&) const = default;
};

}  // namespace relay
