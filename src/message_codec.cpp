#include "relay/message_codec.hpp"

#include "relay/base64.hpp"
#include "relay/json.hpp"

#include <array>
#include <cmath>
#include <utility>

namespace relay {

namespace {

constexpr std::array<std::pair<MessageType, const char*>, 16> kTypeNames = {{
    {MessageType::TunnelRegister,    "tunnel:register"},
    {MessageType::TunnelRegistered,  "tunnel:registered"},
    {MessageType::TunnelClose,       "tunnel:close"},
    {MessageType::TunnelClosed,      "tunnel:closed"},
    {MessageType::HttpRequest,       "http:request"},
    {MessageType::HttpResponse,      "http:response"},
    {MessageType::HttpResponseChunk, "http:response:chunk"},
    {MessageType::HttpResponseEnd,   "http:response:end"},
    {MessageType::HttpError,         "http:error"},
    {MessageType::Ping,              "ping"},
    {MessageType::Pong,              "pong"},
    {MessageType::Error,             "error"},
    {MessageType::InspectRequest,    "inspect:request"},
    {MessageType::InspectResponse,   "inspect:response"},
    {MessageType::ReplayRequest,     "replay:request"},
    {MessageType::ReplayResponse,    "replay:response"},
}};

// ============================================================================
// Writing
// ============================================================================

json::Value optional_string(const std::optional<std::string>& s) {
    return s ? json::Value::string(*s) : json::Value::null();
}

json::Value string_map(const std::map<std::string, std::string>& m) {
    json::Value obj = json::Value::object();
    for (const auto& [key, value] : m) {
        obj.set(key, json::Value::string(value));
    }
    return obj;
}

json::Value to_json(const TunnelRegister& p) {
    json::Value v = json::Value::object();
    v.set("subdomain", optional_string(p.subdomain));
    v.set("localPort", json::Value::integer(p.local_port));
    v.set("authToken", json::Value::string(p.auth_token));
    v.set("timestamp", json::Value::integer(p.timestamp));
    return v;
}

json::Value to_json(const TunnelRegistered& p) {
    json::Value v = json::Value::object();
    v.set("tunnelId", json::Value::string(p.tunnel_id));
    v.set("publicUrl", json::Value::string(p.public_url));
    v.set("subdomain", json::Value::string(p.subdomain));
    v.set("timestamp", json::Value::integer(p.timestamp));
    return v;
}

json::Value to_json(const TunnelClose& p) {
    json::Value v = json::Value::object();
    v.set("tunnelId", json::Value::string(p.tunnel_id));
    v.set("reason", json::Value::string(p.reason));
    v.set("timestamp", json::Value::integer(p.timestamp));
    return v;
}

json::Value to_json(const TunnelClosed& p) {
    json::Value v = json::Value::object();
    v.set("tunnelId", json::Value::string(p.tunnel_id));
    v.set("reason", json::Value::string(p.reason));
    v.set("timestamp", json::Value::integer(p.timestamp));
    return v;
}

json::Value to_json(const HttpRequest& p) {
    json::Value v = json::Value::object();
    v.set("requestId", json::Value::string(p.request_id));
    v.set("method", json::Value::string(p.method));
    v.set("path", json::Value::string(p.path));
    v.set("headers", string_map(p.headers));
    v.set("body", optional_string(p.body));
    v.set("bodyEncoding", optional_string(p.body_encoding));
    v.set("query", string_map(p.query));
    v.set("timestamp", json::Value::integer(p.timestamp));
    return v;
}

json::Value to_json(const HttpResponse& p) {
    json::Value v = json::Value::object();
    v.set("requestId", json::Value::string(p.request_id));
    v.set("statusCode", json::Value::integer(p.status_code));
    v.set("headers", string_map(p.headers));
    v.set("body", optional_string(p.body));
    v.set("bodyEncoding", optional_string(p.body_encoding));
    v.set("timestamp", json::Value::integer(p.timestamp));
    return v;
}

json::Value to_json(const HttpResponseHeader& p) {
    json::Value v = json::Value::object();
    v.set("requestId", json::Value::string(p.request_id));
    v.set("statusCode", json::Value::integer(p.status_code));
    v.set("headers", string_map(p.headers));
    v.set("streaming", json::Value::boolean(true));
    v.set("timestamp", json::Value::integer(p.timestamp));
    return v;
}

json::Value to_json(const HttpResponseChunk& p) {
    json::Value v = json::Value::object();
    v.set("requestId", json::Value::string(p.request_id));
    v.set("chunk", json::Value::string(p.chunk));
    v.set("index", json::Value::unsigned_integer(p.index));
    v.set("timestamp", json::Value::integer(p.timestamp));
    return v;
}

json::Value to_json(const HttpResponseEnd& p) {
    json::Value v = json::Value::object();
    v.set("requestId", json::Value::string(p.request_id));
    v.set("timestamp", json::Value::integer(p.timestamp));
    return v;
}

json::Value to_json(const HttpError& p) {
    json::Value v = json::Value::object();
    v.set("requestId", json::Value::string(p.request_id));
    v.set("error", json::Value::string(p.error));
    v.set("code", json::Value::string(p.code));
    v.set("statusCode", json::Value::integer(p.status_code));
    v.set("timestamp", json::Value::integer(p.timestamp));
    return v;
}

json::Value to_json(const Ping& p) {
    json::Value v = json::Value::object();
    v.set("timestamp", json::Value::integer(p.timestamp));
    return v;
}

json::Value to_json(const Pong& p) {
    json::Value v = json::Value::object();
    v.set("pingTimestamp", json::Value::integer(p.ping_timestamp));
    v.set("timestamp", json::Value::integer(p.timestamp));
    return v;
}

json::Value to_json(const ErrorMessage& p) {
    json::Value v = json::Value::object();
    v.set("error", json::Value::string(p.error));
    v.set("code", json::Value::string(p.code));
    v.set("timestamp", json::Value::integer(p.timestamp));
    return v;
}

json::Value to_json(const InspectRequest& p) {
    json::Value v = json::Value::object();
    v.set("requestId", json::Value::string(p.request_id));
    v.set("tunnelId", json::Value::string(p.tunnel_id));
    v.set("timestamp", json::Value::integer(p.timestamp));
    return v;
}

json::Value to_json(const InspectResponse& p) {
    json::Value v = json::Value::object();
    v.set("requestId", json::Value::string(p.request_id));
    v.set("tunnelId", json::Value::string(p.tunnel_id));
    v.set("method", json::Value::string(p.method));
    v.set("path", json::Value::string(p.path));
    v.set("statusCode", json::Value::integer(p.status_code));
    v.set("responseTime", json::Value::integer(p.response_time));
    v.set("timestamp", json::Value::integer(p.timestamp));
    return v;
}

json::Value to_json(const ReplayRequest& p) {
    json::Value v = json::Value::object();
    v.set("requestId", json::Value::string(p.request_id));
    v.set("replayId", json::Value::string(p.replay_id));
    v.set("method", json::Value::string(p.method));
    v.set("path", json::Value::string(p.path));
    v.set("headers", string_map(p.headers));
    v.set("body", optional_string(p.body));
    v.set("bodyEncoding", optional_string(p.body_encoding));
    v.set("timestamp", json::Value::integer(p.timestamp));
    return v;
}

json::Value to_json(const ReplayResponse& p) {
    json::Value v = json::Value::object();
    v.set("replayId", json::Value::string(p.replay_id));
    v.set("requestId", json::Value::string(p.request_id));
    v.set("statusCode", json::Value::integer(p.status_code));
    v.set("headers", string_map(p.headers));
    v.set("body", optional_string(p.body));
    v.set("bodyEncoding", optional_string(p.body_encoding));
    v.set("responseTime", json::Value::integer(p.response_time));
    v.set("timestamp", json::Value::integer(p.timestamp));
    return v;
}

// ============================================================================
// Reading
//
// Lenient on absence (missing or null fields take defaults), strict on
// type: a field present with the wrong JSON type poisons the reader.
// ============================================================================

class PayloadReader {
public:
    explicit PayloadReader(const json::Value& payload) noexcept
        : payload_(payload) {}

    [[nodiscard]] bool ok() const noexcept { return ok_; }

    std::string string(std::string_view key) {
        const json::Value* v = lookup(key);
        if (v == nullptr) {
            return {};
        }
        if (!v->is_string()) {
            ok_ = false;
            return {};
        }
        return v->as_string();
    }

    std::optional<std::string> optional_string(std::string_view key) {
        const json::Value* v = lookup(key);
        if (v == nullptr) {
            return std::nullopt;
        }
        if (!v->is_string()) {
            ok_ = false;
            return std::nullopt;
        }
        return v->as_string();
    }

    std::int64_t integer(std::string_view key, std::int64_t fallback = 0) {
        const json::Value* v = lookup(key);
        if (v == nullptr) {
            return fallback;
        }
        if (v->is_integer()) {
            return v->as_integer();
        }
        // Accept integral doubles (e.g. 200.0) from lax peers
        if (v->is_number()) {
            double d = v->as_number();
            if (std::isfinite(d) && d == std::trunc(d) &&
                d >= -9.2e18 && d <= 9.2e18) {
                return static_cast<std::int64_t>(d);
            }
        }
        ok_ = false;
        return fallback;
    }

    std::uint64_t index(std::string_view key) {
        const json::Value* v = lookup(key);
        if (v != nullptr && v->is_unsigned()) {
            return v->as_unsigned();
        }
        std::int64_t i = integer(key);
        if (i < 0) {
            ok_ = false;
            return 0;
        }
        return static_cast<std::uint64_t>(i);
    }

    std::optional<bool> boolean(std::string_view key) {
        const json::Value* v = lookup(key);
        if (v == nullptr) {
            return std::nullopt;
        }
        if (!v->is_bool()) {
            ok_ = false;
            return std::nullopt;
        }
        return v->as_bool();
    }

    // Object of string values. Multi-valued headers arrive as arrays of
    // strings and are joined with ", ".
    std::map<std::string, std::string> string_map(std::string_view key) {
        std::map<std::string, std::string> out;
        const json::Value* v = lookup(key);
        if (v == nullptr) {
            return out;
        }
        if (!v->is_object()) {
            ok_ = false;
            return out;
        }
        for (const auto& [name, value] : v->as_object()) {
            if (value.is_string()) {
                out.insert_or_assign(name, value.as_string());
            } else if (value.is_array()) {
                std::string joined;
                for (const auto& element : value.as_array()) {
                    if (!element.is_string()) {
                        ok_ = false;
                        return out;
                    }
                    if (!joined.empty()) joined += ", ";
                    joined += element.as_string();
                }
                out.insert_or_assign(name, std::move(joined));
            } else if (!value.is_null()) {
                ok_ = false;
                return out;
            }
        }
        return out;
    }

private:
    // Absent and null are the same to the reader
    const json::Value* lookup(std::string_view key) const noexcept {
        const json::Value* v = payload_.find(key);
        if (v == nullptr || v->is_null()) {
            return nullptr;
        }
        return v;
    }

    const json::Value& payload_;
    bool ok_ = true;
};

Payload read_payload(MessageType type, PayloadReader& r) {
    switch (type) {
        case MessageType::TunnelRegister: {
            TunnelRegister p;
            p.subdomain = r.optional_string("subdomain");
            p.local_port = r.integer("localPort");
            p.auth_token = r.string("authToken");
            p.timestamp = r.integer("timestamp");
            return p;
        }
        case MessageType::TunnelRegistered: {
            TunnelRegistered p;
            p.tunnel_id = r.string("tunnelId");
            p.public_url = r.string("publicUrl");
            p.subdomain = r.string("subdomain");
            p.timestamp = r.integer("timestamp");
            return p;
        }
        case MessageType::TunnelClose: {
            TunnelClose p;
            p.tunnel_id = r.string("tunnelId");
            p.reason = r.string("reason");
            p.timestamp = r.integer("timestamp");
            return p;
        }
        case MessageType::TunnelClosed: {
            TunnelClosed p;
            p.tunnel_id = r.string("tunnelId");
            p.reason = r.string("reason");
            p.timestamp = r.integer("timestamp");
            return p;
        }
        case MessageType::HttpRequest: {
            HttpRequest p;
            p.request_id = r.string("requestId");
            p.method = r.string("method");
            p.path = r.string("path");
            p.headers = r.string_map("headers");
            p.body = r.optional_string("body");
            p.body_encoding = r.optional_string("bodyEncoding");
            p.query = r.string_map("query");
            p.timestamp = r.integer("timestamp");
            return p;
        }
        case MessageType::HttpResponse: {
            if (r.boolean("streaming").value_or(false)) {
                HttpResponseHeader p;
                p.request_id = r.string("requestId");
                p.status_code = r.integer("statusCode");
                p.headers = r.string_map("headers");
                p.timestamp = r.integer("timestamp");
                return p;
            }
            HttpResponse p;
            p.request_id = r.string("requestId");
            p.status_code = r.integer("statusCode");
            p.headers = r.string_map("headers");
            p.body = r.optional_string("body");
            p.body_encoding = r.optional_string("bodyEncoding");
            p.timestamp = r.integer("timestamp");
            return p;
        }
        case MessageType::HttpResponseChunk: {
            HttpResponseChunk p;
            p.request_id = r.string("requestId");
            p.chunk = r.string("chunk");
            p.index = r.index("index");
            p.timestamp = r.integer("timestamp");
            return p;
        }
        case MessageType::HttpResponseEnd: {
            HttpResponseEnd p;
            p.request_id = r.string("requestId");
            p.timestamp = r.integer("timestamp");
            return p;
        }
        case MessageType::HttpError: {
            HttpError p;
            p.request_id = r.string("requestId");
            p.error = r.string("error");
            p.code = r.string("code");
            p.status_code = r.integer("statusCode", 502);
            p.timestamp = r.integer("timestamp");
            return p;
        }
        case MessageType::Ping: {
            Ping p;
            p.timestamp = r.integer("timestamp");
            return p;
        }
        case MessageType::Pong: {
            Pong p;
            p.ping_timestamp = r.integer("pingTimestamp");
            p.timestamp = r.integer("timestamp");
            return p;
        }
        case MessageType::Error: {
            ErrorMessage p;
            p.error = r.string("error");
            p.code = r.string("code");
            p.timestamp = r.integer("timestamp");
            return p;
        }
        case MessageType::InspectRequest: {
            InspectRequest p;
            p.request_id = r.string("requestId");
            p.tunnel_id = r.string("tunnelId");
            p.timestamp = r.integer("timestamp");
            return p;
        }
        case MessageType::InspectResponse: {
            InspectResponse p;
            p.request_id = r.string("requestId");
            p.tunnel_id = r.string("tunnelId");
            p.method = r.string("method");
            p.path = r.string("path");
            p.status_code = r.integer("statusCode");
            p.response_time = r.integer("responseTime");
            p.timestamp = r.integer("timestamp");
            return p;
        }
        case MessageType::ReplayRequest: {
            ReplayRequest p;
            p.request_id = r.string("requestId");
            p.replay_id = r.string("replayId");
            p.method = r.string("method");
            p.path = r.string("path");
            p.headers = r.string_map("headers");
            p.body = r.optional_string("body");
            p.body_encoding = r.optional_string("bodyEncoding");
            p.timestamp = r.integer("timestamp");
            return p;
        }
        case MessageType::ReplayResponse: {
            ReplayResponse p;
            p.replay_id = r.string("replayId");
            p.request_id = r.string("requestId");
            p.status_code = r.integer("statusCode");
            p.headers = r.string_map("headers");
            p.body = r.optional_string("body");
            p.body_encoding = r.optional_string("bodyEncoding");
            p.response_time = r.integer("responseTime");
            p.timestamp = r.integer("timestamp");
            return p;
        }
    }
    return Ping{};  // unreachable: switch covers every MessageType
}

MessageDropReason from_parse_error(json::ParseError e) noexcept {
    switch (e) {
        case json::ParseError::InputTooLarge:  return MessageDropReason::InputTooLarge;
        case json::ParseError::NestingTooDeep: return MessageDropReason::NestingTooDeep;
        case json::ParseError::InvalidJson:    break;
    }
    return MessageDropReason::InvalidJson;
}

}  // namespace

// ============================================================================
// Message types
// ============================================================================

const char* to_string(MessageType type) noexcept {
    for (const auto& [t, name] : kTypeNames) {
        if (t == type) {
            return name;
        }
    }
    return "unknown";
}

std::optional<MessageType> message_type_from_string(std::string_view name) noexcept {
    for (const auto& [t, n] : kTypeNames) {
        if (name == n) {
            return t;
        }
    }
    return std::nullopt;
}

// ============================================================================
// Body encoding
// ============================================================================

EncodedBody encode_body(std::optional<std::span<const std::byte>> body) {
    if (!body) {
        return EncodedBody{};
    }
    return EncodedBody{
        .body = base64::encode(*body),
        .encoding = std::string(kBase64Encoding),
    };
}

BodyResult decode_body(const std::optional<std::string>& body, std::string_view encoding) {
    if (!body) {
        return BodyDropReason::Absent;
    }
    if (encoding == kBase64Encoding) {
        auto decoded = base64::decode(*body);
        if (!decoded) {
            return BodyDropReason::InvalidBase64;
        }
        return std::move(*decoded);
    }
    auto raw = bytes_of(*body);
    return Bytes(raw.begin(), raw.end());
}

// ============================================================================
// Constructors
// ============================================================================

Envelope make_tunnel_register(std::optional<std::string> subdomain,
                              std::int64_t local_port,
                              std::string auth_token,
                              std::int64_t now) {
    return Envelope{TunnelRegister{
        .subdomain = std::move(subdomain),
        .local_port = local_port,
        .auth_token = std::move(auth_token),
        .timestamp = now,
    }};
}

Envelope make_tunnel_registered(std::string tunnel_id,
                                std::string public_url,
                                std::string subdomain,
                                std::int64_t now) {
    return Envelope{TunnelRegistered{
        .tunnel_id = std::move(tunnel_id),
        .public_url = std::move(public_url),
        .subdomain = std::move(subdomain),
        .timestamp = now,
    }};
}

Envelope make_tunnel_close(std::string tunnel_id, std::string reason, std::int64_t now) {
    return Envelope{TunnelClose{
        .tunnel_id = std::move(tunnel_id),
        .reason = std::move(reason),
        .timestamp = now,
    }};
}

Envelope make_tunnel_closed(std::string tunnel_id, std::string reason, std::int64_t now) {
    return Envelope{TunnelClosed{
        .tunnel_id = std::move(tunnel_id),
        .reason = std::move(reason),
        .timestamp = now,
    }};
}

Envelope make_http_request(std::string request_id,
                           std::string method,
                           std::string path,
                           Headers headers,
                           std::optional<std::span<const std::byte>> body,
                           QueryParams query,
                           std::int64_t now) {
    EncodedBody encoded = encode_body(body);
    return Envelope{HttpRequest{
        .request_id = std::move(request_id),
        .method = std::move(method),
        .path = std::move(path),
        .headers = std::move(headers),
        .body = std::move(encoded.body),
        .body_encoding = std::move(encoded.encoding),
        .query = std::move(query),
        .timestamp = now,
    }};
}

Envelope make_http_response(std::string request_id,
                            std::int64_t status_code,
                            Headers headers,
                            std::optional<std::span<const std::byte>> body,
                            std::int64_t now) {
    EncodedBody encoded = encode_body(body);
    return Envelope{HttpResponse{
        .request_id = std::move(request_id),
        .status_code = status_code,
        .headers = std::move(headers),
        .body = std::move(encoded.body),
        .body_encoding = std::move(encoded.encoding),
        .timestamp = now,
    }};
}

Envelope make_http_response_header(std::string request_id,
                                   std::int64_t status_code,
                                   Headers headers,
                                   std::int64_t now) {
    return Envelope{HttpResponseHeader{
        .request_id = std::move(request_id),
        .status_code = status_code,
        .headers = std::move(headers),
        .timestamp = now,
    }};
}

Envelope make_http_response_chunk(std::string request_id,
                                  std::span<const std::byte> chunk,
                                  std::uint64_t index,
                                  std::int64_t now) {
    return Envelope{HttpResponseChunk{
        .request_id = std::move(request_id),
        .chunk = base64::encode(chunk),
        .index = index,
        .timestamp = now,
    }};
}

Envelope make_http_response_end(std::string request_id, std::int64_t now) {
    return Envelope{HttpResponseEnd{
        .request_id = std::move(request_id),
        .timestamp = now,
    }};
}

Envelope make_http_error(std::string request_id,
                         std::string error,
                         std::string code,
                         std::int64_t status_code,
                         std::int64_t now) {
    return Envelope{HttpError{
        .request_id = std::move(request_id),
        .error = std::move(error),
        .code = std::move(code),
        .status_code = status_code,
        .timestamp = now,
    }};
}

Envelope make_ping(std::int64_t now) {
    return Envelope{Ping{.timestamp = now}};
}

Envelope make_pong(std::int64_t ping_timestamp, std::int64_t now) {
    return Envelope{Pong{.ping_timestamp = ping_timestamp, .timestamp = now}};
}

Envelope make_error(std::string error, std::string code, std::int64_t now) {
    return Envelope{ErrorMessage{
        .error = std::move(error),
        .code = std::move(code),
        .timestamp = now,
    }};
}

Envelope make_inspect_request(std::string request_id, std::string tunnel_id, std::int64_t now) {
    return Envelope{InspectRequest{
        .request_id = std::move(request_id),
        .tunnel_id = std::move(tunnel_id),
        .timestamp = now,
    }};
}

Envelope make_inspect_response(std::string request_id,
                               std::string tunnel_id,
                               std::string method,
                               std::string path,
                               std::int64_t status_code,
                               std::int64_t response_time_ms,
                               std::int64_t now) {
    return Envelope{InspectResponse{
        .request_id = std::move(request_id),
        .tunnel_id = std::move(tunnel_id),
        .method = std::move(method),
        .path = std::move(path),
        .status_code = status_code,
        .response_time = response_time_ms,
        .timestamp = now,
    }};
}

Envelope make_replay_request(std::string request_id,
                             std::string replay_id,
                             std::string method,
                             std::string path,
                             Headers headers,
                             std::optional<std::span<const std::byte>> body,
                             std::int64_t now) {
    EncodedBody encoded = encode_body(body);
    return Envelope{ReplayRequest{
        .request_id = std::move(request_id),
        .replay_id = std::move(replay_id),
        .method = std::move(method),
        .path = std::move(path),
        .headers = std::move(headers),
        .body = std::move(encoded.body),
        .body_encoding = std::move(encoded.encoding),
        .timestamp = now,
    }};
}

Envelope make_replay_response(std::string replay_id,
                              std::string request_id,
                              std::int64_t status_code,
                              Headers headers,
                              std::optional<std::span<const std::byte>> body,
                              std::int64_t response_time_ms,
                              std::int64_t now) {
    EncodedBody encoded = encode_body(body);
    return Envelope{ReplayResponse{
        .replay_id = std::move(replay_id),
        .request_id = std::move(request_id),
        .status_code = status_code,
        .headers = std::move(headers),
        .body = std::move(encoded.body),
        .body_encoding = std::move(encoded.encoding),
        .response_time = response_time_ms,
        .timestamp = now,
    }};
}

// ============================================================================
// Serialization
// ============================================================================

std::string serialize_message(const Envelope& envelope) {
    json::Value root = json::Value::object();
    root.set("type", json::Value::string(to_string(envelope.type())));
    root.set("payload", std::visit([](const auto& p) { return to_json(p); }, envelope.payload));
    return json::dump(root);
}

MessageDecodeResult decode_message(std::string_view raw, std::size_t max_input_bytes) {
    json::ParseResult parsed = json::parse(raw, max_input_bytes);
    if (const auto* err = std::get_if<json::ParseError>(&parsed)) {
        return from_parse_error(*err);
    }
    const json::Value& root = std::get<json::Value>(parsed);

    if (!root.is_object()) {
        return MessageDropReason::NotAnObject;
    }

    const json::Value* type_field = root.find("type");
    if (type_field == nullptr || !type_field->is_string() || type_field->as_string().empty()) {
        return MessageDropReason::MissingType;
    }

    auto type = message_type_from_string(type_field->as_string());
    if (!type) {
        return MessageDropReason::UnknownType;
    }

    // Missing or null payload reads as an empty object
    static const json::Value kEmptyPayload = json::Value::object();
    const json::Value* payload = root.find("payload");
    if (payload == nullptr || payload->is_null()) {
        payload = &kEmptyPayload;
    } else if (!payload->is_object()) {
        return MessageDropReason::InvalidPayload;
    }

    PayloadReader reader(*payload);
    Payload decoded = read_payload(*type, reader);
    if (!reader.ok()) {
        return MessageDropReason::InvalidFieldType;
    }
    return Envelope{std::move(decoded)};
}

MessageDecodeResult decode_message(std::span<const std::byte> raw, std::size_t max_input_bytes) {
    return decode_message(std::string_view(reinterpret_cast<const char*>(raw.data()), raw.size()),
                          max_input_bytes);
}

std::optional<Envelope> parse_message(std::string_view raw) {
    MessageDecodeResult r = decode_message(raw);
    if (auto* env = std::get_if<Envelope>(&r)) {
        return std::move(*env);
    }
    return std::nullopt;
}

std::optional<Envelope> parse_message(std::span<const std::byte> raw) {
    return parse_message(std::string_view(reinterpret_cast<const char*>(raw.data()), raw.size()));
}

const char* to_string(MessageDropReason reason) noexcept {
    switch (reason) {
        case MessageDropReason::InputTooLarge:    return "input too large";
        case MessageDropReason::InvalidJson:      return "invalid json";
        case MessageDropReason::NestingTooDeep:   return "nesting too deep";
        case MessageDropReason::NotAnObject:      return "not an object";
        case MessageDropReason::MissingType:      return "missing type";
        case MessageDropReason::UnknownType:      return "unknown type";
        case MessageDropReason::InvalidPayload:   return "invalid payload";
        case MessageDropReason::InvalidFieldType: return "invalid field type";
    }
    return "unknown";
}

const char* to_string(BodyDropReason reason) noexcept {
    switch (reason) {
        case BodyDropReason::Absent:        return "body absent";
        case BodyDropReason::InvalidBase64: return "invalid base64";
    }
    return "unknown";
}

}  // namespace relay
