#include "relay/json.hpp"

#include "relay/config.hpp"

#include <array>
#include <charconv>
#include <cmath>
#include <cstdio>
#include <limits>
#include <optional>

namespace relay::json {

// ============================================================================
// Value
// ============================================================================

Value Value::boolean(bool b) {
    Value v;
    v.kind_ = Kind::Bool;
    v.bool_ = b;
    return v;
}

Value Value::integer(std::int64_t i) {
    Value v;
    v.kind_ = Kind::Integer;
    v.integer_ = i;
    return v;
}

Value Value::unsigned_integer(std::uint64_t u) {
    if (u <= static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
        return integer(static_cast<std::int64_t>(u));
    }
    Value v;
    v.kind_ = Kind::Unsigned;
    v.unsigned_ = u;
    return v;
}

Value Value::number(double d) {
    Value v;
    v.kind_ = Kind::Number;
    v.number_ = d;
    return v;
}

Value Value::string(std::string s) {
    Value v;
    v.kind_ = Kind::String;
    v.string_ = std::move(s);
    return v;
}

Value Value::array() {
    Value v;
    v.kind_ = Kind::Array;
    return v;
}

Value Value::object() {
    Value v;
    v.kind_ = Kind::Object;
    return v;
}

double Value::as_number() const noexcept {
    if (kind_ == Kind::Integer) {
        return static_cast<double>(integer_);
    }
    if (kind_ == Kind::Unsigned) {
        return static_cast<double>(unsigned_);
    }
    return number_;
}

const Value* Value::find(std::string_view key) const noexcept {
    if (kind_ != Kind::Object) {
        return nullptr;
    }
    for (const auto& member : object_) {
        if (member.first == key) {
            return &member.second;
        }
    }
    return nullptr;
}

Value& Value::set(std::string key, Value value) {
    object_.emplace_back(std::move(key), std::move(value));
    return *this;
}

Value& Value::push(Value value) {
    array_.push_back(std::move(value));
    return *this;
}

bool operator==(const Value& a, const Value& b) noexcept {
    if (a.kind_ != b.kind_) {
        return false;
    }
    switch (a.kind_) {
        case Kind::Null:    return true;
        case Kind::Bool:    return a.bool_ == b.bool_;
        case Kind::Integer: return a.integer_ == b.integer_;
        case Kind::Unsigned: return a.unsigned_ == b.unsigned_;
        case Kind::Number:  return a.number_ == b.number_;
        case Kind::String:  return a.string_ == b.string_;
        case Kind::Array:   return a.array_ == b.array_;
        case Kind::Object:  return a.object_ == b.object_;
    }
    return false;
}

namespace {

// ============================================================================
// Parser
//
// Recursive descent over a string_view. Depth is bounded so a hostile
// frame cannot exhaust the stack.
// ============================================================================

class JsonParser {
public:
    JsonParser(std::string_view input, std::size_t max_input_bytes) noexcept
        : input_(input), max_input_bytes_(max_input_bytes), pos_(0), depth_(0) {}

    ParseResult parse() {
        // Check size bound before any parsing
        if (input_.size() > max_input_bytes_) {
            return ParseError::InputTooLarge;
        }

        Value root;
        if (!parse_value(root)) {
            return error_;
        }

        // Only whitespace may follow the document
        skip_whitespace();
        if (pos_ != input_.size()) {
            return ParseError::InvalidJson;
        }
        return root;
    }

private:
    std::string_view input_;
    std::size_t max_input_bytes_;
    std::size_t pos_;
    std::size_t depth_;
    ParseError error_ = ParseError::InvalidJson;

    bool fail(ParseError e) noexcept {
        error_ = e;
        return false;
    }

    char peek() const noexcept {
        return (pos_ < input_.size()) ? input_[pos_] : '\0';
    }

    char advance() noexcept {
        return (pos_ < input_.size()) ? input_[pos_++] : '\0';
    }

    bool expect(char c) noexcept {
        if (pos_ < input_.size() && input_[pos_] == c) {
            ++pos_;
            return true;
        }
        return false;
    }

    void skip_whitespace() noexcept {
        while (pos_ < input_.size()) {
            char c = input_[pos_];
            if (c == ' ' || c == '\t' || c == '\n' || c == '\r') {
                ++pos_;
            } else {
                break;
            }
        }
    }

    bool parse_value(Value& out) {
        skip_whitespace();
        if (pos_ >= input_.size()) {
            return fail(ParseError::InvalidJson);
        }

        char c = peek();
        if (c == '{') {
            return parse_object(out);
        }
        if (c == '[') {
            return parse_array(out);
        }
        if (c == '"') {
            std::string s;
            if (!parse_string(s)) {
                return fail(ParseError::InvalidJson);
            }
            out = Value::string(std::move(s));
            return true;
        }
        if (c == '-' || (c >= '0' && c <= '9')) {
            return parse_number(out);
        }
        return parse_literal(out);
    }

    bool parse_object(Value& out) {
        if (!expect('{')) {
            return fail(ParseError::InvalidJson);
        }
        if (++depth_ > CodecLimits::kMaxNestingDepth) {
            return fail(ParseError::NestingTooDeep);
        }

        out = Value::object();

        skip_whitespace();
        if (expect('}')) {
            --depth_;
            return true;
        }

        while (true) {
            skip_whitespace();

            std::string key;
            if (!parse_string(key)) {
                return fail(ParseError::InvalidJson);
            }

            skip_whitespace();
            if (!expect(':')) {
                return fail(ParseError::InvalidJson);
            }

            Value member;
            if (!parse_value(member)) {
                return false;
            }
            out.set(std::move(key), std::move(member));

            skip_whitespace();
            if (expect('}')) {
                --depth_;
                return true;
            }
            if (!expect(',')) {
                return fail(ParseError::InvalidJson);
            }
        }
    }

    bool parse_array(Value& out) {
        if (!expect('[')) {
            return fail(ParseError::InvalidJson);
        }
        if (++depth_ > CodecLimits::kMaxNestingDepth) {
            return fail(ParseError::NestingTooDeep);
        }

        out = Value::array();

        skip_whitespace();
        if (expect(']')) {
            --depth_;
            return true;
        }

        while (true) {
            Value element;
            if (!parse_value(element)) {
                return false;
            }
            out.push(std::move(element));

            skip_whitespace();
            if (expect(']')) {
                --depth_;
                return true;
            }
            if (!expect(',')) {
                return fail(ParseError::InvalidJson);
            }
        }
    }

    std::optional<std::uint32_t> parse_hex4() noexcept {
        if (input_.size() - pos_ < 4) {
            return std::nullopt;
        }
        std::uint32_t cp = 0;
        for (int i = 0; i < 4; ++i) {
            char c = advance();
            cp <<= 4;
            if (c >= '0' && c <= '9') {
                cp |= static_cast<std::uint32_t>(c - '0');
            } else if (c >= 'a' && c <= 'f') {
                cp |= static_cast<std::uint32_t>(c - 'a' + 10);
            } else if (c >= 'A' && c <= 'F') {
                cp |= static_cast<std::uint32_t>(c - 'A' + 10);
            } else {
                return std::nullopt;
            }
        }
        return cp;
    }

    static void append_utf8(std::string& out, std::uint32_t cp) {
        if (cp < 0x80) {
            out.push_back(static_cast<char>(cp));
        } else if (cp < 0x800) {
            out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        } else if (cp < 0x10000) {
            out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        } else {
            out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        }
    }

    // Parse a JSON string, decoding escapes into out
    bool parse_string(std::string& out) {
        if (!expect('"')) {
            return false;
        }

        while (pos_ < input_.size()) {
            char c = advance();
            if (c == '"') {
                return true;
            }
            if (static_cast<unsigned char>(c) < 0x20) {
                return false;  // raw control characters are not allowed
            }
            if (c != '\\') {
                out.push_back(c);
                continue;
            }

            if (pos_ >= input_.size()) {
                return false;
            }
            char esc = advance();
            switch (esc) {
                case '"':  out.push_back('"'); break;
                case '\\': out.push_back('\\'); break;
                case '/':  out.push_back('/'); break;
                case 'b':  out.push_back('\b'); break;
                case 'f':  out.push_back('\f'); break;
                case 'n':  out.push_back('\n'); break;
                case 'r':  out.push_back('\r'); break;
                case 't':  out.push_back('\t'); break;
                case 'u': {
                    auto cp = parse_hex4();
                    if (!cp) {
                        return false;
                    }
                    if (*cp >= 0xD800 && *cp <= 0xDBFF) {
                        // High surrogate: a low surrogate must follow
                        if (!expect('\\') || !expect('u')) {
                            return false;
                        }
                        auto low = parse_hex4();
                        if (!low || *low < 0xDC00 || *low > 0xDFFF) {
                            return false;
                        }
                        *cp = 0x10000 + ((*cp - 0xD800) << 10) + (*low - 0xDC00);
                    } else if (*cp >= 0xDC00 && *cp <= 0xDFFF) {
                        return false;  // lone low surrogate
                    }
                    append_utf8(out, *cp);
                    break;
                }
                default:
                    return false;
            }
        }
        return false;  // Unterminated string
    }

    // Parse a JSON number (integer or floating point)
    bool parse_number(Value& out) noexcept {
        std::size_t start = pos_;
        bool integral = true;

        // Sign
        if (peek() == '-') {
            advance();
        }

        // Integer part: a single 0 or a non-zero digit followed by digits
        if (peek() == '0') {
            advance();
        } else if (peek() >= '1' && peek() <= '9') {
            while (peek() >= '0' && peek() <= '9') {
                advance();
            }
        } else {
            return fail(ParseError::InvalidJson);
        }

        // Fractional part
        if (peek() == '.') {
            integral = false;
            advance();
            if (!(peek() >= '0' && peek() <= '9')) {
                return fail(ParseError::InvalidJson);
            }
            while (peek() >= '0' && peek() <= '9') {
                advance();
            }
        }

        // Exponent
        if (peek() == 'e' || peek() == 'E') {
            integral = false;
            advance();
            if (peek() == '+' || peek() == '-') {
                advance();
            }
            if (!(peek() >= '0' && peek() <= '9')) {
                return fail(ParseError::InvalidJson);
            }
            while (peek() >= '0' && peek() <= '9') {
                advance();
            }
        }

        std::string_view num_str = input_.substr(start, pos_ - start);
        const char* first = num_str.data();
        const char* last = num_str.data() + num_str.size();

        if (integral) {
            std::int64_t value = 0;
            auto [ptr, ec] = std::from_chars(first, last, value);
            if (ec == std::errc{} && ptr == last) {
                out = Value::integer(value);
                return true;
            }
            if (*first != '-') {
                std::uint64_t wide = 0;
                auto [wptr, wec] = std::from_chars(first, last, wide);
                if (wec == std::errc{} && wptr == last) {
                    out = Value::unsigned_integer(wide);
                    return true;
                }
            }
            // Out of 64-bit range: fall through to double
        }

        double value = 0.0;
        auto [ptr, ec] = std::from_chars(first, last, value);
        if (ec != std::errc{} || ptr != last) {
            return fail(ParseError::InvalidJson);
        }
        out = Value::number(value);
        return true;
    }

    bool parse_literal(Value& out) noexcept {
        // true, false, null
        std::string_view rest = input_.substr(pos_);
        if (rest.starts_with("true")) {
            pos_ += 4;
            out = Value::boolean(true);
            return true;
        }
        if (rest.starts_with("false")) {
            pos_ += 5;
            out = Value::boolean(false);
            return true;
        }
        if (rest.starts_with("null")) {
            pos_ += 4;
            out = Value::null();
            return true;
        }
        return fail(ParseError::InvalidJson);
    }
};

// ============================================================================
// Writer
// ============================================================================

void write_string(const std::string& s, std::string& out) {
    out.push_back('"');
    for (char c : s) {
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\b': out += "\\b"; break;
            case '\f': out += "\\f"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x",
                                  static_cast<unsigned>(static_cast<unsigned char>(c)));
                    out += buf;
                } else {
                    out.push_back(c);
                }
        }
    }
    out.push_back('"');
}

void write_number(double d, std::string& out) {
    if (!std::isfinite(d)) {
        out += "null";  // JSON has no representation for NaN/Inf
        return;
    }
    std::array<char, 32> buf{};
    auto [ptr, ec] = std::to_chars(buf.data(), buf.data() + buf.size(), d);
    std::string_view text(buf.data(), static_cast<std::size_t>(ptr - buf.data()));
    out += text;
    // Keep the value a Number on re-parse
    if (text.find_first_of(".eE") == std::string_view::npos) {
        out += ".0";
    }
}

}  // namespace

ParseResult parse(std::string_view input, std::size_t max_input_bytes) {
    JsonParser parser(input, max_input_bytes);
    return parser.parse();
}

void dump_to(const Value& value, std::string& out) {
    switch (value.kind()) {
        case Kind::Null:
            out += "null";
            break;
        case Kind::Bool:
            out += value.as_bool() ? "true" : "false";
            break;
        case Kind::Integer:
            out += std::to_string(value.as_integer());
            break;
        case Kind::Unsigned:
            out += std::to_string(value.as_unsigned());
            break;
        case Kind::Number:
            write_number(value.as_number(), out);
            break;
        case Kind::String:
            write_string(value.as_string(), out);
            break;
        case Kind::Array: {
            out.push_back('[');
            bool first = true;
            for (const auto& element : value.as_array()) {
                if (!first) out.push_back(',');
                first = false;
                dump_to(element, out);
            }
            out.push_back(']');
            break;
        }
        case Kind::Object: {
            out.push_back('{');
            bool first = true;
            for (const auto& [key, member] : value.as_object()) {
                if (!first) out.push_back(',');
                first = false;
                write_string(key, out);
                out.push_back(':');
                dump_to(member, out);
            }
            out.push_back('}');
            break;
        }
    }
}

std::string dump(const Value& value) {
    std::string out;
    dump_to(value, out);
    return out;
}

const char* to_string(ParseError error) noexcept {
    switch (error) {
        case ParseError::InputTooLarge:  return "input too large";
        case ParseError::InvalidJson:    return "invalid json";
        case ParseError::NestingTooDeep: return "nesting too deep";
    }
    return "unknown";
}

}  // namespace relay::json
