#pragma once

#include "relay/config.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace relay::json {

// ============================================================================
// Minimal JSON value tree with bounded parsing and deterministic output.
//
// Invariants enforced:
// 1. Memory: input size bounded by the caller-supplied limit.
// 2. CPU: nesting bounded by CodecLimits::kMaxNestingDepth, work O(n).
// 3. Objects keep insertion order, so dump() output is deterministic.
// ============================================================================

enum class Kind : std::uint8_t {
    Null,
    Bool,
    Integer,   // number without fraction/exponent that fits std::int64_t
    Unsigned,  // integer above INT64_MAX that fits std::uint64_t
    Number,    // any other number
    String,
    Array,
    Object,
};

class Value {
public:
    using Array = std::vector<Value>;
    using Member = std::pair<std::string, Value>;
    using Object = std::vector<Member>;

    Value() = default;

    static Value null() { return Value{}; }
    static Value boolean(bool b);
    static Value integer(std::int64_t v);
    static Value unsigned_integer(std::uint64_t v);  // Integer when it fits
    static Value number(double v);
    static Value string(std::string s);
    static Value array();
    static Value object();

    [[nodiscard]] Kind kind() const noexcept { return kind_; }
    [[nodiscard]] bool is_null() const noexcept { return kind_ == Kind::Null; }
    [[nodiscard]] bool is_bool() const noexcept { return kind_ == Kind::Bool; }
    [[nodiscard]] bool is_integer() const noexcept { return kind_ == Kind::Integer; }
    [[nodiscard]] bool is_unsigned() const noexcept { return kind_ == Kind::Unsigned; }
    [[nodiscard]] bool is_number() const noexcept {
        return kind_ == Kind::Integer || kind_ == Kind::Unsigned || kind_ == Kind::Number;
    }
    [[nodiscard]] bool is_string() const noexcept { return kind_ == Kind::String; }
    [[nodiscard]] bool is_array() const noexcept { return kind_ == Kind::Array; }
    [[nodiscard]] bool is_object() const noexcept { return kind_ == Kind::Object; }

    // Accessors assume the matching kind; check kind() first.
    [[nodiscard]] bool as_bool() const noexcept { return bool_; }
    [[nodiscard]] std::int64_t as_integer() const noexcept { return integer_; }
    [[nodiscard]] std::uint64_t as_unsigned() const noexcept { return unsigned_; }
    [[nodiscard]] double as_number() const noexcept;
    [[nodiscard]] const std::string& as_string() const noexcept { return string_; }
    [[nodiscard]] const Array& as_array() const noexcept { return array_; }
    [[nodiscard]] const Object& as_object() const noexcept { return object_; }

    // Object lookup (first member with this key), nullptr if absent
    // or if this value is not an object.
    [[nodiscard]] const Value* find(std::string_view key) const noexcept;

    // Append a member (object) or element (array).
    Value& set(std::string key, Value value);
    Value& push(Value value);

    friend bool operator==(const Value& a, const Value& b) noexcept;

private:
    Kind kind_ = Kind::Null;
    bool bool_ = false;
    std::int64_t integer_ = 0;
    std::uint64_t unsigned_ = 0;
    double number_ = 0.0;
    std::string string_;
    Array array_;
    Object object_;
};

// Parse failures (explicit enum, not attacker-controlled)
enum class ParseError : std::uint8_t {
    InputTooLarge,   // exceeds the caller-supplied input limit
    InvalidJson,     // malformed syntax or trailing junk
    NestingTooDeep,  // exceeds CodecLimits::kMaxNestingDepth
};

using ParseResult = std::variant<Value, ParseError>;

// Parse a complete JSON document.
//
// Contract:
// - Never throws on malformed input (allocation failure still propagates)
// - Whole input must be consumed (only whitespace may follow the value)
// - String escapes (including \uXXXX surrogate pairs) decode to UTF-8
// - Input longer than max_input_bytes fails with InputTooLarge
ParseResult parse(std::string_view input,
                  std::size_t max_input_bytes = CodecLimits::kUnboundedInput);

// Serialize with no insignificant whitespace.
std::string dump(const Value& value);
void dump_to(const Value& value, std::string& out);

const char* to_string(ParseError error) noexcept;

}  // namespace relay::json
