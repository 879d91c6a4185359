#include "relay/config.hpp"
#include "relay/json.hpp"

#include <cstdio>
#include <cstdlib>
#include <string>
#include <string_view>
#include <variant>

// JSON value tree tests.
// Tests the parser bounds (size, depth) and writer determinism.

namespace {

bool is_error(const relay::json::ParseResult& r, relay::json::ParseError error) {
    if (const auto* e = std::get_if<relay::json::ParseError>(&r)) {
        return *e == error;
    }
    return false;
}

const relay::json::Value* get_value_if_success(const relay::json::ParseResult& r) {
    return std::get_if<relay::json::Value>(&r);
}

bool require_invalid(std::string_view input) {
    return is_error(relay::json::parse(input), relay::json::ParseError::InvalidJson);
}

std::string nested_arrays(std::size_t depth) {
    return std::string(depth, '[') + std::string(depth, ']');
}

} // namespace

int main() {
    using relay::json::Value;

    // =========================================================================
    // Success path tests
    // =========================================================================

    // Test 1: Scalars and kinds
    {
        auto r = relay::json::parse(R"({"a":null,"b":true,"c":-42,"d":1.5,"e":"x"})");
        const auto* v = get_value_if_success(r);
        if (v == nullptr || !v->is_object()) {
            std::printf("Scalar test failed: expected object\n");
            return EXIT_FAILURE;
        }
        if (!v->find("a")->is_null() || !v->find("b")->as_bool()) {
            std::printf("Scalar test failed: null/bool\n");
            return EXIT_FAILURE;
        }
        if (!v->find("c")->is_integer() || v->find("c")->as_integer() != -42) {
            std::printf("Scalar test failed: integer\n");
            return EXIT_FAILURE;
        }
        if (v->find("d")->is_integer() || v->find("d")->as_number() != 1.5) {
            std::printf("Scalar test failed: number\n");
            return EXIT_FAILURE;
        }
        if (v->find("e")->as_string() != "x" || v->find("missing") != nullptr) {
            std::printf("Scalar test failed: string/missing\n");
            return EXIT_FAILURE;
        }
    }

    // Test 2: Escapes decode to UTF-8, including surrogate pairs
    {
        auto r = relay::json::parse(R"(["a\"b\\c\/\n\t", "\u00e9", "\ud83d\ude00"])");
        const auto* v = get_value_if_success(r);
        if (v == nullptr || v->as_array().size() != 3) {
            std::printf("Escape test failed: expected 3-element array\n");
            return EXIT_FAILURE;
        }
        if (v->as_array()[0].as_string() != "a\"b\\c/\n\t") {
            std::printf("Escape test failed: simple escapes\n");
            return EXIT_FAILURE;
        }
        if (v->as_array()[1].as_string() != "\xC3\xA9") {
            std::printf("Escape test failed: \\u00e9\n");
            return EXIT_FAILURE;
        }
        if (v->as_array()[2].as_string() != "\xF0\x9F\x98\x80") {
            std::printf("Escape test failed: surrogate pair\n");
            return EXIT_FAILURE;
        }
    }

    // Test 3: Integers above INT64_MAX stay exact up to UINT64_MAX,
    // then fall back to Number
    {
        auto r = relay::json::parse(
            "[9223372036854775807, 9223372036854775808, 18446744073709551615, "
            "18446744073709551616, -9223372036854775809]");
        const auto* v = get_value_if_success(r);
        if (v == nullptr) {
            std::printf("Integer range test failed: expected success\n");
            return EXIT_FAILURE;
        }
        const auto& a = v->as_array();
        if (!a[0].is_integer() || !a[1].is_unsigned() || !a[2].is_unsigned() ||
            a[3].kind() != relay::json::Kind::Number || a[4].kind() != relay::json::Kind::Number) {
            std::printf("Integer range test failed: wrong kinds\n");
            return EXIT_FAILURE;
        }
        if (a[1].as_unsigned() != 9223372036854775808ULL ||
            a[2].as_unsigned() != 18446744073709551615ULL) {
            std::printf("Integer range test failed: wrong values\n");
            return EXIT_FAILURE;
        }
        std::string out = relay::json::dump(a[2]);
        if (out != "18446744073709551615") {
            std::printf("Unsigned writer test failed: %s\n", out.c_str());
            return EXIT_FAILURE;
        }
        // Small unsigned values normalize to Integer so trees compare equal
        if (!(Value::unsigned_integer(7) == Value::integer(7))) {
            std::printf("Unsigned normalization test failed\n");
            return EXIT_FAILURE;
        }
    }

    // Test 4: Surrounding whitespace is allowed
    {
        if (get_value_if_success(relay::json::parse(" \n\t{} \r\n")) == nullptr) {
            std::printf("Whitespace test failed\n");
            return EXIT_FAILURE;
        }
    }

    // =========================================================================
    // Malformed input tests
    // =========================================================================

    // Test 5: Syntax errors
    {
        const char* cases[] = {
            "",
            "not json",
            "{",
            "{\"a\":}",
            "{\"a\" 1}",
            "[1,]",
            "{\"a\":1,}",
            "01",
            "1.",
            "-",
            "1e",
            "\"unterminated",
            "\"bad \\x escape\"",
            "\"\\ud83d\"",          // lone high surrogate
            "\"raw\x01\"",
            "{} {}",
            "tru",
            "nul",
        };
        for (const char* input : cases) {
            if (!require_invalid(input)) {
                std::printf("Syntax error test failed for: %s\n", input);
                return EXIT_FAILURE;
            }
        }
    }

    // Test 6: Nesting limit
    {
        std::size_t limit = relay::CodecLimits::kMaxNestingDepth;
        if (get_value_if_success(relay::json::parse(nested_arrays(limit))) == nullptr) {
            std::printf("Nesting test failed: depth %zu should parse\n", limit);
            return EXIT_FAILURE;
        }
        if (!is_error(relay::json::parse(nested_arrays(limit + 1)),
                      relay::json::ParseError::NestingTooDeep)) {
            std::printf("Nesting test failed: depth %zu should be rejected\n", limit + 1);
            return EXIT_FAILURE;
        }
    }

    // Test 7: Input size limit applies only when requested
    {
        std::string big = "\"" + std::string(relay::CodecLimits::kMaxInputBytes, 'x') + "\"";
        if (!is_error(relay::json::parse(big, relay::CodecLimits::kMaxInputBytes),
                      relay::json::ParseError::InputTooLarge)) {
            std::printf("Size limit test failed\n");
            return EXIT_FAILURE;
        }
        auto unbounded = relay::json::parse(big);
        const auto* value = get_value_if_success(unbounded);
        if (value == nullptr || !value->is_string() ||
            value->as_string().size() != relay::CodecLimits::kMaxInputBytes) {
            std::printf("Unbounded parse test failed\n");
            return EXIT_FAILURE;
        }
    }

    // =========================================================================
    // Writer tests
    // =========================================================================

    // Test 8: Insertion order, no whitespace
    {
        Value obj = Value::object();
        obj.set("z", Value::integer(1));
        obj.set("a", Value::boolean(false));
        Value arr = Value::array();
        arr.push(Value::null());
        arr.push(Value::string("s"));
        obj.set("m", arr);
        std::string out = relay::json::dump(obj);
        if (out != R"({"z":1,"a":false,"m":[null,"s"]})") {
            std::printf("Writer order test failed: %s\n", out.c_str());
            return EXIT_FAILURE;
        }
    }

    // Test 9: Control characters are escaped and survive a re-parse
    {
        std::string text("tab\there\x01 \"q\" \\ end");
        std::string out = relay::json::dump(Value::string(text));
        if (out.find('\x01') != std::string::npos || out.find("\\u0001") == std::string::npos) {
            std::printf("Writer escape test failed: %s\n", out.c_str());
            return EXIT_FAILURE;
        }
        const auto r = relay::json::parse(out);
        const auto* v = get_value_if_success(r);
        if (v == nullptr || v->as_string() != text) {
            std::printf("Writer escape test failed: re-parse mismatch\n");
            return EXIT_FAILURE;
        }
    }

    // Test 10: Integral doubles stay Numbers after a re-parse
    {
        std::string out = relay::json::dump(Value::number(2.0));
        const auto r = relay::json::parse(out);
        const auto* v = get_value_if_success(r);
        if (v == nullptr || v->is_integer() || v->as_number() != 2.0) {
            std::printf("Writer number test failed: %s\n", out.c_str());
            return EXIT_FAILURE;
        }
    }

    // Test 11: Parsed trees compare equal to built trees
    {
        Value expected = Value::object();
        expected.set("k", Value::integer(7));
        const auto r = relay::json::parse(R"({"k":7})");
        const auto* v = get_value_if_success(r);
        if (v == nullptr || !(*v == expected)) {
            std::printf("Equality test failed\n");
            return EXIT_FAILURE;
        }
    }

    std::printf("All json tests passed\n");
    return EXIT_SUCCESS;
}
