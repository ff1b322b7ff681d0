// value.cpp - Value type utilities and JSON serialization

#include <json_edit/value.h>
#include <json_edit/builders.h>
#include <json_edit/serialization.h>

#include <array>
#include <charconv>   // for std::to_chars
#include <cmath>      // for std::isfinite
#include <cstdio>     // for std::snprintf
#include <cstdlib>    // for std::strtod
#include <sstream>    // for std::ostringstream
#include <stdexcept>  // for std::runtime_error

namespace json_edit {

std::string format_number(double value)
{
    if (!std::isfinite(value)) {
        return "null";
    }
    if (value == 0.0) {
        return "0";  // also covers -0
    }

    // Shortest round-trip digits, e.g. "1.2345e+02"
    std::array<char, 64> buf{};
    auto [end, ec] = std::to_chars(buf.data(), buf.data() + buf.size(), value,
                                   std::chars_format::scientific);
    if (ec != std::errc{}) {
        return "null";
    }
    std::string_view sci(buf.data(), static_cast<std::size_t>(end - buf.data()));

    const bool negative = sci.front() == '-';
    if (negative) sci.remove_prefix(1);

    const auto e_pos = sci.find('e');
    std::string digits;
    for (char c : sci.substr(0, e_pos)) {
        if (c != '.') digits += c;
    }
    const int exponent = std::stoi(std::string(sci.substr(e_pos + 1)));

    const int k = static_cast<int>(digits.size());
    const int n = exponent + 1;

    std::string result = negative ? "-" : "";
    if (k <= n && n <= 21) {
        result += digits;
        result.append(static_cast<std::size_t>(n - k), '0');
    } else if (0 < n && n <= 21) {
        result += digits.substr(0, static_cast<std::size_t>(n));
        result += '.';
        result += digits.substr(static_cast<std::size_t>(n));
    } else if (-6 < n && n <= 0) {
        result += "0.";
        result.append(static_cast<std::size_t>(-n), '0');
        result += digits;
    } else {
        result += digits[0];
        if (k > 1) {
            result += '.';
            result += digits.substr(1);
        }
        const int e = n - 1;
        result += e < 0 ? "e-" : "e+";
        result += std::to_string(e < 0 ? -e : e);
    }
    return result;
}

std::string value_to_string(const Value& val)
{
    return std::visit([](const auto& arg) -> std::string {
        using T = std::decay_t<decltype(arg)>;
        if constexpr (std::is_same_v<T, std::string>) {
            return "\"" + arg + "\"";
        } else if constexpr (std::is_same_v<T, bool>) {
            return arg ? "true" : "false";
        } else if constexpr (std::is_same_v<T, int64_t>) {
            return std::to_string(arg);
        } else if constexpr (std::is_same_v<T, double>) {
            return format_number(arg);
        } else if constexpr (std::is_same_v<T, ValueMap>) {
            return "{map:" + std::to_string(arg.size()) + "}";
        } else if constexpr (std::is_same_v<T, ValueVector>) {
            return "[vector:" + std::to_string(arg.size()) + "]";
        } else {
            return "null";
        }
    }, val.data);
}

std::string value_to_display_text(const Value& val)
{
    return std::visit([&](const auto& arg) -> std::string {
        using T = std::decay_t<decltype(arg)>;
        if constexpr (std::is_same_v<T, std::string>) {
            return arg;
        } else if constexpr (std::is_same_v<T, bool>) {
            return arg ? "true" : "false";
        } else if constexpr (std::is_same_v<T, int64_t>) {
            return std::to_string(arg);
        } else if constexpr (std::is_same_v<T, double>) {
            return format_number(arg);
        } else if constexpr (std::is_same_v<T, std::monostate>) {
            return "null";
        } else {
            return to_json(val, true);
        }
    }, val.data);
}

// ============================================================
// JSON Serialization / Deserialization Implementation
// ============================================================

std::string json_escape_string(const std::string& s)
{
    std::string result;
    result.reserve(s.size() + 16);

    for (std::size_t i = 0; i < s.size(); ++i) {
        const char c = s[i];
        // Lone surrogates (U+D800 to U+DFFF) are stored as ED A0-BF xx and
        // written back as escapes so the output stays valid UTF-8
        if (static_cast<unsigned char>(c) == 0xED && i + 2 < s.size() &&
            (static_cast<unsigned char>(s[i + 1]) & 0xE0) == 0xA0) {
            const unsigned codepoint = 0xD000 |
                ((static_cast<unsigned>(static_cast<unsigned char>(s[i + 1])) & 0x3F) << 6) |
                (static_cast<unsigned>(static_cast<unsigned char>(s[i + 2])) & 0x3F);
            char buf[7];
            std::snprintf(buf, sizeof(buf), "\\u%04x", codepoint);
            result += buf;
            i += 2;
            continue;
        }
        switch (c) {
            case '"':  result += "\\\""; break;
            case '\\': result += "\\\\"; break;
            case '\b': result += "\\b"; break;
            case '\f': result += "\\f"; break;
            case '\n': result += "\\n"; break;
            case '\r': result += "\\r"; break;
            case '\t': result += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    // Control characters as \uXXXX
                    char buf[7];
                    std::snprintf(buf, sizeof(buf), "\\u%04x",
                                  static_cast<unsigned int>(static_cast<unsigned char>(c)));
                    result += buf;
                } else {
                    result += c;
                }
        }
    }
    return result;
}

namespace {

void to_json_impl(const Value& val, std::ostringstream& oss, bool compact, int indent_level)
{
    const std::string indent = compact ? "" : std::string(indent_level * JSON_EDIT_INDENT_WIDTH, ' ');
    const std::string child_indent =
        compact ? "" : std::string((indent_level + 1) * JSON_EDIT_INDENT_WIDTH, ' ');
    const std::string newline = compact ? "" : "\n";
    const std::string space_after_colon = compact ? "" : " ";

    std::visit([&](const auto& arg) {
        using T = std::decay_t<decltype(arg)>;

        if constexpr (std::is_same_v<T, std::monostate>) {
            oss << "null";
        } else if constexpr (std::is_same_v<T, bool>) {
            oss << (arg ? "true" : "false");
        } else if constexpr (std::is_same_v<T, int64_t>) {
            oss << arg;
        } else if constexpr (std::is_same_v<T, double>) {
            oss << format_number(arg);
        } else if constexpr (std::is_same_v<T, std::string>) {
            oss << "\"" << json_escape_string(arg) << "\"";
        } else if constexpr (std::is_same_v<T, ValueMap>) {
            if (arg.empty()) {
                oss << "{}";
            } else {
                oss << "{" << newline;
                bool first = true;
                for (const auto& entry : arg) {
                    if (!first) oss << "," << newline;
                    first = false;
                    oss << child_indent << "\"" << json_escape_string(entry.key) << "\":"
                        << space_after_colon;
                    to_json_impl(entry.value.get(), oss, compact, indent_level + 1);
                }
                oss << newline << indent << "}";
            }
        } else if constexpr (std::is_same_v<T, ValueVector>) {
            if (arg.empty()) {
                oss << "[]";
            } else {
                oss << "[" << newline;
                bool first = true;
                for (const auto& v : arg) {
                    if (!first) oss << "," << newline;
                    first = false;
                    oss << child_indent;
                    to_json_impl(v.get(), oss, compact, indent_level + 1);
                }
                oss << newline << indent << "]";
            }
        }
    }, val.data);
}

// ============================================================
// JSON Parser (RFC 8259 grammar)
// ============================================================

class JsonParser {
public:
    explicit JsonParser(const std::string& json) : json_(json), pos_(0) {}

    std::optional<Value> parse(std::string* error_out) {
        try {
            skip_whitespace();
            if (pos_ >= json_.size()) {
                throw std::runtime_error("Empty JSON input");
            }
            Value result = parse_value();
            skip_whitespace();
            if (pos_ < json_.size()) {
                throw std::runtime_error("Unexpected trailing content at position " +
                                         std::to_string(pos_));
            }
            return result;
        } catch (const std::exception& e) {
            if (error_out) *error_out = e.what();
            return std::nullopt;
        }
    }

private:
    const std::string& json_;
    std::size_t pos_;
    std::size_t depth_ = 0;

    char peek() const {
        return pos_ < json_.size() ? json_[pos_] : '\0';
    }

    char consume() {
        return pos_ < json_.size() ? json_[pos_++] : '\0';
    }

    static bool is_digit(char c) {
        return c >= '0' && c <= '9';
    }

    void skip_whitespace() {
        while (pos_ < json_.size()) {
            const char c = json_[pos_];
            if (c != ' ' && c != '\t' && c != '\n' && c != '\r') break;
            ++pos_;
        }
    }

    void expect(char c) {
        skip_whitespace();
        if (consume() != c) {
            throw std::runtime_error(std::string("Expected '") + c + "' at position " +
                                     std::to_string(pos_));
        }
    }

    Value parse_value() {
        skip_whitespace();
        char c = peek();

        if (c == '{') return parse_object();
        if (c == '[') return parse_array();
        if (c == '"') return parse_string();
        if (c == 't' || c == 'f') return parse_bool();
        if (c == 'n') return parse_null();
        if (c == '-' || is_digit(c)) return parse_number();

        if (pos_ >= json_.size()) {
            throw std::runtime_error("Unexpected end of input");
        }
        throw std::runtime_error("Unexpected character '" + std::string(1, c) + "' at position " +
                                 std::to_string(pos_));
    }

    void enter_container() {
        if (++depth_ > JSON_EDIT_MAX_DEPTH) {
            throw std::runtime_error("Nesting deeper than " + std::to_string(JSON_EDIT_MAX_DEPTH) +
                                     " levels at position " + std::to_string(pos_));
        }
    }

    Value parse_object() {
        expect('{');
        enter_container();
        skip_whitespace();

        if (peek() == '}') {
            consume();
            --depth_;
            return Value{ValueMap{}};
        }

        auto transient = ValueMap{}.transient();

        while (true) {
            skip_whitespace();
            std::string key = parse_string_raw();
            expect(':');
            Value val = parse_value();
            // Duplicate keys: first position, last value
            transient.set(key, ValueBox{std::move(val)});

            skip_whitespace();
            char c = peek();
            if (c == '}') {
                consume();
                break;
            }
            if (c != ',') {
                throw std::runtime_error("Expected ',' or '}' in object at position " +
                                         std::to_string(pos_));
            }
            consume();
        }

        --depth_;
        return Value{transient.persistent()};
    }

    Value parse_array() {
        expect('[');
        enter_container();
        skip_whitespace();

        if (peek() == ']') {
            consume();
            --depth_;
            return Value{ValueVector{}};
        }

        auto transient = ValueVector{}.transient();

        while (true) {
            Value val = parse_value();
            transient.push_back(ValueBox{std::move(val)});

            skip_whitespace();
            char c = peek();
            if (c == ']') {
                consume();
                break;
            }
            if (c != ',') {
                throw std::runtime_error("Expected ',' or ']' in array at position " +
                                         std::to_string(pos_));
            }
            consume();
        }

        --depth_;
        return Value{transient.persistent()};
    }

    unsigned parse_hex4() {
        if (pos_ + 4 > json_.size()) {
            throw std::runtime_error("Invalid unicode escape");
        }
        unsigned code = 0;
        for (int i = 0; i < 4; ++i) {
            const char h = consume();
            code <<= 4;
            if (h >= '0' && h <= '9')      code |= static_cast<unsigned>(h - '0');
            else if (h >= 'a' && h <= 'f') code |= static_cast<unsigned>(h - 'a' + 10);
            else if (h >= 'A' && h <= 'F') code |= static_cast<unsigned>(h - 'A' + 10);
            else throw std::runtime_error("Invalid hex digit in unicode escape at position " +
                                          std::to_string(pos_ - 1));
        }
        return code;
    }

    static void append_utf8(std::string& out, unsigned codepoint) {
        if (codepoint < 0x80) {
            out += static_cast<char>(codepoint);
        } else if (codepoint < 0x800) {
            out += static_cast<char>(0xC0 | (codepoint >> 6));
            out += static_cast<char>(0x80 | (codepoint & 0x3F));
        } else if (codepoint < 0x10000) {
            out += static_cast<char>(0xE0 | (codepoint >> 12));
            out += static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F));
            out += static_cast<char>(0x80 | (codepoint & 0x3F));
        } else {
            out += static_cast<char>(0xF0 | (codepoint >> 18));
            out += static_cast<char>(0x80 | ((codepoint >> 12) & 0x3F));
            out += static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F));
            out += static_cast<char>(0x80 | (codepoint & 0x3F));
        }
    }

    std::string parse_string_raw() {
        expect('"');
        std::string result;

        while (pos_ < json_.size()) {
            char c = consume();
            if (c == '"') {
                return result;
            }
            if (static_cast<unsigned char>(c) < 0x20) {
                throw std::runtime_error("Unescaped control character in string at position " +
                                         std::to_string(pos_ - 1));
            }
            if (c == '\\') {
                if (pos_ >= json_.size()) {
                    throw std::runtime_error("Unexpected end of string escape");
                }
                char escaped = consume();
                switch (escaped) {
                    case '"':  result += '"'; break;
                    case '\\': result += '\\'; break;
                    case '/':  result += '/'; break;
                    case 'b':  result += '\b'; break;
                    case 'f':  result += '\f'; break;
                    case 'n':  result += '\n'; break;
                    case 'r':  result += '\r'; break;
                    case 't':  result += '\t'; break;
                    case 'u': {
                        unsigned codepoint = parse_hex4();
                        // Combine a UTF-16 surrogate pair; a lone surrogate is kept as-is
                        if (codepoint >= 0xD800 && codepoint <= 0xDBFF &&
                            json_.compare(pos_, 2, "\\u") == 0) {
                            const std::size_t save = pos_;
                            pos_ += 2;
                            const unsigned low = parse_hex4();
                            if (low >= 0xDC00 && low <= 0xDFFF) {
                                codepoint = 0x10000 + ((codepoint - 0xD800) << 10) + (low - 0xDC00);
                            } else {
                                pos_ = save;
                            }
                        }
                        append_utf8(result, codepoint);
                        break;
                    }
                    default:
                        throw std::runtime_error("Invalid escape sequence: \\" +
                                                 std::string(1, escaped));
                }
            } else {
                result += c;
            }
        }

        throw std::runtime_error("Unterminated string");
    }

    Value parse_string() {
        return Value{parse_string_raw()};
    }

    void expect_digits(const char* where) {
        if (!is_digit(peek())) {
            throw std::runtime_error(std::string("Expected digit in ") + where + " at position " +
                                     std::to_string(pos_));
        }
        while (is_digit(peek())) consume();
    }

    Value parse_number() {
        std::size_t start = pos_;
        bool is_integral = true;

        if (peek() == '-') consume();

        if (peek() == '0') {
            consume();
        } else {
            expect_digits("number");
        }
        if (peek() == '.') {
            consume();
            is_integral = false;
            expect_digits("fraction");
        }
        if (peek() == 'e' || peek() == 'E') {
            consume();
            is_integral = false;
            if (peek() == '+' || peek() == '-') consume();
            expect_digits("exponent");
        }

        std::string num_str = json_.substr(start, pos_ - start);

        if (is_integral) {
            try {
                return Value{static_cast<int64_t>(std::stoll(num_str))};
            } catch (const std::out_of_range&) {
                // Too large for int64_t: fall through to double
            }
        }
        // strtod saturates to +-HUGE_VAL instead of throwing
        return Value{std::strtod(num_str.c_str(), nullptr)};
    }

    Value parse_bool() {
        if (json_.compare(pos_, 4, "true") == 0) {
            pos_ += 4;
            return Value{true};
        }
        if (json_.compare(pos_, 5, "false") == 0) {
            pos_ += 5;
            return Value{false};
        }
        throw std::runtime_error("Expected 'true' or 'false' at position " + std::to_string(pos_));
    }

    Value parse_null() {
        if (json_.compare(pos_, 4, "null") == 0) {
            pos_ += 4;
            return Value{};
        }
        throw std::runtime_error("Expected 'null' at position " + std::to_string(pos_));
    }
};

} // anonymous namespace

std::string to_json(const Value& val, bool compact)
{
    std::ostringstream oss;
    to_json_impl(val, oss, compact, 0);
    return oss.str();
}

std::optional<Value> from_json(const std::string& json_str, std::string* error_out)
{
    JsonParser parser(json_str);
    return parser.parse(error_out);
}

// ============================================================
// Explicit Template Instantiations
//
// These instantiations generate the actual code for the templated classes
// that are declared with 'extern template' in value.h and builders.h.
// ============================================================

template struct BasicValue<unsafe_memory_policy>;
template class BasicValueMap<unsafe_memory_policy>;
template class BasicMapBuilder<unsafe_memory_policy>;
template class BasicVectorBuilder<unsafe_memory_policy>;

} // namespace json_edit
