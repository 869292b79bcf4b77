// serialization.cpp - JSON writer and parser

#include <treepatch/serialization.h>
#include <treepatch/builders.h>

#include <cctype>
#include <charconv>
#include <cmath>
#include <cstdio>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace treepatch {

namespace {

// JSON escape special characters in strings
std::string json_escape_string(const std::string& s) {
    std::string result;
    // Pre-allocate with some extra space for potential escapes
    result.reserve(s.size() + 16);

    for (char c : s) {
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

void write_double(double d, std::ostringstream& oss) {
    if (!std::isfinite(d)) {
        oss << "null";
        return;
    }
    std::ostringstream num;
    num << std::setprecision(17) << d;
    std::string text = num.str();
    // Keep it a double on the way back in
    if (text.find_first_of(".eE") == std::string::npos) {
        text += ".0";
    }
    oss << text;
}

void to_json_impl(const Value& val, std::ostringstream& oss, bool compact, int indent_level) {
    const std::string indent = compact ? "" : std::string(indent_level * 2, ' ');
    const std::string child_indent = compact ? "" : std::string((indent_level + 1) * 2, ' ');
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
            write_double(arg, oss);
        } else if constexpr (std::is_same_v<T, std::string>) {
            oss << "\"" << json_escape_string(arg) << "\"";
        } else if constexpr (std::is_same_v<T, ValueMap>) {
            if (arg.size() == 0) {
                oss << "{}";
            } else {
                oss << "{" << newline;
                bool first = true;
                for (const auto& [k, v] : arg) {
                    if (!first) oss << "," << newline;
                    first = false;
                    oss << child_indent << "\"" << json_escape_string(k) << "\":" << space_after_colon;
                    to_json_impl(*v, oss, compact, indent_level + 1);
                }
                oss << newline << indent << "}";
            }
        } else if constexpr (std::is_same_v<T, ValueVector>) {
            if (arg.size() == 0) {
                oss << "[]";
            } else {
                oss << "[" << newline;
                bool first = true;
                for (const auto& v : arg) {
                    if (!first) oss << "," << newline;
                    first = false;
                    oss << child_indent;
                    to_json_impl(*v, oss, compact, indent_level + 1);
                }
                oss << newline << indent << "]";
            }
        }
    }, val.data);
}

// ============================================================
// JSON Parser
// ============================================================

class JsonParser {
public:
    explicit JsonParser(std::string_view json) : json_(json), pos_(0) {}

    Value parse(std::string* error_out) {
        try {
            skip_whitespace();
            if (pos_ >= json_.size()) {
                if (error_out) *error_out = "Empty JSON input";
                return Value{};
            }
            Value result = parse_value(0);
            skip_whitespace();
            if (pos_ < json_.size()) {
                throw std::runtime_error("Unexpected trailing content at position " + std::to_string(pos_));
            }
            return result;
        } catch (const std::exception& e) {
            if (error_out) *error_out = e.what();
            detail::log_access_error("from_json", e.what());
            return Value{};
        }
    }

private:
    std::string_view json_;
    std::size_t pos_;

    char peek() const {
        return pos_ < json_.size() ? json_[pos_] : '\0';
    }

    char consume() {
        return pos_ < json_.size() ? json_[pos_++] : '\0';
    }

    void skip_whitespace() {
        while (pos_ < json_.size() && std::isspace(static_cast<unsigned char>(json_[pos_]))) {
            ++pos_;
        }
    }

    void expect(char c) {
        skip_whitespace();
        if (consume() != c) {
            throw std::runtime_error(std::string("Expected '") + c + "' at position " + std::to_string(pos_));
        }
    }

    Value parse_value(std::size_t depth) {
        if (depth > TREEPATCH_MAX_DEPTH) {
            throw std::runtime_error("Nesting deeper than " + std::to_string(TREEPATCH_MAX_DEPTH) +
                                     " at position " + std::to_string(pos_));
        }

        skip_whitespace();
        char c = peek();

        if (c == '{') return parse_object(depth);
        if (c == '[') return parse_array(depth);
        if (c == '"') return parse_string();
        if (c == 't' || c == 'f') return parse_bool();
        if (c == 'n') return parse_null();
        if (c == '-' || std::isdigit(static_cast<unsigned char>(c))) return parse_number();

        throw std::runtime_error("Unexpected character '" + std::string(1, c) + "' at position " + std::to_string(pos_));
    }

    Value parse_object(std::size_t depth) {
        expect('{');
        skip_whitespace();

        if (peek() == '}') {
            consume();
            return Value{ValueMap{}};
        }

        // Duplicate keys: the last value wins, the first position is kept
        MapBuilder builder;

        while (true) {
            skip_whitespace();
            std::string key = parse_string_raw();
            expect(':');
            Value val = parse_value(depth + 1);
            builder.set(key, std::move(val));

            skip_whitespace();
            char c = peek();
            if (c == '}') {
                consume();
                break;
            }
            if (c != ',') {
                throw std::runtime_error("Expected ',' or '}' in object at position " + std::to_string(pos_));
            }
            consume();
        }

        return builder.finish();
    }

    Value parse_array(std::size_t depth) {
        expect('[');
        skip_whitespace();

        if (peek() == ']') {
            consume();
            return Value{ValueVector{}};
        }

        VectorBuilder builder;

        while (true) {
            builder.push_back(parse_value(depth + 1));

            skip_whitespace();
            char c = peek();
            if (c == ']') {
                consume();
                break;
            }
            if (c != ',') {
                throw std::runtime_error("Expected ',' or ']' in array at position " + std::to_string(pos_));
            }
            consume();
        }

        return builder.finish();
    }

    unsigned parse_hex4() {
        if (pos_ + 4 > json_.size()) {
            throw std::runtime_error("Invalid unicode escape");
        }
        unsigned codepoint = 0;
        auto [end, ec] = std::from_chars(json_.data() + pos_, json_.data() + pos_ + 4, codepoint, 16);
        if (ec != std::errc{} || end != json_.data() + pos_ + 4) {
            throw std::runtime_error("Invalid unicode escape at position " + std::to_string(pos_));
        }
        pos_ += 4;
        return codepoint;
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
                        if (codepoint >= 0xDC00 && codepoint < 0xE000) {
                            throw std::runtime_error("Invalid surrogate at position " + std::to_string(pos_));
                        }
                        // Surrogate pair
                        if (codepoint >= 0xD800 && codepoint < 0xDC00) {
                            if (json_.substr(pos_, 2) != "\\u") {
                                throw std::runtime_error("Invalid surrogate at position " + std::to_string(pos_));
                            }
                            pos_ += 2;
                            unsigned low = parse_hex4();
                            if (low < 0xDC00 || low >= 0xE000) {
                                throw std::runtime_error("Invalid surrogate pair at position " + std::to_string(pos_));
                            }
                            codepoint = 0x10000 + ((codepoint - 0xD800) << 10) + (low - 0xDC00);
                        }
                        append_utf8(result, codepoint);
                        break;
                    }
                    default:
                        throw std::runtime_error("Invalid escape sequence: \\" + std::string(1, escaped));
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

    void consume_digits(const char* what, std::size_t start) {
        if (!std::isdigit(static_cast<unsigned char>(peek()))) {
            throw std::runtime_error(std::string("Expected digit ") + what + " at position " + std::to_string(start));
        }
        while (std::isdigit(static_cast<unsigned char>(peek()))) {
            consume();
        }
    }

    Value parse_number() {
        std::size_t start = pos_;
        bool has_decimal = false;
        bool has_exponent = false;

        if (peek() == '-') consume();

        // Integer part: a lone 0 or a non-zero digit run
        if (peek() == '0') {
            consume();
            if (std::isdigit(static_cast<unsigned char>(peek()))) {
                throw std::runtime_error("Leading zero in number at position " + std::to_string(start));
            }
        } else {
            consume_digits("in number", start);
        }

        if (peek() == '.') {
            has_decimal = true;
            consume();
            consume_digits("after decimal point", start);
        }

        if (peek() == 'e' || peek() == 'E') {
            has_exponent = true;
            consume();
            if (peek() == '+' || peek() == '-') consume();
            consume_digits("in exponent", start);
        }

        const std::string num_str{json_.substr(start, pos_ - start)};

        if (!has_decimal && !has_exponent) {
            int64_t val = 0;
            auto [end, ec] = std::from_chars(num_str.data(), num_str.data() + num_str.size(), val);
            if (ec == std::errc{} && end == num_str.data() + num_str.size()) {
                return Value{val};
            }
            // Out of int64 range: fall through to double
        }

        try {
            std::size_t used = 0;
            double d = std::stod(num_str, &used);
            if (used != num_str.size()) {
                throw std::runtime_error("Invalid number '" + num_str + "'");
            }
            return Value{d};
        } catch (const std::out_of_range&) {
            throw std::runtime_error("Number out of range '" + num_str + "'");
        } catch (const std::invalid_argument&) {
            throw std::runtime_error("Invalid number '" + num_str + "'");
        }
    }

    Value parse_bool() {
        if (json_.substr(pos_, 4) == "true") {
            pos_ += 4;
            return Value{true};
        }
        if (json_.substr(pos_, 5) == "false") {
            pos_ += 5;
            return Value{false};
        }
        throw std::runtime_error("Expected 'true' or 'false' at position " + std::to_string(pos_));
    }

    Value parse_null() {
        if (json_.substr(pos_, 4) == "null") {
            pos_ += 4;
            return Value{};
        }
        throw std::runtime_error("Expected 'null' at position " + std::to_string(pos_));
    }
};

} // anonymous namespace

std::string to_json(const Value& val, bool compact) {
    std::ostringstream oss;
    to_json_impl(val, oss, compact, 0);
    return oss.str();
}

Value from_json(std::string_view json_str, std::string* error_out) {
    JsonParser parser(json_str);
    return parser.parse(error_out);
}

} // namespace treepatch
