#include "chunknet/protocol/Json.hpp"

#include <cctype>
#include <cerrno>
#include <charconv>
#include <cstdlib>
#include <iomanip>
#include <sstream>

namespace chunknet::json {

namespace {

constexpr std::size_t kMaxDepth = 64;

class Parser {
public:
    explicit Parser(std::string_view text) : text_(text) {}

    Value parse_document() {
        skip_whitespace();
        Value value = parse_value(0);
        skip_whitespace();
        if (!at_end()) {
            fail("Unexpected trailing content");
        }
        return value;
    }

private:
    std::string_view text_;
    std::size_t position_{0};

    [[noreturn]] void fail(const std::string& message) const {
        throw ParseError(message, position_);
    }

    bool at_end() const { return position_ >= text_.size(); }

    char peek() const { return at_end() ? '\0' : text_[position_]; }

    char get() { return at_end() ? '\0' : text_[position_++]; }

    void skip_whitespace() {
        while (!at_end()) {
            const char ch = peek();
            if (ch != ' ' && ch != '\n' && ch != '\r' && ch != '\t') {
                break;
            }
            ++position_;
        }
    }

    Value parse_value(std::size_t depth) {
        if (depth > kMaxDepth) {
            fail("Nesting too deep");
        }
        skip_whitespace();
        if (at_end()) {
            fail("Unexpected end of input");
        }

        const char ch = peek();
        if (ch == '{') {
            return parse_object(depth);
        }
        if (ch == '[') {
            return parse_array(depth);
        }
        if (ch == '"') {
            return Value(parse_string());
        }
        if (ch == 't' || ch == 'f') {
            return Value(parse_boolean());
        }
        if (ch == 'n') {
            expect_literal("null");
            return Value();
        }
        if (ch == '-' || std::isdigit(static_cast<unsigned char>(ch))) {
            return parse_number();
        }
        fail("Unexpected token");
    }

    Value parse_object(std::size_t depth) {
        Value object = Value::make_object();
        get();
        skip_whitespace();
        if (peek() == '}') {
            get();
            return object;
        }

        auto& fields = object.as_object();
        while (true) {
            skip_whitespace();
            if (peek() != '"') {
                fail("Expected string key");
            }
            std::string key = parse_string();
            skip_whitespace();
            if (get() != ':') {
                fail("Expected ':' after key");
            }
            fields.insert_or_assign(std::move(key), parse_value(depth + 1));

            skip_whitespace();
            const char ch = get();
            if (ch == '}') {
                break;
            }
            if (ch != ',') {
                fail("Expected ',' or '}' in object");
            }
        }
        return object;
    }

    Value parse_array(std::size_t depth) {
        Value array = Value::make_array();
        get();
        skip_whitespace();
        if (peek() == ']') {
            get();
            return array;
        }

        auto& elements = array.as_array();
        while (true) {
            elements.push_back(parse_value(depth + 1));
            skip_whitespace();
            const char ch = get();
            if (ch == ']') {
                break;
            }
            if (ch != ',') {
                fail("Expected ',' or ']' in array");
            }
        }
        return array;
    }

    std::string parse_string() {
        get();
        std::string result;
        while (!at_end()) {
            const char ch = get();
            if (ch == '"') {
                return result;
            }
            if (ch != '\\') {
                if (static_cast<unsigned char>(ch) < 0x20) {
                    fail("Unescaped control character in string");
                }
                result.push_back(ch);
                continue;
            }

            const char esc = get();
            switch (esc) {
                case '"':
                case '\\':
                case '/':
                    result.push_back(esc);
                    break;
                case 'b':
                    result.push_back('\b');
                    break;
                case 'f':
                    result.push_back('\f');
                    break;
                case 'n':
                    result.push_back('\n');
                    break;
                case 'r':
                    result.push_back('\r');
                    break;
                case 't':
                    result.push_back('\t');
                    break;
                case 'u':
                    append_utf8(result, parse_code_point());
                    break;
                default:
                    fail("Unsupported escape sequence");
            }
        }
        fail("Unterminated string");
    }

    // A \u escape, joining a high/low surrogate pair into one code point.
    unsigned int parse_code_point() {
        const auto unit = parse_code_unit();
        if (unit >= 0xDC00 && unit <= 0xDFFF) {
            fail("Unpaired low surrogate in unicode escape");
        }
        if (unit < 0xD800 || unit > 0xDBFF) {
            return unit;
        }
        if (position_ + 2 > text_.size() || text_[position_] != '\\' || text_[position_ + 1] != 'u') {
            fail("Unpaired high surrogate in unicode escape");
        }
        position_ += 2;
        const auto low = parse_code_unit();
        if (low < 0xDC00 || low > 0xDFFF) {
            fail("Invalid low surrogate in unicode escape");
        }
        return 0x10000 + ((unit - 0xD800) << 10) + (low - 0xDC00);
    }

    unsigned int parse_code_unit() {
        if (position_ + 4 > text_.size()) {
            fail("Incomplete unicode escape");
        }
        unsigned int code_point = 0;
        for (int i = 0; i < 4; ++i) {
            const char ch = text_[position_++];
            code_point <<= 4;
            if (ch >= '0' && ch <= '9') {
                code_point += static_cast<unsigned int>(ch - '0');
            } else if (ch >= 'a' && ch <= 'f') {
                code_point += 10u + static_cast<unsigned int>(ch - 'a');
            } else if (ch >= 'A' && ch <= 'F') {
                code_point += 10u + static_cast<unsigned int>(ch - 'A');
            } else {
                fail("Invalid hex digit in unicode escape");
            }
        }
        return code_point;
    }

    static void append_utf8(std::string& out, unsigned int code_point) {
        if (code_point <= 0x7F) {
            out.push_back(static_cast<char>(code_point));
        } else if (code_point <= 0x7FF) {
            out.push_back(static_cast<char>(0xC0 | ((code_point >> 6) & 0x1F)));
            out.push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
        } else if (code_point <= 0xFFFF) {
            out.push_back(static_cast<char>(0xE0 | ((code_point >> 12) & 0x0F)));
            out.push_back(static_cast<char>(0x80 | ((code_point >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
        } else {
            out.push_back(static_cast<char>(0xF0 | ((code_point >> 18) & 0x07)));
            out.push_back(static_cast<char>(0x80 | ((code_point >> 12) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | ((code_point >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
        }
    }

    Value parse_number() {
        const std::size_t start = position_;
        if (peek() == '-') {
            ++position_;
        }
        if (!std::isdigit(static_cast<unsigned char>(peek()))) {
            fail("Invalid number");
        }
        while (std::isdigit(static_cast<unsigned char>(peek()))) {
            ++position_;
        }
        bool fractional = false;
        if (peek() == '.') {
            fractional = true;
            ++position_;
            while (std::isdigit(static_cast<unsigned char>(peek()))) {
                ++position_;
            }
        }
        if (peek() == 'e' || peek() == 'E') {
            fractional = true;
            ++position_;
            if (peek() == '+' || peek() == '-') {
                ++position_;
            }
            while (std::isdigit(static_cast<unsigned char>(peek()))) {
                ++position_;
            }
        }

        const std::string token(text_.substr(start, position_ - start));
        if (fractional) {
            char* end = nullptr;
            errno = 0;
            const double value = std::strtod(token.c_str(), &end);
            if (end != token.c_str() + token.size() || errno == ERANGE) {
                fail("Invalid floating point number");
            }
            return Value(value);
        }

        std::int64_t value{};
        const auto result = std::from_chars(token.data(), token.data() + token.size(), value);
        if (result.ec != std::errc{}) {
            fail("Invalid integer");
        }
        return Value(value);
    }

    bool parse_boolean() {
        if (text_.substr(position_).starts_with("true")) {
            position_ += 4;
            return true;
        }
        expect_literal("false");
        return false;
    }

    void expect_literal(std::string_view literal) {
        if (!text_.substr(position_).starts_with(literal)) {
            fail("Invalid literal");
        }
        position_ += literal.size();
    }
};

void write_string(std::ostringstream& out, const std::string& value) {
    out << '"';
    for (const unsigned char ch : value) {
        switch (ch) {
            case '"':
                out << "\\\"";
                break;
            case '\\':
                out << "\\\\";
                break;
            case '\n':
                out << "\\n";
                break;
            case '\r':
                out << "\\r";
                break;
            case '\t':
                out << "\\t";
                break;
            default:
                if (ch < 0x20) {
                    out << "\\u" << std::hex << std::setw(4) << std::setfill('0') << static_cast<int>(ch) << std::dec;
                } else {
                    out << static_cast<char>(ch);
                }
                break;
        }
    }
    out << '"';
}

void write_value(std::ostringstream& out, const Value& value, int indent, int level) {
    const bool pretty = indent >= 0;
    auto newline = [&](int depth) {
        if (pretty) {
            out << '\n' << std::string(static_cast<std::size_t>(indent * depth), ' ');
        }
    };

    switch (value.type) {
        case ValueType::Null:
            out << "null";
            break;
        case ValueType::Boolean:
            out << (value.boolean_value ? "true" : "false");
            break;
        case ValueType::Integer:
            out << value.integer_value;
            break;
        case ValueType::Double:
            out << std::setprecision(17) << value.double_value;
            break;
        case ValueType::String:
            write_string(out, value.string_value);
            break;
        case ValueType::Object: {
            if (value.object_value.empty()) {
                out << "{}";
                break;
            }
            out << '{';
            bool first = true;
            for (const auto& [key, member] : value.object_value) {
                if (!first) {
                    out << ',';
                }
                first = false;
                newline(level + 1);
                write_string(out, key);
                out << (pretty ? ": " : ":");
                write_value(out, member, indent, level + 1);
            }
            newline(level);
            out << '}';
            break;
        }
        case ValueType::Array: {
            if (value.array_value.empty()) {
                out << "[]";
                break;
            }
            out << '[';
            bool first = true;
            for (const auto& element : value.array_value) {
                if (!first) {
                    out << ',';
                }
                first = false;
                newline(level + 1);
                write_value(out, element, indent, level + 1);
            }
            newline(level);
            out << ']';
            break;
        }
    }
}

}  // namespace

const Value* Value::find(const std::string& key) const {
    if (type != ValueType::Object) {
        return nullptr;
    }
    const auto it = object_value.find(key);
    return it == object_value.end() ? nullptr : &it->second;
}

std::optional<std::int64_t> Value::as_int64() const {
    if (type == ValueType::Integer) {
        return integer_value;
    }
    if (type == ValueType::Double) {
        return static_cast<std::int64_t>(double_value);
    }
    return std::nullopt;
}

Value parse(std::string_view text) {
    return Parser(text).parse_document();
}

std::optional<Value> try_parse(std::string_view text) {
    try {
        return parse(text);
    } catch (const ParseError&) {
        return std::nullopt;
    }
}

std::string dump(const Value& value, int indent) {
    std::ostringstream out;
    write_value(out, value, indent, 0);
    return out.str();
}

}  // namespace chunknet::json
