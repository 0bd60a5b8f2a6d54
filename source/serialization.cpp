// serialization.cpp - JSON text <-> Value

#include <json_delta/serialization.h>
#include <json_delta/builders.h>

#include <charconv>
#include <cmath>
#include <cstdio>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace json_delta {

namespace {

// ============================================================
// Writer
// ============================================================

void write_string(std::ostringstream& oss, const std::string& s)
{
    oss << '"';
    for (char c : s) {
        switch (c) {
            case '"':  oss << "\\\""; break;
            case '\\': oss << "\\\\"; break;
            case '\b': oss << "\\b"; break;
            case '\f': oss << "\\f"; break;
            case '\n': oss << "\\n"; break;
            case '\r': oss << "\\r"; break;
            case '\t': oss << "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[7];
                    std::snprintf(buf, sizeof(buf), "\\u%04x",
                                  static_cast<unsigned int>(static_cast<unsigned char>(c)));
                    oss << buf;
                } else {
                    oss << c;
                }
        }
    }
    oss << '"';
}

/// Shortest text that reads back as the same double
void write_number(std::ostringstream& oss, double v)
{
    char buf[32];
    auto [end, ec] = std::to_chars(buf, buf + sizeof(buf), v);
    if (ec != std::errc{}) {
        throw std::runtime_error("cannot format number");
    }
    oss.write(buf, end - buf);
}

class Writer {
public:
    explicit Writer(bool compact) : compact_(compact) {}

    std::string str() const { return out_.str(); }

    void write(const Value& val, int depth)
    {
        std::visit([&](const auto& arg) {
            using T = std::decay_t<decltype(arg)>;

            if constexpr (std::is_same_v<T, std::monostate>) {
                out_ << "null";
            } else if constexpr (std::is_same_v<T, bool>) {
                out_ << (arg ? "true" : "false");
            } else if constexpr (std::is_same_v<T, double>) {
                // NaN and infinities have no JSON spelling
                if (std::isfinite(arg)) {
                    write_number(out_, arg);
                } else {
                    out_ << "null";
                }
            } else if constexpr (std::is_same_v<T, std::string>) {
                write_string(out_, arg);
            } else if constexpr (std::is_same_v<T, ValueArray>) {
                write_container('[', ']', arg, depth, [&](const ValueBox& element) {
                    write(element.get(), depth + 1);
                });
            } else if constexpr (std::is_same_v<T, ValueMap>) {
                write_container('{', '}', arg, depth, [&](const auto& member) {
                    write_string(out_, member.first);
                    out_ << (compact_ ? ":" : ": ");
                    write(member.second.get(), depth + 1);
                });
            }
        }, val.data);
    }

private:
    template <typename Container, typename Fn>
    void write_container(char open, char close, const Container& items, int depth, Fn&& write_item)
    {
        out_ << open;
        if (items.size() == 0) {
            out_ << close;
            return;
        }
        bool first = true;
        for (const auto& item : items) {
            if (!first) out_ << ',';
            first = false;
            newline(depth + 1);
            write_item(item);
        }
        newline(depth);
        out_ << close;
    }

    void newline(int depth)
    {
        if (!compact_) {
            out_ << '\n' << std::string(static_cast<std::size_t>(depth) * 2, ' ');
        }
    }

    std::ostringstream out_;
    bool compact_;
};

// ============================================================
// Parser (RFC 8259)
// ============================================================

void append_utf8(std::string& out, std::uint32_t codepoint)
{
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

/// Power of ten of the leading significant digit of a grammar-checked
/// number literal, e.g. 0 for "1.5", -3 for "0.00123", 2 for "1e2".
long long decimal_magnitude(std::string_view literal)
{
    constexpr long long kClamp = std::numeric_limits<long long>::max() / 4;

    long long exponent = 0;
    const auto exp_pos = literal.find_first_of("eE");
    if (exp_pos != std::string_view::npos) {
        auto digits = literal.substr(exp_pos + 1);
        const bool negative = !digits.empty() && digits.front() == '-';
        if (!digits.empty() && (digits.front() == '-' || digits.front() == '+')) {
            digits.remove_prefix(1);
        }
        auto [end, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), exponent);
        if (ec != std::errc{} || exponent > kClamp) {
            exponent = kClamp;
        }
        if (negative) exponent = -exponent;
        literal = literal.substr(0, exp_pos);
    }

    if (!literal.empty() && literal.front() == '-') {
        literal.remove_prefix(1);
    }
    const auto dot = literal.find('.');
    const auto integer = literal.substr(0, dot);
    const auto fraction = dot == std::string_view::npos ? std::string_view{} : literal.substr(dot + 1);

    if (const auto first = integer.find_first_not_of('0'); first != std::string_view::npos) {
        return static_cast<long long>(integer.size() - first) - 1 + exponent;
    }
    if (const auto first = fraction.find_first_not_of('0'); first != std::string_view::npos) {
        return -static_cast<long long>(first) - 1 + exponent;
    }
    return 0;
}

class JsonParser {
public:
    explicit JsonParser(std::string_view text) : text_(text) {}

    Value parse(std::string* error_out)
    {
        try {
            skip_whitespace();
            if (at_end()) {
                fail("empty JSON input");
            }
            Value result = parse_value(0);
            skip_whitespace();
            if (!at_end()) {
                fail("unexpected trailing characters");
            }
            if (error_out) error_out->clear();
            return result;
        } catch (const std::runtime_error& e) {
            if (error_out) *error_out = e.what();
            return Value{};
        }
    }

private:
    // Bounds recursion on hostile input
    static constexpr int kMaxDepth = 512;

    std::string_view text_;
    std::size_t pos_ = 0;

    bool at_end() const { return pos_ >= text_.size(); }
    char peek() const { return at_end() ? '\0' : text_[pos_]; }

    [[noreturn]] void fail(const std::string& what) const
    {
        std::size_t line = 1;
        std::size_t column = 1;
        for (std::size_t i = 0; i < pos_ && i < text_.size(); ++i) {
            if (text_[i] == '\n') {
                ++line;
                column = 1;
            } else {
                ++column;
            }
        }
        throw std::runtime_error(what + " at line " + std::to_string(line) +
                                 ", column " + std::to_string(column));
    }

    void skip_whitespace()
    {
        while (!at_end()) {
            char c = text_[pos_];
            if (c != ' ' && c != '\t' && c != '\n' && c != '\r') break;
            ++pos_;
        }
    }

    void expect(char c)
    {
        skip_whitespace();
        if (peek() != c) {
            fail(std::string("expected '") + c + "'");
        }
        ++pos_;
    }

    void expect_literal(std::string_view word)
    {
        if (text_.substr(pos_, word.size()) != word) {
            fail("invalid literal, expected '" + std::string{word} + "'");
        }
        pos_ += word.size();
    }

    Value parse_value(int depth)
    {
        if (depth > kMaxDepth) {
            fail("nesting too deep");
        }
        skip_whitespace();
        switch (peek()) {
            case '{': return parse_object(depth);
            case '[': return parse_array(depth);
            case '"': return Value{parse_string()};
            case 't': expect_literal("true");  return Value{true};
            case 'f': expect_literal("false"); return Value{false};
            case 'n': expect_literal("null");  return Value{};
            default: break;
        }
        if (peek() == '-' || (peek() >= '0' && peek() <= '9')) {
            return parse_number();
        }
        fail(at_end() ? "unexpected end of input" : "unexpected character '" + std::string(1, peek()) + "'");
    }

    Value parse_object(int depth)
    {
        expect('{');
        ObjectBuilder builder;

        skip_whitespace();
        if (peek() == '}') {
            ++pos_;
            return builder.finish();
        }

        while (true) {
            skip_whitespace();
            if (peek() != '"') {
                fail("expected string key");
            }
            std::string key = parse_string();
            expect(':');
            builder.set(key, parse_value(depth + 1));

            skip_whitespace();
            if (peek() == ',') {
                ++pos_;
                continue;
            }
            if (peek() == '}') {
                ++pos_;
                return builder.finish();
            }
            fail("expected ',' or '}' in object");
        }
    }

    Value parse_array(int depth)
    {
        expect('[');
        ArrayBuilder builder;

        skip_whitespace();
        if (peek() == ']') {
            ++pos_;
            return builder.finish();
        }

        while (true) {
            builder.push_back(parse_value(depth + 1));

            skip_whitespace();
            if (peek() == ',') {
                ++pos_;
                continue;
            }
            if (peek() == ']') {
                ++pos_;
                return builder.finish();
            }
            fail("expected ',' or ']' in array");
        }
    }

    std::uint32_t parse_hex4()
    {
        if (pos_ + 4 > text_.size()) {
            fail("truncated unicode escape");
        }
        std::uint32_t value = 0;
        auto [end, ec] = std::from_chars(text_.data() + pos_, text_.data() + pos_ + 4, value, 16);
        if (ec != std::errc{} || end != text_.data() + pos_ + 4) {
            fail("invalid unicode escape");
        }
        pos_ += 4;
        return value;
    }

    std::uint32_t parse_escaped_codepoint()
    {
        std::uint32_t codepoint = parse_hex4();
        if (codepoint >= 0xDC00 && codepoint <= 0xDFFF) {
            fail("unpaired low surrogate");
        }
        if (codepoint >= 0xD800 && codepoint <= 0xDBFF) {
            if (text_.substr(pos_, 2) != "\\u") {
                fail("unpaired high surrogate");
            }
            pos_ += 2;
            std::uint32_t low = parse_hex4();
            if (low < 0xDC00 || low > 0xDFFF) {
                fail("invalid low surrogate");
            }
            codepoint = 0x10000 + ((codepoint - 0xD800) << 10) + (low - 0xDC00);
        }
        return codepoint;
    }

    std::string parse_string()
    {
        expect('"');
        std::string result;

        while (!at_end()) {
            char c = text_[pos_++];
            if (c == '"') {
                return result;
            }
            if (static_cast<unsigned char>(c) < 0x20) {
                --pos_;
                fail("unescaped control character in string");
            }
            if (c != '\\') {
                result += c;
                continue;
            }
            if (at_end()) break;
            switch (text_[pos_++]) {
                case '"':  result += '"'; break;
                case '\\': result += '\\'; break;
                case '/':  result += '/'; break;
                case 'b':  result += '\b'; break;
                case 'f':  result += '\f'; break;
                case 'n':  result += '\n'; break;
                case 'r':  result += '\r'; break;
                case 't':  result += '\t'; break;
                case 'u':  append_utf8(result, parse_escaped_codepoint()); break;
                default:
                    --pos_;
                    fail("invalid escape sequence");
            }
        }
        fail("unterminated string");
    }

    void skip_digits()
    {
        while (!at_end() && text_[pos_] >= '0' && text_[pos_] <= '9') ++pos_;
    }

    bool digit_here() const { return peek() >= '0' && peek() <= '9'; }

    /// -?(0|[1-9][0-9]*)(\.[0-9]+)?([eE][+-]?[0-9]+)?
    Value parse_number()
    {
        const std::size_t start = pos_;
        if (peek() == '-') ++pos_;

        if (peek() == '0') {
            ++pos_;
        } else if (digit_here()) {
            skip_digits();
        } else {
            fail("invalid number");
        }

        if (peek() == '.') {
            ++pos_;
            if (!digit_here()) fail("expected digit after decimal point");
            skip_digits();
        }

        if (peek() == 'e' || peek() == 'E') {
            ++pos_;
            if (peek() == '+' || peek() == '-') ++pos_;
            if (!digit_here()) fail("expected digit in exponent");
            skip_digits();
        }

        const std::string_view literal = text_.substr(start, pos_ - start);
        double value = 0.0;
        auto [end, ec] = std::from_chars(literal.data(), literal.data() + literal.size(), value);
        if (ec == std::errc::result_out_of_range) {
            // Too small for a double rounds to zero; only overflow is an error
            if (decimal_magnitude(literal) >= 0) {
                pos_ = start;
                fail("number out of range '" + std::string{literal} + "'");
            }
            value = literal.front() == '-' ? -0.0 : 0.0;
        } else if (ec != std::errc{} || end != literal.data() + literal.size()) {
            pos_ = start;
            fail("invalid number '" + std::string{literal} + "'");
        }
        return Value{value};
    }
};

} // anonymous namespace

std::string to_json(const Value& val, bool compact)
{
    Writer writer{compact};
    writer.write(val, 0);
    return writer.str();
}

Value from_json(std::string_view json_str, std::string* error_out)
{
    return JsonParser{json_str}.parse(error_out);
}

} // namespace json_delta
