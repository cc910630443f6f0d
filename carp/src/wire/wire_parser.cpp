//! # Wire Parser Implementation
//!
//! Single-pass recursive descent over the input characters. Location is
//! tracked as the cursor advances so every error carries line and column.

#include "wire/wire_parser.hpp"

#include <charconv>
#include <cstdlib>

namespace carp::wire {

WireParser::WireParser(std::string_view input) : input_(input) {}

auto WireParser::at_end() const -> bool {
    return pos_ >= input_.size();
}

auto WireParser::peek() const -> char {
    return at_end() ? '\0' : input_[pos_];
}

auto WireParser::advance() -> char {
    if (at_end()) {
        return '\0';
    }
    char c = input_[pos_++];
    if (c == '\n') {
        ++line_;
        column_ = 1;
    } else {
        ++column_;
    }
    return c;
}

void WireParser::skip_whitespace() {
    while (!at_end()) {
        char c = peek();
        if (c != ' ' && c != '\t' && c != '\n' && c != '\r') {
            break;
        }
        advance();
    }
}

auto WireParser::error(const std::string& msg) const -> WireError {
    return WireError::make(msg, line_, column_, pos_);
}

auto WireParser::parse() -> Result<WireValue, WireError> {
    skip_whitespace();
    if (at_end()) {
        return error("empty input");
    }
    auto value = parse_value();
    if (is_err(value)) {
        return value;
    }
    skip_whitespace();
    if (!at_end()) {
        return error("unexpected content after value");
    }
    return value;
}

auto WireParser::parse_value() -> Result<WireValue, WireError> {
    skip_whitespace();
    switch (peek()) {
    case '{':
        return parse_object();
    case '[':
        return parse_array();
    case '"': {
        auto str = parse_string();
        if (is_err(str)) {
            return unwrap_err(str);
        }
        return WireValue(std::move(unwrap(str)));
    }
    case 't':
    case 'f':
    case 'n':
        return parse_keyword();
    case '\0':
        return error("unexpected end of input");
    default:
        if (peek() == '-' || (peek() >= '0' && peek() <= '9')) {
            return parse_number();
        }
        return error(std::string("unexpected character '") + peek() + "'");
    }
}

auto WireParser::parse_object() -> Result<WireValue, WireError> {
    if (++depth_ > MAX_DEPTH) {
        return error("maximum nesting depth exceeded");
    }
    advance(); // '{'
    WireObject obj;

    skip_whitespace();
    if (peek() == '}') {
        advance();
        --depth_;
        return WireValue(std::move(obj));
    }

    while (true) {
        skip_whitespace();
        if (peek() != '"') {
            return error("expected string key");
        }
        auto key = parse_string();
        if (is_err(key)) {
            return unwrap_err(key);
        }
        skip_whitespace();
        if (advance() != ':') {
            return error("expected ':' after object key");
        }
        auto value = parse_value();
        if (is_err(value)) {
            return value;
        }
        obj.insert_or_assign(std::move(unwrap(key)), std::move(unwrap(value)));

        skip_whitespace();
        char c = advance();
        if (c == '}') {
            break;
        }
        if (c != ',') {
            return error("expected ',' or '}' in object");
        }
    }

    --depth_;
    return WireValue(std::move(obj));
}

auto WireParser::parse_array() -> Result<WireValue, WireError> {
    if (++depth_ > MAX_DEPTH) {
        return error("maximum nesting depth exceeded");
    }
    advance(); // '['
    WireArray arr;

    skip_whitespace();
    if (peek() == ']') {
        advance();
        --depth_;
        return WireValue(std::move(arr));
    }

    while (true) {
        auto value = parse_value();
        if (is_err(value)) {
            return value;
        }
        arr.push_back(std::move(unwrap(value)));

        skip_whitespace();
        char c = advance();
        if (c == ']') {
            break;
        }
        if (c != ',') {
            return error("expected ',' or ']' in array");
        }
    }

    --depth_;
    return WireValue(std::move(arr));
}

auto WireParser::parse_hex4() -> Result<uint32_t, WireError> {
    uint32_t code = 0;
    for (int i = 0; i < 4; ++i) {
        char c = advance();
        code <<= 4;
        if (c >= '0' && c <= '9') {
            code |= static_cast<uint32_t>(c - '0');
        } else if (c >= 'a' && c <= 'f') {
            code |= static_cast<uint32_t>(c - 'a' + 10);
        } else if (c >= 'A' && c <= 'F') {
            code |= static_cast<uint32_t>(c - 'A' + 10);
        } else {
            return error("invalid \\u escape");
        }
    }
    return code;
}

namespace {

void append_utf8(std::string& out, uint32_t cp) {
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
}

} // namespace

auto WireParser::parse_string() -> Result<std::string, WireError> {
    advance(); // opening quote
    std::string out;

    while (true) {
        if (at_end()) {
            return error("unterminated string");
        }
        char c = advance();
        if (c == '"') {
            return out;
        }
        if (static_cast<unsigned char>(c) < 0x20) {
            return error("control character in string");
        }
        if (c != '\\') {
            out += c;
            continue;
        }

        char esc = advance();
        switch (esc) {
        case '"':
            out += '"';
            break;
        case '\\':
            out += '\\';
            break;
        case '/':
            out += '/';
            break;
        case 'b':
            out += '\b';
            break;
        case 'f':
            out += '\f';
            break;
        case 'n':
            out += '\n';
            break;
        case 'r':
            out += '\r';
            break;
        case 't':
            out += '\t';
            break;
        case 'u': {
            auto high = parse_hex4();
            if (is_err(high)) {
                return unwrap_err(high);
            }
            uint32_t cp = unwrap(high);
            if (cp >= 0xD800 && cp <= 0xDBFF) {
                if (advance() != '\\' || advance() != 'u') {
                    return error("unpaired surrogate in \\u escape");
                }
                auto low = parse_hex4();
                if (is_err(low)) {
                    return unwrap_err(low);
                }
                uint32_t lo = unwrap(low);
                if (lo < 0xDC00 || lo > 0xDFFF) {
                    return error("invalid low surrogate in \\u escape");
                }
                cp = 0x10000 + ((cp - 0xD800) << 10) + (lo - 0xDC00);
            }
            append_utf8(out, cp);
            break;
        }
        default:
            return error("invalid escape sequence");
        }
    }
}

auto WireParser::parse_number() -> Result<WireValue, WireError> {
    size_t start = pos_;
    bool is_float = false;

    if (peek() == '-') {
        advance();
    }
    if (!(peek() >= '0' && peek() <= '9')) {
        return error("expected digit");
    }
    if (peek() == '0') {
        advance();
    } else {
        while (peek() >= '0' && peek() <= '9') {
            advance();
        }
    }
    if (peek() == '.') {
        is_float = true;
        advance();
        if (!(peek() >= '0' && peek() <= '9')) {
            return error("expected digit after decimal point");
        }
        while (peek() >= '0' && peek() <= '9') {
            advance();
        }
    }
    if (peek() == 'e' || peek() == 'E') {
        is_float = true;
        advance();
        if (peek() == '+' || peek() == '-') {
            advance();
        }
        if (!(peek() >= '0' && peek() <= '9')) {
            return error("expected digit in exponent");
        }
        while (peek() >= '0' && peek() <= '9') {
            advance();
        }
    }

    auto text = input_.substr(start, pos_ - start);
    const char* first = text.data();
    const char* last = text.data() + text.size();

    if (!is_float) {
        int64_t i64 = 0;
        auto [ptr, ec] = std::from_chars(first, last, i64);
        if (ec == std::errc{} && ptr == last) {
            return WireValue(i64);
        }
        if (text[0] != '-') {
            uint64_t u64 = 0;
            auto [uptr, uec] = std::from_chars(first, last, u64);
            if (uec == std::errc{} && uptr == last) {
                return WireValue(u64);
            }
        }
    }

    std::string owned(text);
    char* end = nullptr;
    double f64 = std::strtod(owned.c_str(), &end);
    if (end != owned.c_str() + owned.size()) {
        return error("invalid number");
    }
    return WireValue(f64);
}

auto WireParser::parse_keyword() -> Result<WireValue, WireError> {
    auto rest = input_.substr(pos_);
    auto consume = [this](size_t n) {
        for (size_t i = 0; i < n; ++i) {
            advance();
        }
    };
    if (rest.starts_with("true")) {
        consume(4);
        return WireValue(true);
    }
    if (rest.starts_with("false")) {
        consume(5);
        return WireValue(false);
    }
    if (rest.starts_with("null")) {
        consume(4);
        return WireValue(nullptr);
    }
    return error("invalid literal");
}

auto parse_wire(std::string_view input) -> Result<WireValue, WireError> {
    WireParser parser(input);
    return parser.parse();
}

} // namespace carp::wire
