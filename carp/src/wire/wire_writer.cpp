//! # Wire Serialization
//!
//! Compact text rendering of `WireValue`. Object members come out in key
//! order, so identical trees always serialize to identical bodies.

#include "wire/wire_value.hpp"

#include <cmath>
#include <iomanip>
#include <sstream>

namespace carp::wire {

namespace {

auto format_number(const WireNumber& num) -> std::string {
    switch (num.kind) {
    case WireNumber::Kind::Int64:
        return std::to_string(num.i64);
    case WireNumber::Kind::Uint64:
        return std::to_string(num.u64);
    case WireNumber::Kind::Double: {
        // JSON has no NaN or infinity
        if (std::isnan(num.f64) || std::isinf(num.f64)) {
            return "null";
        }
        std::ostringstream oss;
        oss << std::setprecision(17) << num.f64;
        std::string result = oss.str();
        if (result.find_first_of(".eE") == std::string::npos) {
            result += ".0";
        }
        return result;
    }
    }
    return "0";
}

void write_value(const WireValue& value, std::string& out) {
    if (value.is_null()) {
        out += "null";
    } else if (value.is_bool()) {
        out += value.as_bool() ? "true" : "false";
    } else if (value.is_number()) {
        out += format_number(value.as_number());
    } else if (value.is_string()) {
        out += '"';
        out += escape_string(value.as_string());
        out += '"';
    } else if (value.is_array()) {
        out += '[';
        bool first = true;
        for (const auto& item : value.as_array()) {
            if (!first) {
                out += ',';
            }
            first = false;
            write_value(item, out);
        }
        out += ']';
    } else {
        out += '{';
        bool first = true;
        for (const auto& [key, item] : value.as_object()) {
            if (!first) {
                out += ',';
            }
            first = false;
            out += '"';
            out += escape_string(key);
            out += "\":";
            write_value(item, out);
        }
        out += '}';
    }
}

} // namespace

auto escape_string(std::string_view input) -> std::string {
    std::string out;
    out.reserve(input.size());
    for (char c : input) {
        switch (c) {
        case '"':
            out += "\\\"";
            break;
        case '\\':
            out += "\\\\";
            break;
        case '\b':
            out += "\\b";
            break;
        case '\f':
            out += "\\f";
            break;
        case '\n':
            out += "\\n";
            break;
        case '\r':
            out += "\\r";
            break;
        case '\t':
            out += "\\t";
            break;
        default:
            if (static_cast<unsigned char>(c) < 0x20) {
                static const char* hex = "0123456789abcdef";
                out += "\\u00";
                out += hex[(c >> 4) & 0x0F];
                out += hex[c & 0x0F];
            } else {
                out += c;
            }
        }
    }
    return out;
}

auto WireValue::to_string() const -> std::string {
    std::string out;
    write_value(*this, out);
    return out;
}

} // namespace carp::wire
