#include "name/uuid.hpp"

namespace carp {

namespace {

auto hex_value(char c) -> int {
    if (c >= '0' && c <= '9') {
        return c - '0';
    }
    if (c >= 'a' && c <= 'f') {
        return c - 'a' + 10;
    }
    if (c >= 'A' && c <= 'F') {
        return c - 'A' + 10;
    }
    return -1;
}

} // namespace

auto Uuid::parse(std::string_view text) -> Result<Uuid, std::string> {
    if (text.size() != 36) {
        return "malformed UUID: " + std::string(text);
    }
    Uuid id;
    size_t byte = 0;
    for (size_t i = 0; i < text.size();) {
        if (i == 8 || i == 13 || i == 18 || i == 23) {
            if (text[i] != '-') {
                return "malformed UUID: " + std::string(text);
            }
            ++i;
            continue;
        }
        int hi = hex_value(text[i]);
        int lo = hex_value(text[i + 1]);
        if (hi < 0 || lo < 0) {
            return "malformed UUID: " + std::string(text);
        }
        id.bytes[byte++] = static_cast<uint8_t>((hi << 4) | lo);
        i += 2;
    }
    return id;
}

auto Uuid::to_string() const -> std::string {
    static const char* hex = "0123456789abcdef";
    std::string out;
    out.reserve(36);
    for (size_t i = 0; i < bytes.size(); ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) {
            out += '-';
        }
        out += hex[bytes[i] >> 4];
        out += hex[bytes[i] & 0x0F];
    }
    return out;
}

} // namespace carp
