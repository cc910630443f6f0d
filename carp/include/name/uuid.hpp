//! # UUIDs
//!
//! 128-bit identifiers in the canonical 8-4-4-4-12 hex form. Peers report
//! internal failures with one of these so the caller can quote it without
//! learning anything about the failure itself.

#ifndef CARP_NAME_UUID_HPP
#define CARP_NAME_UUID_HPP

#include "common.hpp"

#include <array>
#include <cstdint>
#include <ostream>
#include <string>
#include <string_view>

namespace carp {

struct Uuid {
    std::array<uint8_t, 16> bytes{};

    /// Parses `xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx`, either case.
    static auto parse(std::string_view text) -> Result<Uuid, std::string>;

    /// Lower-case canonical form.
    [[nodiscard]] auto to_string() const -> std::string;

    auto operator==(const Uuid& other) const -> bool = default;
};

inline auto operator<<(std::ostream& os, const Uuid& id) -> std::ostream& {
    return os << id.to_string();
}

} // namespace carp

#endif // CARP_NAME_UUID_HPP
