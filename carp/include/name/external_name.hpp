//! # External Names
//!
//! Qualified identifiers used as the key for schema types and modules.
//!
//! An external name is a dot-separated list of components. Each component
//! is a list of words separated by `-` or `/`; a word starts with a letter
//! and continues with letters or digits. Words are stored lower-case, and
//! the separator kind is remembered so the text form round-trips.
//!
//! ## Native Mappings
//!
//! | Input | Mapping | Result |
//! |-------|---------|--------|
//! | `org.example-org.victory-truly` | `as_native_namespace` | `org::example_org::victory_truly` |
//! | `a.my-i/e/t/f-index` | `as_native_class_name` | `MyIETFIndex` |
//! | `a.my-i/e/t/f-index` | `as_native_member_name` | `myIetfIndex` |
//! | `a.my-i/e/t/f-index` | `as_native_constant_name` | `MY_IETF_INDEX` |
//! | `a.my-i/e/t/f-index` | `as_path_elements` | `a/my-ietf-index` |

#ifndef CARP_NAME_EXTERNAL_NAME_HPP
#define CARP_NAME_EXTERNAL_NAME_HPP

#include "common.hpp"

#include <functional>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace carp {

/// An immutable dotted qualified name.
class ExternalName {
public:
    /// Parses the text form.
    ///
    /// # Returns
    ///
    /// The name, or a message describing the first illegal component or word.
    static auto parse(std::string_view text) -> Result<ExternalName, std::string>;

    /// Parses a name known to be well-formed.
    ///
    /// # Panics
    ///
    /// Throws `std::invalid_argument` if `text` is malformed.
    static auto of(std::string_view text) -> ExternalName;

    /// True if the name has a single component.
    [[nodiscard]] auto is_leaf() const -> bool {
        return parts_.size() == 1;
    }

    /// All components but the last; absent for a leaf.
    [[nodiscard]] auto parent() const -> std::optional<ExternalName>;

    /// The last component alone.
    [[nodiscard]] auto leaf() const -> ExternalName;

    /// Appends the components of `child`.
    [[nodiscard]] auto resolve(const ExternalName& child) const -> ExternalName;

    /// Prepends `prefix` to the words of the leaf component.
    [[nodiscard]] auto prefix(std::string_view prefix) const -> Result<ExternalName, std::string>;

    /// Canonical text form, e.g. `org.example-org.i/e/t/f-index`.
    [[nodiscard]] auto to_string() const -> const std::string& {
        return text_;
    }

    [[nodiscard]] auto as_native_namespace() const -> std::string;
    [[nodiscard]] auto as_native_class_name() const -> std::string;
    [[nodiscard]] auto as_native_member_name() const -> std::string;
    [[nodiscard]] auto as_native_constant_name() const -> std::string;

    /// Components joined with `/`, slashes within a component dropped.
    [[nodiscard]] auto as_path_elements() const -> std::string;

    auto operator==(const ExternalName& other) const -> bool {
        return text_ == other.text_;
    }

    auto operator<(const ExternalName& other) const -> bool {
        return text_ < other.text_;
    }

private:
    struct Part {
        std::vector<std::string> words;
        std::vector<bool> slash_after; ///< separator after word i is `/`
    };

    enum class Case { Lower, Upper, LowerCamel, UpperCamel };

    explicit ExternalName(std::vector<Part> parts);

    static auto render(const Part& part, Case style, std::string_view dash, std::string_view slash)
        -> std::string;

    std::vector<Part> parts_;
    std::string text_;
};

inline auto operator<<(std::ostream& os, const ExternalName& name) -> std::ostream& {
    return os << name.to_string();
}

} // namespace carp

template <> struct std::hash<carp::ExternalName> {
    auto operator()(const carp::ExternalName& name) const noexcept -> size_t {
        return std::hash<std::string>{}(name.to_string());
    }
};

#endif // CARP_NAME_EXTERNAL_NAME_HPP
