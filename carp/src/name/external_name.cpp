#include "name/external_name.hpp"

#include <stdexcept>

namespace carp {

namespace {

auto is_alpha(char c) -> bool {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
}

auto is_digit(char c) -> bool {
    return c >= '0' && c <= '9';
}

auto is_word(std::string_view word) -> bool {
    if (word.empty() || !is_alpha(word[0])) {
        return false;
    }
    for (char c : word) {
        if (!is_alpha(c) && !is_digit(c)) {
            return false;
        }
    }
    return true;
}

auto lowered(std::string_view word) -> std::string {
    std::string out(word);
    for (auto& c : out) {
        if (c >= 'A' && c <= 'Z') {
            c = static_cast<char>(c - 'A' + 'a');
        }
    }
    return out;
}

auto capitalized(const std::string& word) -> std::string {
    std::string out = word;
    if (!out.empty() && out[0] >= 'a' && out[0] <= 'z') {
        out[0] = static_cast<char>(out[0] - 'a' + 'A');
    }
    return out;
}

auto uppered(const std::string& word) -> std::string {
    std::string out = word;
    for (auto& c : out) {
        if (c >= 'a' && c <= 'z') {
            c = static_cast<char>(c - 'a' + 'A');
        }
    }
    return out;
}

} // namespace

ExternalName::ExternalName(std::vector<Part> parts) : parts_(std::move(parts)) {
    for (size_t i = 0; i < parts_.size(); ++i) {
        if (i > 0) {
            text_ += '.';
        }
        text_ += render(parts_[i], Case::Lower, "-", "/");
    }
}

auto ExternalName::parse(std::string_view text) -> Result<ExternalName, std::string> {
    if (text.empty()) {
        return std::string("empty name");
    }

    std::vector<Part> parts;
    size_t start = 0;
    while (true) {
        size_t dot = text.find('.', start);
        auto component = text.substr(start, dot == std::string_view::npos ? text.npos : dot - start);
        if (component.empty()) {
            return "empty component in [" + std::string(text) + "]";
        }

        Part part;
        size_t word_start = 0;
        for (size_t i = 0; i <= component.size(); ++i) {
            bool at_end = i == component.size();
            if (!at_end && component[i] != '-' && component[i] != '/') {
                continue;
            }
            auto word = component.substr(word_start, i - word_start);
            if (!is_word(word)) {
                return "illegal word in [" + std::string(text) + "]: [" + std::string(word) + "]";
            }
            part.words.push_back(lowered(word));
            if (!at_end) {
                part.slash_after.push_back(component[i] == '/');
            }
            word_start = i + 1;
        }
        parts.push_back(std::move(part));

        if (dot == std::string_view::npos) {
            break;
        }
        start = dot + 1;
    }
    return ExternalName(std::move(parts));
}

auto ExternalName::of(std::string_view text) -> ExternalName {
    auto result = parse(text);
    if (is_err(result)) {
        throw std::invalid_argument(unwrap_err(result));
    }
    return std::move(unwrap(result));
}

auto ExternalName::parent() const -> std::optional<ExternalName> {
    if (is_leaf()) {
        return std::nullopt;
    }
    return ExternalName(std::vector<Part>(parts_.begin(), parts_.end() - 1));
}

auto ExternalName::leaf() const -> ExternalName {
    if (is_leaf()) {
        return *this;
    }
    return ExternalName(std::vector<Part>{parts_.back()});
}

auto ExternalName::resolve(const ExternalName& child) const -> ExternalName {
    std::vector<Part> joined = parts_;
    joined.insert(joined.end(), child.parts_.begin(), child.parts_.end());
    return ExternalName(std::move(joined));
}

auto ExternalName::prefix(std::string_view prefix) const -> Result<ExternalName, std::string> {
    auto leaf_name = parse(std::string(prefix) + leaf().to_string());
    if (is_err(leaf_name)) {
        return leaf_name;
    }
    auto mod = parent();
    if (!mod) {
        return leaf_name;
    }
    return mod->resolve(unwrap(leaf_name));
}

auto ExternalName::render(const Part& part, Case style, std::string_view dash,
                          std::string_view slash) -> std::string {
    std::string out;
    bool after_slash = false;
    for (size_t i = 0; i < part.words.size(); ++i) {
        const auto& word = part.words[i];
        switch (style) {
        case Case::Lower:
            out += word;
            break;
        case Case::Upper:
            out += uppered(word);
            break;
        case Case::LowerCamel:
            out += (i == 0 || after_slash) ? word : capitalized(word);
            break;
        case Case::UpperCamel:
            out += after_slash ? word : capitalized(word);
            break;
        }
        if (i < part.slash_after.size()) {
            after_slash = part.slash_after[i];
            out += after_slash ? slash : dash;
        }
    }
    return out;
}

auto ExternalName::as_native_namespace() const -> std::string {
    std::string out;
    for (size_t i = 0; i < parts_.size(); ++i) {
        if (i > 0) {
            out += "::";
        }
        out += render(parts_[i], Case::Lower, "_", "");
    }
    return out;
}

auto ExternalName::as_native_class_name() const -> std::string {
    std::string out;
    for (const auto& word : parts_.back().words) {
        out += capitalized(word);
    }
    return out;
}

auto ExternalName::as_native_member_name() const -> std::string {
    return render(parts_.back(), Case::LowerCamel, "", "");
}

auto ExternalName::as_native_constant_name() const -> std::string {
    return render(parts_.back(), Case::Upper, "_", "");
}

auto ExternalName::as_path_elements() const -> std::string {
    std::string out;
    for (size_t i = 0; i < parts_.size(); ++i) {
        if (i > 0) {
            out += '/';
        }
        out += render(parts_[i], Case::Lower, "-", "");
    }
    return out;
}

} // namespace carp
