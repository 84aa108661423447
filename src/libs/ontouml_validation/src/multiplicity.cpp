#include <ontouml_validation/multiplicity.hpp>
#include <charconv>

namespace ontouml_validation {

namespace {

std::string_view trim(std::string_view s) {
    const auto is_space = [](char c) { return c == ' ' || c == '\t' || c == '\n' || c == '\r'; };
    while (!s.empty() && is_space(s.front())) s.remove_prefix(1);
    while (!s.empty() && is_space(s.back())) s.remove_suffix(1);
    return s;
}

std::optional<std::uint64_t> parse_bound(std::string_view s) {
    if (s.empty()) return std::nullopt;
    std::uint64_t value = 0;
    const char* end = s.data() + s.size();
    auto [ptr, ec] = std::from_chars(s.data(), end, value);
    if (ec != std::errc() || ptr != end) return std::nullopt;
    return value;
}

} // namespace

std::optional<Multiplicity> parse_multiplicity(std::string_view text) {
    text = trim(text);
    if (text.empty()) return std::nullopt;
    if (text == "*") return Multiplicity{0, std::nullopt};

    const auto dots = text.find("..");
    if (dots == std::string_view::npos) {
        auto n = parse_bound(text);
        if (!n) return std::nullopt;
        return Multiplicity{*n, *n};
    }

    auto lower = parse_bound(trim(text.substr(0, dots)));
    if (!lower) return std::nullopt;
    const std::string_view upper_text = trim(text.substr(dots + 2));
    if (upper_text == "*") return Multiplicity{*lower, std::nullopt};
    auto upper = parse_bound(upper_text);
    if (!upper) return std::nullopt;
    return Multiplicity{*lower, *upper};
}

std::string to_string(const Multiplicity& m) {
    return std::to_string(m.lower) + ".." + (m.upper ? std::to_string(*m.upper) : std::string("*"));
}

} // namespace ontouml_validation
