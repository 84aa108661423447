#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace ontouml_validation {

struct Multiplicity {
    std::uint64_t lower = 0;
    std::optional<std::uint64_t> upper;  // nullopt = unbounded ("*")

    bool is_consistent() const { return !upper || *upper >= lower; }
    bool is_exactly_one() const { return lower == 1 && upper && *upper == 1; }

    bool operator==(const Multiplicity& o) const { return lower == o.lower && upper == o.upper; }
};

// "" -> nullopt, "*" -> 0..*, "n" -> n..n, "l..u" -> l..u, "l..*" -> l..*.
// Surrounding whitespace is ignored; any other text gives nullopt.
std::optional<Multiplicity> parse_multiplicity(std::string_view text);

std::string to_string(const Multiplicity& m);

} // namespace ontouml_validation
