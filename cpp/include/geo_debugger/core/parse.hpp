#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace geo_debugger {

// Whole-string numeric parsing. Leading/trailing garbage, signs on unsigned
// values and empty strings are rejected. Reals are decimal or exponent form
// in the C locale; a leading '+', hex floats, inf and nan are rejected.
[[nodiscard]] std::optional<uint64_t> parse_unsigned(std::string_view text);
[[nodiscard]] std::optional<double> parse_real(std::string_view text);
[[nodiscard]] std::optional<bool> parse_switch(std::string_view text);

}  // namespace geo_debugger
