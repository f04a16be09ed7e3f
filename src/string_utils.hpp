#pragma once

#include <string>
#include <string_view>
#include <vector>

// Trims leading and trailing whitespace, referencing the original string.
[[nodiscard]] std::string_view trim(std::string_view str);

// Returns the string, lower-cased.
[[nodiscard]] std::string lower_case(std::string_view str);

// Return true if an argument is completely numeric (an optional sign followed by digits).
[[nodiscard]] bool is_number(std::string_view sv);
// Parses a string as a number, saturating at the limits of int.
[[nodiscard]] int parse_number(std::string_view sv);

// Case insensitive equality.
[[nodiscard]] bool matches(std::string_view lhs, std::string_view rhs);

// Similar to matches() but checks if rhs starts with lhs, case insensitively.
// lhs must be at least one character long and must not be longer than rhs.
[[nodiscard]] bool matches_start(std::string_view lhs, std::string_view rhs);

// True if the query is a prefix of the whole name, or of any space separated word in it. Used to let
// "harv" or "pulse" find "Pulsewood Harvester".
[[nodiscard]] bool matches_name(std::string_view query, std::string_view name);

// Joins the parts with the separator between each.
[[nodiscard]] std::string join(const std::vector<std::string> &parts, std::string_view separator);
