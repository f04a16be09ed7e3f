#pragma once

#include <optional>
#include <string>
#include <string_view>

// Splits a command line or world file record into whitespace separated arguments. An argument starting with ' or "
// runs to the matching quote, so names and descriptions with spaces can be given as one argument.
class ArgParser {
    std::string_view remaining_;

    void skip_spaces() noexcept;

public:
    // The parser references the text it was given; it is valid only as long as that text is.
    explicit ArgParser(std::string_view args) noexcept : remaining_(args) { skip_spaces(); }

    [[nodiscard]] bool empty() const noexcept { return remaining_.empty(); }

    // The entirety of the unparsed arguments.
    [[nodiscard]] std::string_view remaining() const noexcept { return remaining_; }

    // Shift a single argument from the argument list. Returns an empty string if the parser is empty.
    [[nodiscard]] std::string_view shift() noexcept;

    // Try and shift a numeric argument. Leaves the parser untouched if the next argument isn't a number.
    [[nodiscard]] std::optional<int> try_shift_number() noexcept;
};
