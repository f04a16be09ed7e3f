#include "ArgParser.hpp"

#include "string_utils.hpp"

#include <cctype>

std::string_view ArgParser::shift() noexcept {
    if (empty())
        return {};

    auto terminator = ' ';
    if (remaining_.front() == '\'' || remaining_.front() == '"') {
        terminator = remaining_.front();
        remaining_.remove_prefix(1);
    }

    auto terminator_pos = terminator == ' ' ? remaining_.find_first_of(" \t") : remaining_.find(terminator);
    if (terminator_pos == std::string_view::npos) {
        auto res = remaining_;
        remaining_ = std::string_view();
        return res;
    }

    auto res = remaining_.substr(0, terminator_pos);
    remaining_.remove_prefix(terminator_pos + 1);
    skip_spaces();
    return res;
}

void ArgParser::skip_spaces() noexcept {
    while (!remaining_.empty() && std::isspace(static_cast<unsigned char>(remaining_.front())))
        remaining_.remove_prefix(1);
}

std::optional<int> ArgParser::try_shift_number() noexcept {
    if (empty())
        return {};
    auto prev_remaining = remaining_;
    auto arg = shift();
    if (is_number(arg))
        return parse_number(arg);
    remaining_ = prev_remaining;
    return {};
}
