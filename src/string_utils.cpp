#include "string_utils.hpp"

#include <range/v3/algorithm/all_of.hpp>
#include <range/v3/range/conversion.hpp>
#include <range/v3/view/split.hpp>
#include <range/v3/view/transform.hpp>
#include <range/v3/view/zip.hpp>

#include <algorithm>
#include <cctype>
#include <limits>

namespace {
const auto not_space = [](char ch) { return !std::isspace(static_cast<unsigned char>(ch)); };
const auto lower = [](char ch) { return static_cast<char>(std::tolower(static_cast<unsigned char>(ch))); };
}

std::string_view trim(std::string_view str) {
    const auto begin = std::find_if(str.begin(), str.end(), not_space);
    const auto rit = std::find_if(str.rbegin(), std::make_reverse_iterator(begin), not_space);
    return {begin, static_cast<size_t>(rit.base() - begin)};
}

std::string lower_case(std::string_view str) { return str | ranges::views::transform(lower) | ranges::to<std::string>; }

bool is_number(std::string_view sv) {
    if (sv.empty())
        return false;
    if (sv.front() == '-' || sv.front() == '+')
        sv.remove_prefix(1);
    if (sv.empty())
        return false;
    return ranges::all_of(sv, [](char ch) { return std::isdigit(static_cast<unsigned char>(ch)) != 0; });
}

int parse_number(std::string_view sv) {
    if (!is_number(sv))
        return 0;
    const bool is_neg = sv.front() == '-';
    if (sv.front() == '-' || sv.front() == '+')
        sv.remove_prefix(1);
    long long intermediate = 0;
    for (auto ch : sv) {
        intermediate = intermediate * 10 + (ch - '0');
        if (intermediate > std::numeric_limits<int>::max())
            return is_neg ? std::numeric_limits<int>::min() : std::numeric_limits<int>::max();
    }
    return static_cast<int>(is_neg ? -intermediate : intermediate);
}

bool matches(std::string_view lhs, std::string_view rhs) {
    if (lhs.size() != rhs.size())
        return false;
    return ranges::all_of(ranges::views::zip(lhs, rhs), [](auto pr) { return lower(pr.first) == lower(pr.second); });
}

bool matches_start(std::string_view lhs, std::string_view rhs) {
    if (lhs.size() > rhs.size() || lhs.empty())
        return false;
    return matches(lhs, rhs.substr(0, lhs.size()));
}

bool matches_name(std::string_view query, std::string_view name) {
    query = trim(query);
    if (matches_start(query, name))
        return true;
    for (auto word : name | ranges::views::split(' ')) {
        const auto as_string = word | ranges::to<std::string>;
        if (matches_start(query, as_string))
            return true;
    }
    return false;
}

std::string join(const std::vector<std::string> &parts, std::string_view separator) {
    std::string result;
    bool first = true;
    for (const auto &part : parts) {
        if (!first)
            result += separator;
        result += part;
        first = false;
    }
    return result;
}
