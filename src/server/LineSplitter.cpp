#include "LineSplitter.hpp"

#include <cctype>
#include <string_view>

std::vector<std::string> LineSplitter::add_data(gsl::span<const byte> data) {
    for (auto b : data) {
        // Drop anything unprintable apart from line endings, tabs and backspace.
        if (b == '\n' || b == '\r' || b == '\t' || b == '\b' || std::isprint(b))
            buffer_.push_back(static_cast<char>(b));
    }

    std::vector<std::string> lines;
    std::string_view pending(buffer_);
    while (!pending.empty()) {
        // Complete a \n\r or \r\n pair that crossed a read boundary.
        if ((previous_separator_ == '\n' && pending.front() == '\r')
            || (previous_separator_ == '\r' && pending.front() == '\n')) {
            pending.remove_prefix(1);
            previous_separator_ = 0;
            continue;
        }
        const auto cr_or_lf = pending.find_first_of("\n\r");
        if (cr_or_lf == std::string_view::npos)
            break;
        previous_separator_ = pending[cr_or_lf];
        std::string line;
        for (auto ch : pending.substr(0, cr_or_lf)) {
            if (ch == '\b') {
                if (!line.empty())
                    line.pop_back();
            } else {
                line.push_back(ch);
            }
        }
        lines.push_back(std::move(line));
        pending.remove_prefix(cr_or_lf + 1);
    }
    buffer_.erase(0, buffer_.size() - pending.size());
    return lines;
}
