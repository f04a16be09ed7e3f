#pragma once

#include "common/Fd.hpp"

#include <gsl/span>

#include <string>
#include <vector>

// Accumulates bytes from a client and hands back whole lines. Accepts \n, \r, \r\n and \n\r endings, even when a
// two byte ending is split across reads.
class LineSplitter {
    std::string buffer_;
    char previous_separator_{};

public:
    [[nodiscard]] std::vector<std::string> add_data(gsl::span<const byte> data);
    [[nodiscard]] size_t buffered_size() const noexcept { return buffer_.size(); }
};
