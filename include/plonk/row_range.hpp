#pragma once

#include <cstddef>
#include <string>

namespace plonkish {

/**
 * RowRange - Half-open row window [start, end)
 */
struct RowRange {
    size_t start = 0;
    size_t end = 0;

    RowRange() = default;
    RowRange(size_t s, size_t e) : start(s), end(e) {}

    size_t size() const { return end > start ? end - start : 0; }
    bool empty() const { return end <= start; }
    bool contains(size_t row) const { return row >= start && row < end; }
    bool contains(const RowRange& other) const {
        return other.start >= start && other.end <= end;
    }

    bool operator==(const RowRange& rhs) const { return start == rhs.start && end == rhs.end; }
    bool operator!=(const RowRange& rhs) const { return !(*this == rhs); }

    std::string to_string() const {
        return std::to_string(start) + ".." + std::to_string(end);
    }
};

} // namespace plonkish
