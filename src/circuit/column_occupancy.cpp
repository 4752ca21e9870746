#include "circuit/column_occupancy.hpp"
#include "common/debug_control.hpp"
#include <algorithm>

namespace plonkish {

size_t ColumnOccupancy::frontier(const RegionColumn& column) const {
    auto it = frontiers_.find(column);
    return it == frontiers_.end() ? 0 : it->second;
}

size_t ColumnOccupancy::place(const RegionShape& shape) {
    size_t start = 0;
    for (const RegionColumn& column : shape.columns()) {
        start = std::max(start, frontier(column));
    }

    const size_t end = start + shape.row_count();
    for (const RegionColumn& column : shape.columns()) {
        auto it = frontiers_.find(column);
        if (it == frontiers_.end()) {
            frontiers_.emplace(column, end);
            continue;
        }
        PLONKISH_DEBUG_COUT("[occupancy] region " << shape.region_index() << " reuses "
                            << column.to_string() << " (frontier " << it->second
                            << " -> " << end << ")" << std::endl);
        it->second = std::max(it->second, end);
    }
    return start;
}

size_t ColumnOccupancy::take_row(const RegionColumn& column) {
    size_t& cursor = frontiers_[column];
    return cursor++;
}

size_t ColumnOccupancy::max_frontier() const {
    size_t highest = 0;
    for (const auto& entry : frontiers_) {
        highest = std::max(highest, entry.second);
    }
    return highest;
}

} // namespace plonkish
