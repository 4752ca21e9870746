#pragma once

#include "circuit/region_shape.hpp"
#include <map>

namespace plonkish {

/**
 * ColumnOccupancy - First free row of every column the layouter has touched
 *
 * Frontiers only grow. Columns never seen are free from row 0.
 */
class ColumnOccupancy {
public:
    size_t frontier(const RegionColumn& column) const;

    /**
     * Place a measured region at the lowest row that is free in every one of
     * its columns, then advance those columns past the region.
     *
     * @return Starting row of the region
     */
    size_t place(const RegionShape& shape);

    // Claim the next free row of column and advance its frontier by one
    size_t take_row(const RegionColumn& column);

    // Highest frontier over all columns
    size_t max_frontier() const;

    const std::map<RegionColumn, size_t>& frontiers() const { return frontiers_; }

private:
    std::map<RegionColumn, size_t> frontiers_;
};

} // namespace plonkish
