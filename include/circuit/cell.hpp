#pragma once

#include "plonk/column.hpp"
#include "types/assigned.hpp"
#include "types/value.hpp"
#include <cstddef>

namespace plonkish {

// Index of a region in the order regions were first measured
using RegionIndex = size_t;

/**
 * Cell - A position inside a region; its absolute row is known once the
 * region is placed.
 */
struct Cell {
    RegionIndex region_index = 0;
    size_t row_offset = 0;
    Column column;

    bool operator==(const Cell& rhs) const {
        return region_index == rhs.region_index && row_offset == rhs.row_offset && column == rhs.column;
    }
    bool operator!=(const Cell& rhs) const { return !(*this == rhs); }
};

} // namespace plonkish
