#pragma once

#include "plonk/column.hpp"
#include <optional>
#include <utility>
#include <vector>

namespace plonkish {

/**
 * PermutationArgument - The set of columns that take part in copy constraints
 */
class PermutationArgument {
public:
    // Adds column unless it is already present
    void add_column(const Column& column);

    const std::vector<Column>& columns() const { return columns_; }
    std::optional<size_t> index_of(const Column& column) const;

private:
    std::vector<Column> columns_;
};

/**
 * PermutationAssembly - Builds the copy cycles of the permutation argument
 *
 * Every (column, row) of a permutation column starts in its own cycle;
 * copy() merges the cycles of both endpoints (smaller into larger). The
 * resulting mapping depends on the order of copy() calls, so callers must
 * replay copies in a fixed order to obtain reproducible keys.
 */
class PermutationAssembly {
public:
    using Position = std::pair<size_t, size_t>;   // (permutation column index, row)

    PermutationAssembly(size_t n, const PermutationArgument& argument);

    /**
     * @throws Error(ColumnNotInPermutation) if either column lacks equality
     * @throws Error(BoundsFailure) if either row is >= n
     */
    void copy(const Column& left_column, size_t left_row,
              const Column& right_column, size_t right_row);

    const std::vector<Column>& columns() const { return columns_; }
    const std::vector<std::vector<Position>>& mapping() const { return mapping_; }

    // Every accepted copy, in call order
    const std::vector<std::pair<CopyCell, CopyCell>>& copies() const { return copies_; }

    bool same_cycle(const CopyCell& a, const CopyCell& b) const;

    // Non-trivial cycles, each sorted, in sorted order
    std::vector<std::vector<CopyCell>> cycles() const;

private:
    size_t column_position(const Column& column) const;

    std::vector<Column> columns_;
    std::vector<std::vector<Position>> mapping_;
    std::vector<std::vector<Position>> aux_;
    std::vector<std::vector<size_t>> sizes_;
    std::vector<std::pair<CopyCell, CopyCell>> copies_;
};

} // namespace plonkish
