#pragma once

#include "plonk/column.hpp"
#include "plonk/permutation.hpp"
#include <cstdint>
#include <set>
#include <vector>

namespace plonkish {

// Largest supported grid is 2^MAX_K rows
constexpr uint32_t MAX_K = 32;

/**
 * Rows of a 2^k grid.
 * @throws Error(BoundsFailure) if k > MAX_K
 */
size_t grid_rows(uint32_t k);

/**
 * ConstraintSystem - Column allocation done once, while a circuit configures
 *
 * Gate and lookup expressions live elsewhere; this keeps only what layout
 * and key generation need: column counts, the equality-enabled columns, the
 * constants columns and the advice query rotations that decide how many rows
 * are reserved for blinding.
 */
class ConstraintSystem {
public:
    AdviceColumn advice_column();
    FixedColumn fixed_column();
    InstanceColumn instance_column();

    Selector selector();

    // Allocates a fixed column reserved for a lookup table
    TableColumn lookup_table_column();

    Challenge challenge_usable_after(uint8_t phase);

    // Allow the column to take part in copy constraints
    void enable_equality(const Column& column);

    // Register a constants column; also enables equality on it
    void enable_constant(FixedColumn column);

    // Record that a gate queries column at rotation
    void query_advice(AdviceColumn column, int32_t rotation);

    size_t num_advice_columns() const { return num_advice_columns_; }
    size_t num_fixed_columns() const { return num_fixed_columns_; }
    size_t num_instance_columns() const { return num_instance_columns_; }
    size_t num_selectors() const { return num_selectors_; }
    size_t num_challenges() const { return num_challenges_; }

    const std::vector<FixedColumn>& constants() const { return constants_; }
    const PermutationArgument& permutation() const { return permutation_; }

    // Rows at the end of the grid reserved for blinding factors
    size_t blinding_factors() const;

    // Smallest grid height this circuit can be laid out on
    size_t minimum_rows() const;

private:
    size_t num_advice_columns_ = 0;
    size_t num_fixed_columns_ = 0;
    size_t num_instance_columns_ = 0;
    size_t num_selectors_ = 0;
    size_t num_challenges_ = 0;

    std::vector<std::set<int32_t>> advice_queries_;
    std::vector<FixedColumn> constants_;
    PermutationArgument permutation_;
};

} // namespace plonkish
