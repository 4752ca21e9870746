#include "plonk/constraint_system.hpp"
#include "common/error.hpp"
#include <algorithm>
#include <iostream>
#include <string>

namespace plonkish {

size_t grid_rows(uint32_t k) {
    if (k > MAX_K) {
        std::cerr << "[cs] k=" << k << " exceeds the maximum of " << MAX_K << std::endl;
        throw Error::bounds_failure("k=" + std::to_string(k) + " exceeds " + std::to_string(MAX_K));
    }
    return size_t(1) << k;
}

AdviceColumn ConstraintSystem::advice_column() {
    advice_queries_.emplace_back();
    return AdviceColumn(num_advice_columns_++);
}

FixedColumn ConstraintSystem::fixed_column() {
    return FixedColumn(num_fixed_columns_++);
}

InstanceColumn ConstraintSystem::instance_column() {
    return InstanceColumn(num_instance_columns_++);
}

Selector ConstraintSystem::selector() {
    return Selector(num_selectors_++, true);
}

TableColumn ConstraintSystem::lookup_table_column() {
    return TableColumn(fixed_column());
}

Challenge ConstraintSystem::challenge_usable_after(uint8_t phase) {
    Challenge challenge;
    challenge.index = num_challenges_++;
    challenge.phase = phase;
    return challenge;
}

void ConstraintSystem::enable_equality(const Column& column) {
    permutation_.add_column(column);
}

void ConstraintSystem::enable_constant(FixedColumn column) {
    if (std::find(constants_.begin(), constants_.end(), column) == constants_.end()) {
        constants_.push_back(column);
        enable_equality(column);
    }
}

void ConstraintSystem::query_advice(AdviceColumn column, int32_t rotation) {
    advice_queries_.at(column.index).insert(rotation);
}

size_t ConstraintSystem::blinding_factors() const {
    // Advice columns are evaluated at no more than this many distinct points
    size_t factors = 1;
    for (const auto& rotations : advice_queries_) {
        factors = std::max(factors, rotations.size());
    }
    // The permutation argument witnesses are evaluated at most 3 times
    factors = std::max<size_t>(3, factors);
    // One more opening during multiopen
    return factors + 1;
}

size_t ConstraintSystem::minimum_rows() const {
    return blinding_factors()   // blinding rows
        + 1                     // l_last
        + 1                     // l_0
        + 1;                    // at least one usable row
}

} // namespace plonkish
