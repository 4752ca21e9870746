#pragma once

#include "common/debug_control.hpp"
#include "common/error.hpp"
#include "config/layout_config.hpp"
#include "floor_planner/single_pass.hpp"
#include "plonk/assignment.hpp"
#include "plonk/column_store.hpp"
#include "plonk/constraint_system.hpp"
#include "plonk/permutation.hpp"
#include <cstdint>
#include <iostream>
#include <memory>
#include <optional>
#include <vector>

namespace plonkish {
namespace keygen {

/**
 * Assembly - Assignment used while deriving keys
 *
 * Advice is ignored. Fixed and selector writes go to storage covering the
 * whole grid, restricted to the usable rows (the trailing
 * blinding_factors + 1 rows are reserved) and to this assembly's read/write
 * window. A root assembly forwards copies to its permutation assembly; a
 * forked one buffers them for merge().
 */
class Assembly : public Assignment {
public:
    struct Artifacts {
        std::vector<std::vector<Assigned>> fixed;
        std::vector<std::vector<bool>> selectors;
        PermutationAssembly permutation;
    };

    /**
     * @throws Error(NotEnoughRowsAvailable) if 2^k leaves no usable row
     */
    Assembly(uint32_t k, const ConstraintSystem& cs);

    uint32_t k() const { return k_; }
    size_t n() const { return size_t(1) << k_; }
    const RowRange& usable_rows() const { return usable_rows_; }
    const RowRange& rw_rows() const { return rw_rows_; }

    const ColumnStore<Assigned>& fixed() const { return fixed_; }
    const ColumnStore<bool>& selectors() const { return selectors_; }
    const PermutationAssembly* permutation() const { return permutation_ ? &*permutation_ : nullptr; }

    // Copies waiting for merge(); empty on a root assembly
    const std::vector<std::pair<CopyCell, CopyCell>>& buffered_copies() const { return copies_; }

    void enter_region(const std::string&) override {}
    void exit_region() override {}
    void annotate_column(const std::string&, const Column&) override {}

    void enable_selector(const std::string& annotation, const Selector& selector, size_t row) override;

    Fp query_advice(AdviceColumn, size_t) const override { return Fp::zero(); }
    Fp query_fixed(FixedColumn column, size_t row) const override;
    Value<Fp> query_instance(InstanceColumn column, size_t row) const override;

    void assign_advice(const std::string&, AdviceColumn, size_t, const ValueFn&) override {}
    void assign_fixed(const std::string& annotation, FixedColumn column, size_t row, const ValueFn& to) override;

    void copy(const Column& left_column, size_t left_row,
              const Column& right_column, size_t right_row) override;

    void fill_from_row(FixedColumn column, size_t from_row, const Value<Assigned>& to) override;

    Value<Fp> get_challenge(const Challenge&) const override { return Value<Fp>::unknown(); }

    void push_namespace(const std::string&) override {}
    void pop_namespace(const std::optional<std::string>&) override {}

    bool supports_fork() const override { return true; }
    std::vector<std::unique_ptr<Assignment>> fork(const std::vector<RowRange>& ranges) override;
    void merge(std::vector<std::unique_ptr<Assignment>> sub_cs) override;

    /**
     * Hand out the finished storage.
     * @throws Error(Synthesis) unless sealed, or on a forked assembly
     */
    Artifacts release() &&;

private:
    // Forked sub-assembly owning one window
    Assembly(uint32_t k, RowRange usable_rows, RowRange rw_rows,
             ColumnStore<Assigned> fixed, ColumnStore<bool> selectors);

    void check_usable(size_t row) const;
    void check_rw(size_t row, const char* operation) const;

    uint32_t k_;
    ColumnStore<Assigned> fixed_;
    ColumnStore<bool> selectors_;
    std::optional<PermutationAssembly> permutation_;
    std::vector<std::pair<CopyCell, CopyCell>> copies_;
    RowRange usable_rows_;
    RowRange rw_rows_;
};

} // namespace keygen

/**
 * VerifyingKey - Fixed data of a circuit on a 2^k grid
 */
struct VerifyingKey {
    uint32_t k = 0;
    ConstraintSystem cs;
    std::vector<std::vector<Fp>> fixed;
    std::vector<std::vector<bool>> selectors;
    std::vector<Column> permutation_columns;
    std::vector<std::vector<PermutationAssembly::Position>> permutation_mapping;
    // Copy constraints in the order they reached the permutation assembly
    std::vector<std::pair<CopyCell, CopyCell>> copies;

    size_t n() const { return size_t(1) << k; }
};

/**
 * ProvingKey - Verifying key plus the Lagrange-basis helper vectors
 */
struct ProvingKey {
    VerifyingKey vk;
    std::vector<Fp> l0;             // 1 on row 0
    std::vector<Fp> l_blind;        // 1 on the blinding rows
    std::vector<Fp> l_last;         // 1 on the first row after the usable rows
    std::vector<Fp> l_active_row;   // 1 - (l_last + l_blind)
};

// Evaluate fixed data of a sealed assembly into a verifying key
VerifyingKey finalize_vk(uint32_t k, ConstraintSystem cs, keygen::Assembly&& assembly);

/**
 * Derive the verifying key of circuit on a 2^k row grid.
 *
 * @throws Error(NotEnoughRowsAvailable) if 2^k < cs.minimum_rows()
 */
template<typename C>
VerifyingKey keygen_vk(uint32_t k, const C& circuit, const LayoutConfig& layout_config = LayoutConfig()) {
    ConstraintSystem cs;
    typename C::Config config = C::configure(cs);

    const size_t n = grid_rows(k);
    if (n < cs.minimum_rows()) {
        std::cerr << "[keygen] k=" << k << " gives " << n << " rows, circuit needs "
                  << cs.minimum_rows() << std::endl;
        throw Error::not_enough_rows_available(k);
    }

    keygen::Assembly assembly(k, cs);
    assembly.begin_synthesis();
    SimpleFloorPlanner::synthesize(assembly, circuit, config, cs.constants(), layout_config);
    assembly.seal();

    return finalize_vk(k, std::move(cs), std::move(assembly));
}

ProvingKey keygen_pk(VerifyingKey vk);

} // namespace plonkish
