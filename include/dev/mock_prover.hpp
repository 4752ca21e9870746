#pragma once

#include "common/error.hpp"
#include "config/layout_config.hpp"
#include "floor_planner/single_pass.hpp"
#include "plonk/assignment.hpp"
#include "plonk/column_store.hpp"
#include "plonk/constraint_system.hpp"
#include "plonk/permutation.hpp"
#include <cstdint>
#include <iostream>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace plonkish {
namespace dev {

/**
 * CellValue - Content of one witness-grid cell
 */
struct CellValue {
    enum class State {
        Unassigned,
        Assigned,
        Poison      // blinding rows; never readable
    };

    State state = State::Unassigned;
    Fp value;

    static CellValue assigned(Fp v) { return CellValue{State::Assigned, v}; }
    static CellValue poison() { return CellValue{State::Poison, Fp::zero()}; }

    bool is_assigned() const { return state == State::Assigned; }
};

/**
 * RegionRecord - What one region touched, kept for diagnostics
 */
struct RegionRecord {
    std::string name;
    std::set<Column> columns;
    std::optional<std::pair<size_t, size_t>> rows;     // inclusive
    std::map<size_t, std::vector<size_t>> enabled_selectors;
    std::map<Column, std::string> annotations;

    void update_extent(const Column& column, size_t row);
};

/**
 * VerifyFailure - A copy constraint that does not hold on the witness
 */
struct VerifyFailure {
    enum class Kind {
        CellNotAssigned,    // an endpoint was never written
        Permutation         // endpoints hold different values
    };

    Kind kind;
    CopyCell left;
    CopyCell right;

    std::string to_string() const;
};

/**
 * MockProver - Assignment that keeps the full witness
 *
 * Lays a circuit out with concrete values so that copy constraints can be
 * checked without running a prover. Supports fork/merge: every sub-prover
 * owns one row window of the advice, fixed and selector grids and shares the
 * read-only instance values and challenges.
 */
class MockProver : public Assignment {
public:
    /**
     * Synthesize circuit on a 2^k grid.
     *
     * @throws Error(NotEnoughRowsAvailable) if 2^k < cs.minimum_rows()
     * @throws Error(InstanceTooLarge) if an instance column exceeds the usable rows
     */
    template<typename C>
    static MockProver run(
        uint32_t k,
        const C& circuit,
        std::vector<std::vector<Fp>> instances,
        const LayoutConfig& layout_config = LayoutConfig()
    );

    MockProver(uint32_t k, const ConstraintSystem& cs, const std::vector<std::vector<Fp>>& instances);

    uint32_t k() const { return k_; }
    size_t n() const { return size_t(1) << k_; }
    const ConstraintSystem& constraint_system() const { return cs_; }
    const RowRange& usable_rows() const { return usable_rows_; }

    // Copy constraints that do not hold, in the order they were added
    std::vector<VerifyFailure> verify() const;

    // Regions, constants and copies as JSON
    nlohmann::json layout_json() const;

    const std::vector<RegionRecord>& regions() const { return regions_; }
    const PermutationAssembly* permutation() const { return permutation_ ? &*permutation_ : nullptr; }
    const std::vector<std::pair<CopyCell, CopyCell>>& buffered_copies() const { return copies_; }

    CellValue advice_cell(AdviceColumn column, size_t row) const { return advice_.get(column.index, row); }
    CellValue fixed_cell(FixedColumn column, size_t row) const { return fixed_.get(column.index, row); }
    bool selector_enabled(const Selector& selector, size_t row) const { return selectors_.get(selector.index, row); }

    void enter_region(const std::string& name) override;
    void exit_region() override;
    void annotate_column(const std::string& annotation, const Column& column) override;

    void enable_selector(const std::string& annotation, const Selector& selector, size_t row) override;

    Fp query_advice(AdviceColumn column, size_t row) const override;
    Fp query_fixed(FixedColumn column, size_t row) const override;
    Value<Fp> query_instance(InstanceColumn column, size_t row) const override;

    void assign_advice(const std::string& annotation, AdviceColumn column, size_t row, const ValueFn& to) override;
    void assign_fixed(const std::string& annotation, FixedColumn column, size_t row, const ValueFn& to) override;

    void copy(const Column& left_column, size_t left_row,
              const Column& right_column, size_t right_row) override;

    void fill_from_row(FixedColumn column, size_t from_row, const Value<Assigned>& to) override;

    Value<Fp> get_challenge(const Challenge& challenge) const override;

    void push_namespace(const std::string& name) override { namespaces_.push_back(name); }
    void pop_namespace(const std::optional<std::string>&) override {
        if (!namespaces_.empty()) {
            namespaces_.pop_back();
        }
    }

    bool supports_fork() const override { return true; }
    std::vector<std::unique_ptr<Assignment>> fork(const std::vector<RowRange>& ranges) override;
    void merge(std::vector<std::unique_ptr<Assignment>> sub_cs) override;

private:
    using SharedGrid = std::shared_ptr<const std::vector<std::vector<CellValue>>>;

    MockProver(uint32_t k, ConstraintSystem cs, RowRange usable_rows, RowRange rw_rows,
               ColumnStore<CellValue> advice, ColumnStore<CellValue> fixed, ColumnStore<bool> selectors,
               SharedGrid instance, std::shared_ptr<const std::vector<Fp>> challenges);

    void check_write(size_t row, const char* operation) const;
    void record(const Column& column, size_t row);
    CellValue cell_at(const CopyCell& cell) const;

    uint32_t k_;
    ConstraintSystem cs_;
    RowRange usable_rows_;
    RowRange rw_rows_;

    ColumnStore<CellValue> advice_;
    ColumnStore<CellValue> fixed_;
    ColumnStore<bool> selectors_;
    SharedGrid instance_;
    std::shared_ptr<const std::vector<Fp>> challenges_;

    std::optional<PermutationAssembly> permutation_;
    std::vector<std::pair<CopyCell, CopyCell>> copies_;

    std::vector<RegionRecord> regions_;
    std::optional<RegionRecord> current_region_;
    std::vector<std::string> namespaces_;
};

template<typename C>
MockProver MockProver::run(
    uint32_t k,
    const C& circuit,
    std::vector<std::vector<Fp>> instances,
    const LayoutConfig& layout_config
) {
    ConstraintSystem cs;
    typename C::Config config = C::configure(cs);

    const size_t n = grid_rows(k);
    if (n < cs.minimum_rows()) {
        std::cerr << "[mock] k=" << k << " gives " << n << " rows, circuit needs "
                  << cs.minimum_rows() << std::endl;
        throw Error::not_enough_rows_available(k);
    }

    MockProver prover(k, cs, instances);
    prover.begin_synthesis();
    SimpleFloorPlanner::synthesize(prover, circuit, config, cs.constants(), layout_config);
    prover.seal();
    return prover;
}

} // namespace dev
} // namespace plonkish
