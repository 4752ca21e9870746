#pragma once

#include "circuit/column_occupancy.hpp"
#include "circuit/region.hpp"
#include "circuit/region_shape.hpp"
#include "common/debug_control.hpp"
#include "common/error.hpp"
#include "config/layout_config.hpp"
#include "plonk/assignment.hpp"
#include <chrono>
#include <exception>
#include <functional>
#include <iostream>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace plonkish {

// (constant, cell) requests collected by a region, consolidated after it
using ConstantRequests = std::vector<std::pair<Assigned, Cell>>;

/**
 * SingleChipLayouterRegion - Materializing layouter for one placed region
 *
 * Translates region-relative offsets into absolute rows using the start of
 * every region placed so far, and forwards everything to the assignment.
 */
class SingleChipLayouterRegion : public RegionLayouter {
public:
    SingleChipLayouterRegion(Assignment& cs, const std::vector<size_t>& region_starts, RegionIndex region_index)
        : cs_(cs), region_starts_(region_starts), region_index_(region_index) {}

    void enable_selector(const std::string& annotation, const Selector& selector, size_t offset) override;
    void name_column(const std::string& annotation, const Column& column) override;

    Fp query_advice(AdviceColumn column, size_t offset) const override;
    Fp query_fixed(FixedColumn column, size_t offset) const override;

    Cell assign_advice(const std::string& annotation, AdviceColumn column, size_t offset,
                       const ValueFn& to) override;
    Cell assign_advice_from_constant(const std::string& annotation, AdviceColumn column,
                                     size_t offset, const Assigned& constant) override;
    std::pair<Cell, Value<Fp>> assign_advice_from_instance(
        const std::string& annotation, InstanceColumn instance, size_t row,
        AdviceColumn advice, size_t offset) override;
    Cell assign_fixed(const std::string& annotation, FixedColumn column, size_t offset,
                      const ValueFn& to) override;

    void constrain_constant(const Cell& cell, const Assigned& constant) override;
    void constrain_equal(const Cell& left, const Cell& right) override;

    size_t global_offset(size_t row_offset) const override;

    ConstantRequests take_constants() { return std::move(constants_); }

private:
    size_t absolute_row(const Cell& cell) const;

    Assignment& cs_;
    const std::vector<size_t>& region_starts_;
    RegionIndex region_index_;
    ConstantRequests constants_;
};

/**
 * SimpleTableLayouter - Collects one lookup table and validates its shape
 *
 * Row 0 of every column is the default value used to pad the column.
 */
class SimpleTableLayouter : public TableLayouter {
public:
    struct ColumnState {
        std::optional<Value<Assigned>> default_value;
        std::vector<bool> assigned;
    };

    SimpleTableLayouter(Assignment& cs, const std::vector<TableColumn>& sealed_columns)
        : cs_(cs), sealed_columns_(sealed_columns) {}

    /**
     * @throws Error(Synthesis) if column belongs to an earlier table or row 0
     * is assigned twice
     */
    void assign_cell(const std::string& annotation, const TableColumn& column, size_t offset,
                     const ValueFn& to) override;

    const std::map<TableColumn, ColumnState>& default_and_assigned() const { return default_and_assigned_; }

private:
    Assignment& cs_;
    const std::vector<TableColumn>& sealed_columns_;
    std::map<TableColumn, ColumnState> default_and_assigned_;
};

/**
 * SingleChipLayouter - Greedy single-pass floor planner
 *
 * Every region routine runs twice: once against a RegionShape to measure it,
 * once against a SingleChipLayouterRegion at the row chosen by the occupancy
 * map. Regions are never reordered. Routines must take a Region& and follow
 * the same control flow in both passes.
 */
class SingleChipLayouter {
public:
    SingleChipLayouter(Assignment& cs, std::vector<FixedColumn> constants, LayoutConfig config = LayoutConfig());

    /**
     * Measure, place and materialize one region, then consolidate its constants.
     *
     * @return Whatever the routine returns
     */
    template<typename A>
    auto assign_region(const std::string& name, A&& assignment)
        -> std::invoke_result_t<A&, Region&>;

    /**
     * Lay out a batch of independent regions. Placement is sequential; the
     * materializing pass runs concurrently on forked sub-assignments when the
     * assignment supports it and parallel synthesis is enabled. Equality
     * constraints are merged and constants consolidated in region order.
     *
     * Every routine runs to completion; the first failure in region order is
     * rethrown before constants are consolidated. A failed forked batch is not
     * merged.
     */
    template<typename A>
    auto assign_regions(const std::string& name, std::vector<A>& assignments)
        -> std::conditional_t<std::is_void_v<std::invoke_result_t<A&, Region&>>,
                              void,
                              std::vector<std::invoke_result_t<A&, Region&>>>;

    /**
     * Assign a lookup table starting at row 0.
     *
     * @throws Error(Synthesis) on reuse of a table column, duplicate default,
     * or columns of unequal or gapped length
     */
    void assign_table(const std::string& name, const std::function<void(Table&)>& assignment);

    // Constrain cell to equal instance[row]
    void constrain_instance(const Cell& cell, InstanceColumn instance, size_t row);

    Value<Fp> get_challenge(const Challenge& challenge) const { return cs_.get_challenge(challenge); }

    void push_namespace(const std::string& name) { cs_.push_namespace(name); }
    void pop_namespace(const std::optional<std::string>& gadget_name = std::nullopt) {
        cs_.pop_namespace(gadget_name);
    }

    Assignment& cs() { return cs_; }
    const LayoutConfig& config() const { return config_; }
    const std::vector<size_t>& region_starts() const { return region_starts_; }
    const std::vector<TableColumn>& table_columns() const { return table_columns_; }

private:
    // Measure routine, choose its start row and record it in the arena
    template<typename A>
    RegionShape measure_and_place(const std::string& name, A& assignment);

    void place_region(const std::string& name, const RegionShape& shape);

    // Run body between enter_region and exit_region; the region is closed on every exit path
    template<typename F>
    static auto within_region(Assignment& target, const std::string& name, F&& body)
        -> std::invoke_result_t<F&>;

    // Write each constant to the next free row of the first constants column
    void assign_constants(ConstantRequests& constants);

    bool use_fork() const;

    // Run task(i) for every region of a batch on the worker pool
    void run_batch(size_t count, const std::function<void(size_t)>& task) const;

    Assignment& cs_;
    std::vector<FixedColumn> constants_;
    LayoutConfig config_;
    std::vector<size_t> region_starts_;
    ColumnOccupancy occupancy_;
    std::vector<TableColumn> table_columns_;
};

/**
 * SimpleFloorPlanner - Runs a circuit's synthesize() against a
 * SingleChipLayouter.
 *
 * A circuit provides:
 *   using Config = ...;
 *   static Config configure(ConstraintSystem&);
 *   void synthesize(const Config&, SingleChipLayouter&) const;
 */
struct SimpleFloorPlanner {
    template<typename C>
    static void synthesize(
        Assignment& cs,
        const C& circuit,
        const typename C::Config& config,
        std::vector<FixedColumn> constants,
        const LayoutConfig& layout_config = LayoutConfig()
    ) {
        SingleChipLayouter layouter(cs, std::move(constants), layout_config);
        circuit.synthesize(config, layouter);
    }
};

// ---------------------------------------------------------------------------

template<typename F>
auto SingleChipLayouter::within_region(Assignment& target, const std::string& name, F&& body)
    -> std::invoke_result_t<F&>
{
    using R = std::invoke_result_t<F&>;

    target.enter_region(name);
    if constexpr (std::is_void_v<R>) {
        try {
            body();
        } catch (...) {
            target.exit_region();
            throw;
        }
        target.exit_region();
    } else {
        std::optional<R> result;
        try {
            result.emplace(body());
        } catch (...) {
            target.exit_region();
            throw;
        }
        target.exit_region();
        return std::move(*result);
    }
}

template<typename A>
RegionShape SingleChipLayouter::measure_and_place(const std::string& name, A& assignment) {
    RegionShape shape(region_starts_.size());
    {
        Region region(shape);
        assignment(region);
    }
    place_region(name, shape);
    return shape;
}

template<typename A>
auto SingleChipLayouter::assign_region(const std::string& name, A&& assignment)
    -> std::invoke_result_t<A&, Region&>
{
    using R = std::invoke_result_t<A&, Region&>;

    const RegionIndex region_index = region_starts_.size();
    measure_and_place(name, assignment);

    SingleChipLayouterRegion layouter_region(cs_, region_starts_, region_index);
    Region region(layouter_region);
    if constexpr (std::is_void_v<R>) {
        within_region(cs_, name, [&]() { assignment(region); });
        ConstantRequests constants = layouter_region.take_constants();
        assign_constants(constants);
    } else {
        R result = within_region(cs_, name, [&]() { return assignment(region); });
        ConstantRequests constants = layouter_region.take_constants();
        assign_constants(constants);
        return result;
    }
}

template<typename A>
auto SingleChipLayouter::assign_regions(const std::string& name, std::vector<A>& assignments)
    -> std::conditional_t<std::is_void_v<std::invoke_result_t<A&, Region&>>,
                          void,
                          std::vector<std::invoke_result_t<A&, Region&>>>
{
    using R = std::invoke_result_t<A&, Region&>;
    using Slot = std::conditional_t<std::is_void_v<R>, char, std::optional<R>>;

    const RegionIndex first_region = region_starts_.size();
    const size_t count = assignments.size();

    // Measure and place sequentially; placement never depends on worker order
    std::vector<RowRange> ranges;
    ranges.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        RegionShape shape = measure_and_place(name + "_" + std::to_string(i), assignments[i]);
        const size_t start = region_starts_.back();
        ranges.emplace_back(start, start + shape.row_count());
    }

    std::vector<Slot> results(count);
    std::vector<ConstantRequests> constants(count);

    std::vector<std::exception_ptr> errors(count);

    // Every region runs to completion; its failure is kept for after the batch
    auto materialize = [&](Assignment& target, size_t i) {
        try {
            SingleChipLayouterRegion layouter_region(target, region_starts_, first_region + i);
            Region region(layouter_region);
            within_region(target, name + "_" + std::to_string(i), [&]() {
                if constexpr (std::is_void_v<R>) {
                    assignments[i](region);
                    results[i] = 1;
                } else {
                    results[i].emplace(assignments[i](region));
                }
            });
            constants[i] = layouter_region.take_constants();
        } catch (...) {
            errors[i] = std::current_exception();
        }
    };

    // Surface the first failure in region order
    auto rethrow_first_error = [&]() {
        for (size_t i = 0; i < count; ++i) {
            if (errors[i]) {
                std::cerr << "[layouter] region " << name << "_" << i << " failed" << std::endl;
                std::rethrow_exception(errors[i]);
            }
        }
    };

    if (use_fork()) {
        auto fork_start = std::chrono::high_resolution_clock::now();
        std::vector<std::unique_ptr<Assignment>> sub_cs = cs_.fork(ranges);
        PLONKISH_IF_PROFILE {
            auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
                std::chrono::high_resolution_clock::now() - fork_start).count() / 1000.0;
            std::cout << "[layouter] forked " << sub_cs.size() << " sub-assignments in "
                      << elapsed << " ms" << std::endl;
        }

        run_batch(count, [&](size_t i) {
            materialize(*sub_cs[i], i);
        });

        // A failed batch is never merged
        rethrow_first_error();

        auto merge_start = std::chrono::high_resolution_clock::now();
        cs_.merge(std::move(sub_cs));
        PLONKISH_IF_PROFILE {
            auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
                std::chrono::high_resolution_clock::now() - merge_start).count() / 1000.0;
            std::cout << "[layouter] merged " << count << " sub-assignments in "
                      << elapsed << " ms" << std::endl;
        }
    } else {
        for (size_t i = 0; i < count; ++i) {
            materialize(cs_, i);
        }
        rethrow_first_error();
    }

    ConstantRequests all_constants;
    for (auto& requests : constants) {
        all_constants.insert(all_constants.end(), requests.begin(), requests.end());
    }
    assign_constants(all_constants);

    if constexpr (!std::is_void_v<R>) {
        std::vector<R> out;
        out.reserve(count);
        for (auto& slot : results) {
            out.push_back(std::move(*slot));
        }
        return out;
    }
}

} // namespace plonkish
