#include "floor_planner/single_pass.hpp"
#include "parallel/thread_coordination.h"
#include <algorithm>

namespace plonkish {

// ---------------------------------------------------------------------------
// SingleChipLayouterRegion

size_t SingleChipLayouterRegion::absolute_row(const Cell& cell) const {
    if (cell.region_index >= region_starts_.size()) {
        throw Error::synthesis("cell refers to region " + std::to_string(cell.region_index) +
                               " which has not been placed");
    }
    return region_starts_[cell.region_index] + cell.row_offset;
}

size_t SingleChipLayouterRegion::global_offset(size_t row_offset) const {
    return region_starts_[region_index_] + row_offset;
}

void SingleChipLayouterRegion::enable_selector(const std::string& annotation, const Selector& selector, size_t offset) {
    cs_.enable_selector(annotation, selector, global_offset(offset));
}

void SingleChipLayouterRegion::name_column(const std::string& annotation, const Column& column) {
    cs_.annotate_column(annotation, column);
}

Fp SingleChipLayouterRegion::query_advice(AdviceColumn column, size_t offset) const {
    return cs_.query_advice(column, global_offset(offset));
}

Fp SingleChipLayouterRegion::query_fixed(FixedColumn column, size_t offset) const {
    return cs_.query_fixed(column, global_offset(offset));
}

Cell SingleChipLayouterRegion::assign_advice(
    const std::string& annotation,
    AdviceColumn column,
    size_t offset,
    const ValueFn& to
) {
    cs_.assign_advice(annotation, column, global_offset(offset), to);
    return Cell{region_index_, offset, column};
}

Cell SingleChipLayouterRegion::assign_advice_from_constant(
    const std::string& annotation,
    AdviceColumn column,
    size_t offset,
    const Assigned& constant
) {
    Cell advice = assign_advice(annotation, column, offset, [constant]() {
        return Value<Assigned>::known(constant);
    });
    constrain_constant(advice, constant);
    return advice;
}

std::pair<Cell, Value<Fp>> SingleChipLayouterRegion::assign_advice_from_instance(
    const std::string& annotation,
    InstanceColumn instance,
    size_t row,
    AdviceColumn advice,
    size_t offset
) {
    const Value<Fp> value = cs_.query_instance(instance, row);

    Cell cell = assign_advice(annotation, advice, offset, [value]() {
        return value.map([](const Fp& v) { return Assigned(v); });
    });

    cs_.copy(cell.column, absolute_row(cell), instance, row);

    return {cell, value};
}

Cell SingleChipLayouterRegion::assign_fixed(
    const std::string& annotation,
    FixedColumn column,
    size_t offset,
    const ValueFn& to
) {
    cs_.assign_fixed(annotation, column, global_offset(offset), to);
    return Cell{region_index_, offset, column};
}

void SingleChipLayouterRegion::constrain_constant(const Cell& cell, const Assigned& constant) {
    constants_.emplace_back(constant, cell);
}

void SingleChipLayouterRegion::constrain_equal(const Cell& left, const Cell& right) {
    cs_.copy(left.column, absolute_row(left), right.column, absolute_row(right));
}

// ---------------------------------------------------------------------------
// SimpleTableLayouter

void SimpleTableLayouter::assign_cell(
    const std::string& annotation,
    const TableColumn& column,
    size_t offset,
    const ValueFn& to
) {
    if (std::find(sealed_columns_.begin(), sealed_columns_.end(), column) != sealed_columns_.end()) {
        std::cerr << "[table] " << Column(column.inner).to_string()
                  << " already belongs to a finished table" << std::endl;
        throw Error::synthesis("table column " + Column(column.inner).to_string() + " reused");
    }

    ColumnState& entry = default_and_assigned_[column];

    Value<Assigned> value = Value<Assigned>::unknown();
    cs_.assign_fixed(annotation, column.inner, offset, [&value, &to]() {
        value = to();
        return value;
    });

    if (offset == 0) {
        if (entry.default_value.has_value()) {
            std::cerr << "[table] row 0 of " << Column(column.inner).to_string()
                      << " assigned twice" << std::endl;
            throw Error::synthesis("only one default value allowed for table column " +
                                   Column(column.inner).to_string());
        }
        entry.default_value = value;
    }

    if (entry.assigned.size() <= offset) {
        entry.assigned.resize(offset + 1, false);
    }
    entry.assigned[offset] = true;
}

// ---------------------------------------------------------------------------
// SingleChipLayouter

SingleChipLayouter::SingleChipLayouter(Assignment& cs, std::vector<FixedColumn> constants, LayoutConfig config)
    : cs_(cs)
    , constants_(std::move(constants))
    , config_(config) {}

void SingleChipLayouter::place_region(const std::string& name, const RegionShape& shape) {
    const size_t start = occupancy_.place(shape);
    region_starts_.push_back(start);

    if (shape.row_count() >= config_.large_region_threshold) {
        PLONKISH_DEBUG_COUT("[layouter] " << name << " (region " << shape.region_index()
                            << ") start: " << start << ", end: " << start + shape.row_count()
                            << ", columns: " << shape.columns().size() << std::endl);
    }
}

void SingleChipLayouter::assign_constants(ConstantRequests& constants) {
    if (constants.empty()) {
        return;
    }
    if (constants_.empty()) {
        std::cerr << "[layouter] " << constants.size()
                  << " constant(s) requested but no constants column is configured" << std::endl;
        throw Error::not_enough_columns_for_constants();
    }

    const FixedColumn constants_column = constants_[0];
    const RegionColumn cursor_key(static_cast<Column>(constants_column));
    for (const auto& [constant, advice] : constants) {
        const size_t row = occupancy_.frontier(cursor_key);
        const Assigned value = constant;
        cs_.assign_fixed("Constant(" + value.evaluate().to_string() + ")", constants_column, row,
                         [value]() { return Value<Assigned>::known(value); });
        cs_.copy(constants_column, row, advice.column, region_starts_[advice.region_index] + advice.row_offset);
        occupancy_.take_row(cursor_key);
    }
}

void SingleChipLayouter::assign_table(const std::string& name, const std::function<void(Table&)>& assignment) {
    SimpleTableLayouter table_layouter(cs_, table_columns_);
    within_region(cs_, name, [&]() {
        Table table(table_layouter);
        assignment(table);
    });
    const auto& default_and_assigned = table_layouter.default_and_assigned();

    // Every column must be assigned on rows [0, first_unused) and nowhere else
    std::optional<size_t> first_unused;
    bool consistent = !default_and_assigned.empty();
    for (const auto& [column, state] : default_and_assigned) {
        const bool complete = std::all_of(state.assigned.begin(), state.assigned.end(), [](bool b) { return b; });
        if (!complete || (first_unused && *first_unused != state.assigned.size())) {
            std::cerr << "[table] " << name << ": " << Column(column.inner).to_string()
                      << " has " << state.assigned.size() << " rows"
                      << (complete ? "" : " with gaps")
                      << (first_unused ? ", expected " + std::to_string(*first_unused) : std::string())
                      << std::endl;
            consistent = false;
            break;
        }
        first_unused = state.assigned.size();
    }
    if (!consistent) {
        throw Error::synthesis("table " + name + " columns are not fully assigned to a common length");
    }

    for (const auto& entry : default_and_assigned) {
        table_columns_.push_back(entry.first);
    }

    for (const auto& [column, state] : default_and_assigned) {
        // Row 0 is always assigned in a complete column
        if (!state.default_value) {
            throw Error::synthesis("table column " + Column(column.inner).to_string() + " has no default value");
        }
        cs_.fill_from_row(column.inner, *first_unused, *state.default_value);
    }
}

void SingleChipLayouter::constrain_instance(const Cell& cell, InstanceColumn instance, size_t row) {
    if (cell.region_index >= region_starts_.size()) {
        throw Error::synthesis("cell refers to region " + std::to_string(cell.region_index) +
                               " which has not been placed");
    }
    cs_.copy(cell.column, region_starts_[cell.region_index] + cell.row_offset, instance, row);
}

bool SingleChipLayouter::use_fork() const {
    return config_.parallel_synthesis && cs_.supports_fork();
}

void SingleChipLayouter::run_batch(size_t count, const std::function<void(size_t)>& task) const {
    parallel::run_in_arena(config_.num_threads, count, task);
}

} // namespace plonkish
