#pragma once

#include "circuit/cell.hpp"
#include "plonk/assignment.hpp"
#include "plonk/column.hpp"
#include "types/assigned.hpp"
#include "types/field_element.hpp"
#include "types/value.hpp"
#include <string>
#include <utility>

namespace plonkish {

/**
 * RegionLayouter - What a region's assignment routine can do to its region.
 *
 * Offsets are relative to the start of the region. The floor planner backs
 * each region twice: once with a shape pass that only measures, once with a
 * materializer that writes to the grid.
 */
class RegionLayouter {
public:
    virtual ~RegionLayouter() = default;

    virtual void enable_selector(const std::string& annotation, const Selector& selector, size_t offset) = 0;

    virtual void name_column(const std::string& annotation, const Column& column) = 0;

    virtual Fp query_advice(AdviceColumn column, size_t offset) const = 0;
    virtual Fp query_fixed(FixedColumn column, size_t offset) const = 0;

    virtual Cell assign_advice(
        const std::string& annotation,
        AdviceColumn column,
        size_t offset,
        const ValueFn& to) = 0;

    virtual Cell assign_advice_from_constant(
        const std::string& annotation,
        AdviceColumn column,
        size_t offset,
        const Assigned& constant) = 0;

    // Copies instance[row] into advice[offset] and constrains the two equal
    virtual std::pair<Cell, Value<Fp>> assign_advice_from_instance(
        const std::string& annotation,
        InstanceColumn instance,
        size_t row,
        AdviceColumn advice,
        size_t offset) = 0;

    virtual Cell assign_fixed(
        const std::string& annotation,
        FixedColumn column,
        size_t offset,
        const ValueFn& to) = 0;

    // Require cell to equal constant once constants are consolidated
    virtual void constrain_constant(const Cell& cell, const Assigned& constant) = 0;

    virtual void constrain_equal(const Cell& left, const Cell& right) = 0;

    virtual size_t global_offset(size_t row_offset) const = 0;
};

class Region;

/**
 * AssignedCell - A cell together with the value written into it
 */
class AssignedCell {
public:
    AssignedCell(Value<Assigned> value, Cell cell) : value_(std::move(value)), cell_(cell) {}

    const Value<Assigned>& value() const { return value_; }
    Value<Fp> value_field() const {
        return value_.map([](const Assigned& a) { return a.evaluate(); });
    }
    const Cell& cell() const { return cell_; }

    // Assign this value into region at (column, offset) and constrain both cells equal
    AssignedCell copy_advice(
        const std::string& annotation,
        Region& region,
        AdviceColumn column,
        size_t offset) const;

private:
    Value<Assigned> value_;
    Cell cell_;
};

/**
 * Region - Handle passed to a region's assignment routine
 */
class Region {
public:
    explicit Region(RegionLayouter& layouter) : layouter_(layouter) {}

    void enable_selector(const std::string& annotation, const Selector& selector, size_t offset);
    void name_column(const std::string& annotation, const Column& column);

    AssignedCell assign_advice(
        const std::string& annotation,
        AdviceColumn column,
        size_t offset,
        const ValueFn& to);

    AssignedCell assign_advice_from_constant(
        const std::string& annotation,
        AdviceColumn column,
        size_t offset,
        const Assigned& constant);

    AssignedCell assign_advice_from_instance(
        const std::string& annotation,
        InstanceColumn instance,
        size_t row,
        AdviceColumn advice,
        size_t offset);

    AssignedCell assign_fixed(
        const std::string& annotation,
        FixedColumn column,
        size_t offset,
        const ValueFn& to);

    void constrain_constant(const Cell& cell, const Assigned& constant);
    void constrain_equal(const Cell& left, const Cell& right);

    Fp query_advice(AdviceColumn column, size_t offset) const;
    Fp query_fixed(FixedColumn column, size_t offset) const;

    size_t global_offset(size_t row_offset) const;

private:
    RegionLayouter& layouter_;
};

/**
 * TableLayouter - What a table's assignment routine can do to its table.
 * Offsets are absolute rows; tables always start at row 0.
 */
class TableLayouter {
public:
    virtual ~TableLayouter() = default;

    virtual void assign_cell(
        const std::string& annotation,
        const TableColumn& column,
        size_t offset,
        const ValueFn& to) = 0;
};

class Table {
public:
    explicit Table(TableLayouter& layouter) : layouter_(layouter) {}

    void assign_cell(const std::string& annotation, const TableColumn& column, size_t offset, const ValueFn& to) {
        layouter_.assign_cell(annotation, column, offset, to);
    }

private:
    TableLayouter& layouter_;
};

} // namespace plonkish
