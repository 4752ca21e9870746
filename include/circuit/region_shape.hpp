#pragma once

#include "circuit/region.hpp"
#include <set>
#include <string>

namespace plonkish {

/**
 * RegionColumn - Key of the occupancy map: either a grid column or a selector.
 * Every Column orders before every Selector.
 */
struct RegionColumn {
    enum class Kind { Column, Selector };

    Kind kind = Kind::Column;
    Column column;
    Selector selector;

    RegionColumn() = default;
    RegionColumn(const Column& c) : kind(Kind::Column), column(c) {}
    RegionColumn(const Selector& s) : kind(Kind::Selector), selector(s) {}

    bool operator==(const RegionColumn& rhs) const {
        if (kind != rhs.kind) return false;
        return kind == Kind::Column ? column == rhs.column : selector == rhs.selector;
    }
    bool operator!=(const RegionColumn& rhs) const { return !(*this == rhs); }
    bool operator<(const RegionColumn& rhs) const {
        if (kind != rhs.kind) return kind == Kind::Column;
        return kind == Kind::Column ? column < rhs.column : selector < rhs.selector;
    }

    std::string to_string() const;
};

/**
 * RegionShape - Measuring layouter
 *
 * Runs a region's assignment routine without producing any value and records
 * the columns it touches and how many rows it spans. Value producers are never
 * called; queries return zero and instance reads are unknown.
 */
class RegionShape : public RegionLayouter {
public:
    explicit RegionShape(RegionIndex region_index) : region_index_(region_index) {}

    RegionIndex region_index() const { return region_index_; }
    const std::set<RegionColumn>& columns() const { return columns_; }
    size_t row_count() const { return row_count_; }

    void enable_selector(const std::string& annotation, const Selector& selector, size_t offset) override;
    void name_column(const std::string&, const Column&) override {}

    Fp query_advice(AdviceColumn, size_t) const override { return Fp::zero(); }
    Fp query_fixed(FixedColumn, size_t) const override { return Fp::zero(); }

    Cell assign_advice(const std::string& annotation, AdviceColumn column, size_t offset,
                       const ValueFn& to) override;
    Cell assign_advice_from_constant(const std::string& annotation, AdviceColumn column,
                                     size_t offset, const Assigned& constant) override;
    std::pair<Cell, Value<Fp>> assign_advice_from_instance(
        const std::string& annotation, InstanceColumn instance, size_t row,
        AdviceColumn advice, size_t offset) override;
    Cell assign_fixed(const std::string& annotation, FixedColumn column, size_t offset,
                      const ValueFn& to) override;

    void constrain_constant(const Cell&, const Assigned&) override {}
    void constrain_equal(const Cell&, const Cell&) override {}

    size_t global_offset(size_t row_offset) const override { return row_offset; }

private:
    Cell touch(const Column& column, size_t offset);

    RegionIndex region_index_;
    std::set<RegionColumn> columns_;
    size_t row_count_ = 0;
};

} // namespace plonkish
