#include "circuit/region_shape.hpp"
#include <algorithm>

namespace plonkish {

std::string RegionColumn::to_string() const {
    if (kind == Kind::Column) {
        return column.to_string();
    }
    return "Selector[" + std::to_string(selector.index) + "]";
}

Cell RegionShape::touch(const Column& column, size_t offset) {
    columns_.insert(RegionColumn(column));
    row_count_ = std::max(row_count_, offset + 1);
    return Cell{region_index_, offset, column};
}

void RegionShape::enable_selector(const std::string&, const Selector& selector, size_t offset) {
    columns_.insert(RegionColumn(selector));
    row_count_ = std::max(row_count_, offset + 1);
}

Cell RegionShape::assign_advice(const std::string&, AdviceColumn column, size_t offset, const ValueFn&) {
    return touch(column, offset);
}

Cell RegionShape::assign_advice_from_constant(
    const std::string& annotation,
    AdviceColumn column,
    size_t offset,
    const Assigned&
) {
    return assign_advice(annotation, column, offset, ValueFn());
}

std::pair<Cell, Value<Fp>> RegionShape::assign_advice_from_instance(
    const std::string&,
    InstanceColumn,
    size_t,
    AdviceColumn advice,
    size_t offset
) {
    // Only the advice target occupies rows of this region
    Cell cell = touch(advice, offset);
    return {cell, Value<Fp>::unknown()};
}

Cell RegionShape::assign_fixed(const std::string&, FixedColumn column, size_t offset, const ValueFn&) {
    return touch(column, offset);
}

} // namespace plonkish
