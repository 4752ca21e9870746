#include "circuit/region.hpp"

namespace plonkish {

AssignedCell AssignedCell::copy_advice(
    const std::string& annotation,
    Region& region,
    AdviceColumn column,
    size_t offset
) const {
    const Value<Assigned> value = value_;
    AssignedCell assigned = region.assign_advice(annotation, column, offset, [value]() { return value; });
    region.constrain_equal(assigned.cell(), cell_);
    return assigned;
}

void Region::enable_selector(const std::string& annotation, const Selector& selector, size_t offset) {
    layouter_.enable_selector(annotation, selector, offset);
}

void Region::name_column(const std::string& annotation, const Column& column) {
    layouter_.name_column(annotation, column);
}

AssignedCell Region::assign_advice(
    const std::string& annotation,
    AdviceColumn column,
    size_t offset,
    const ValueFn& to
) {
    // The value is only known if the layouter asked for it
    Value<Assigned> value = Value<Assigned>::unknown();
    Cell cell = layouter_.assign_advice(annotation, column, offset, [&value, &to]() {
        value = to();
        return value;
    });
    return AssignedCell(value, cell);
}

AssignedCell Region::assign_advice_from_constant(
    const std::string& annotation,
    AdviceColumn column,
    size_t offset,
    const Assigned& constant
) {
    Cell cell = layouter_.assign_advice_from_constant(annotation, column, offset, constant);
    return AssignedCell(Value<Assigned>::known(constant), cell);
}

AssignedCell Region::assign_advice_from_instance(
    const std::string& annotation,
    InstanceColumn instance,
    size_t row,
    AdviceColumn advice,
    size_t offset
) {
    auto [cell, value] = layouter_.assign_advice_from_instance(annotation, instance, row, advice, offset);
    return AssignedCell(value.map([](const Fp& v) { return Assigned(v); }), cell);
}

AssignedCell Region::assign_fixed(
    const std::string& annotation,
    FixedColumn column,
    size_t offset,
    const ValueFn& to
) {
    Value<Assigned> value = Value<Assigned>::unknown();
    Cell cell = layouter_.assign_fixed(annotation, column, offset, [&value, &to]() {
        value = to();
        return value;
    });
    return AssignedCell(value, cell);
}

void Region::constrain_constant(const Cell& cell, const Assigned& constant) {
    layouter_.constrain_constant(cell, constant);
}

void Region::constrain_equal(const Cell& left, const Cell& right) {
    layouter_.constrain_equal(left, right);
}

Fp Region::query_advice(AdviceColumn column, size_t offset) const {
    return layouter_.query_advice(column, offset);
}

Fp Region::query_fixed(FixedColumn column, size_t offset) const {
    return layouter_.query_fixed(column, offset);
}

size_t Region::global_offset(size_t row_offset) const {
    return layouter_.global_offset(row_offset);
}

} // namespace plonkish
