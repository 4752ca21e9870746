#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <tuple>

namespace plonkish {

enum class ColumnType {
    Advice,     // witness values, private to the prover
    Fixed,      // values baked into the proving/verifying key
    Instance    // public inputs
};

const char* column_type_name(ColumnType type);

/**
 * Column - A column of any type, identified by (type, index)
 */
struct Column {
    size_t index = 0;
    ColumnType column_type = ColumnType::Advice;

    Column() = default;
    Column(size_t idx, ColumnType type) : index(idx), column_type(type) {}

    bool operator==(const Column& rhs) const {
        return index == rhs.index && column_type == rhs.column_type;
    }
    bool operator!=(const Column& rhs) const { return !(*this == rhs); }
    bool operator<(const Column& rhs) const {
        return std::make_tuple(static_cast<int>(column_type), index) <
               std::make_tuple(static_cast<int>(rhs.column_type), rhs.index);
    }

    std::string to_string() const;
};

/**
 * TypedColumn - Column whose type is fixed at compile time
 */
template<ColumnType Type>
struct TypedColumn {
    size_t index = 0;

    TypedColumn() = default;
    explicit TypedColumn(size_t idx) : index(idx) {}

    operator Column() const { return Column(index, Type); }

    bool operator==(const TypedColumn& rhs) const { return index == rhs.index; }
    bool operator!=(const TypedColumn& rhs) const { return index != rhs.index; }
    bool operator<(const TypedColumn& rhs) const { return index < rhs.index; }
};

using AdviceColumn = TypedColumn<ColumnType::Advice>;
using FixedColumn = TypedColumn<ColumnType::Fixed>;
using InstanceColumn = TypedColumn<ColumnType::Instance>;

/**
 * Selector - Boolean fixed column toggling gates per row
 */
struct Selector {
    size_t index = 0;
    bool simple = true;

    Selector() = default;
    Selector(size_t idx, bool is_simple) : index(idx), simple(is_simple) {}

    bool operator==(const Selector& rhs) const { return index == rhs.index && simple == rhs.simple; }
    bool operator!=(const Selector& rhs) const { return !(*this == rhs); }
    bool operator<(const Selector& rhs) const {
        return std::make_tuple(index, simple) < std::make_tuple(rhs.index, rhs.simple);
    }
};

/**
 * TableColumn - Fixed column reserved for a lookup table
 */
struct TableColumn {
    FixedColumn inner;

    TableColumn() = default;
    explicit TableColumn(FixedColumn column) : inner(column) {}

    bool operator==(const TableColumn& rhs) const { return inner == rhs.inner; }
    bool operator!=(const TableColumn& rhs) const { return inner != rhs.inner; }
    bool operator<(const TableColumn& rhs) const { return inner < rhs.inner; }
};

/**
 * Challenge - Verifier challenge available after a given advice phase
 */
struct Challenge {
    size_t index = 0;
    uint8_t phase = 0;
};

/**
 * Position of a copy-constraint endpoint on the grid.
 */
struct CopyCell {
    Column column;
    size_t row = 0;

    bool operator==(const CopyCell& rhs) const { return column == rhs.column && row == rhs.row; }
    bool operator<(const CopyCell& rhs) const {
        return std::tie(column, row) < std::tie(rhs.column, rhs.row);
    }
};

} // namespace plonkish
