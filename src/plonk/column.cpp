#include "plonk/column.hpp"

namespace plonkish {

const char* column_type_name(ColumnType type) {
    switch (type) {
        case ColumnType::Advice: return "Advice";
        case ColumnType::Fixed: return "Fixed";
        case ColumnType::Instance: return "Instance";
    }
    return "Unknown";
}

std::string Column::to_string() const {
    return std::string(column_type_name(column_type)) + "[" + std::to_string(index) + "]";
}

} // namespace plonkish
