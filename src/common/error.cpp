#include "common/error.hpp"

namespace plonkish {

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Synthesis: return "Synthesis";
        case ErrorKind::BoundsFailure: return "BoundsFailure";
        case ErrorKind::NotEnoughRowsAvailable: return "NotEnoughRowsAvailable";
        case ErrorKind::NotEnoughColumnsForConstants: return "NotEnoughColumnsForConstants";
        case ErrorKind::ColumnNotInPermutation: return "ColumnNotInPermutation";
        case ErrorKind::InstanceTooLarge: return "InstanceTooLarge";
    }
    return "Unknown";
}

Error::Error(ErrorKind kind, const std::string& message)
    : std::runtime_error(std::string(error_kind_name(kind)) + ": " + message)
    , kind_(kind) {}

Error Error::synthesis(const std::string& message) {
    return Error(ErrorKind::Synthesis, message);
}

Error Error::bounds_failure(const std::string& message) {
    return Error(ErrorKind::BoundsFailure, message);
}

Error Error::not_enough_rows_available(uint32_t current_k) {
    Error error(ErrorKind::NotEnoughRowsAvailable,
                "k = " + std::to_string(current_k) +
                " is too small for the circuit; increase k");
    error.current_k_ = current_k;
    return error;
}

Error Error::not_enough_columns_for_constants() {
    return Error(ErrorKind::NotEnoughColumnsForConstants,
                 "a region assigned a constant but no constants column is configured");
}

Error Error::column_not_in_permutation(const std::string& column) {
    return Error(ErrorKind::ColumnNotInPermutation,
                 column + " does not have equality enabled");
}

Error Error::instance_too_large(size_t rows, size_t usable_rows) {
    return Error(ErrorKind::InstanceTooLarge,
                 "instance column holds " + std::to_string(rows) +
                 " values, only " + std::to_string(usable_rows) + " rows are usable");
}

} // namespace plonkish
