#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace plonkish {

/**
 * Failure categories surfaced by circuit synthesis and key generation.
 */
enum class ErrorKind {
    // Generic protocol violation (table reuse, malformed fork ranges, sealed pass, ...)
    Synthesis,
    // A query or write addressed a column or row outside allocated storage
    BoundsFailure,
    // 2^k is smaller than the rows the circuit requires
    NotEnoughRowsAvailable,
    // A region asked for a constant but no constants column was configured
    NotEnoughColumnsForConstants,
    // A copy constraint touched a column without equality enabled
    ColumnNotInPermutation,
    // An instance column holds more values than the usable rows
    InstanceTooLarge,
};

const char* error_kind_name(ErrorKind kind);

/**
 * Error - Exception type thrown by every layout and assignment operation
 */
class Error : public std::runtime_error {
public:
    Error(ErrorKind kind, const std::string& message);

    static Error synthesis(const std::string& message);
    static Error bounds_failure(const std::string& message);
    static Error not_enough_rows_available(uint32_t current_k);
    static Error not_enough_columns_for_constants();
    static Error column_not_in_permutation(const std::string& column);
    static Error instance_too_large(size_t rows, size_t usable_rows);

    ErrorKind kind() const { return kind_; }

    // Only meaningful for NotEnoughRowsAvailable
    uint32_t current_k() const { return current_k_; }

private:
    ErrorKind kind_;
    uint32_t current_k_ = 0;
};

} // namespace plonkish
