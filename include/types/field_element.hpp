#pragma once

#include <cstdint>
#include <string>
#include <ostream>
#include <vector>

namespace plonkish {

// 128-bit unsigned integer type for intermediate products
using uint128_t = __uint128_t;

/**
 * Fp - Scalar field element of the circuit grid
 *
 * Element of the Goldilocks prime field with modulus p = 2^64 - 2^32 + 1.
 * Stored in canonical form (always < MODULUS).
 */
class Fp {
public:
    static constexpr uint64_t MODULUS = 18446744069414584321ULL;

    // Generator of the multiplicative group
    static constexpr uint64_t GENERATOR = 7ULL;

    constexpr Fp() : value_(0) {}
    constexpr explicit Fp(uint64_t value) : value_(value % MODULUS) {}

    static constexpr Fp zero() { return Fp(0); }
    static constexpr Fp one() { return Fp(1); }

    constexpr uint64_t value() const { return value_; }

    Fp operator+(const Fp& rhs) const;
    Fp operator-(const Fp& rhs) const;
    Fp operator*(const Fp& rhs) const;
    Fp operator-() const;

    Fp& operator+=(const Fp& rhs);
    Fp& operator-=(const Fp& rhs);
    Fp& operator*=(const Fp& rhs);

    bool operator==(const Fp& rhs) const { return value_ == rhs.value_; }
    bool operator!=(const Fp& rhs) const { return value_ != rhs.value_; }
    bool operator<(const Fp& rhs) const { return value_ < rhs.value_; }

    bool is_zero() const { return value_ == 0; }
    bool is_one() const { return value_ == 1; }

    Fp pow(uint64_t exp) const;

    // Throws std::domain_error for zero
    Fp inverse() const;

    // Inverts every non-zero element in place with a single field inversion.
    // Zero elements are left untouched.
    static void batch_invert(std::vector<Fp>& elements);

    std::string to_string() const;

    friend std::ostream& operator<<(std::ostream& os, const Fp& elem);

private:
    uint64_t value_;

    static uint64_t reduce(uint128_t value);
};

} // namespace plonkish
