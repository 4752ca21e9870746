#include "types/field_element.hpp"
#include <stdexcept>

namespace plonkish {

// The 128-bit modulo is well-optimized by GCC/Clang for this specific modulus
uint64_t Fp::reduce(uint128_t value) {
    return static_cast<uint64_t>(value % MODULUS);
}

Fp Fp::operator+(const Fp& rhs) const {
    // Subtract MODULUS on wrap-around or when the sum leaves the canonical range
    uint64_t sum = value_ + rhs.value_;
    uint64_t overflow = static_cast<uint64_t>(sum < value_);
    uint64_t too_large = static_cast<uint64_t>(sum >= MODULUS);
    sum -= MODULUS & (-(overflow | too_large));
    return Fp(sum);
}

Fp Fp::operator-(const Fp& rhs) const {
    uint64_t diff = value_ - rhs.value_;
    uint64_t underflow = static_cast<uint64_t>(value_ < rhs.value_);
    diff += MODULUS & (-underflow);
    return Fp(diff);
}

Fp Fp::operator*(const Fp& rhs) const {
    uint128_t product = static_cast<uint128_t>(value_) * static_cast<uint128_t>(rhs.value_);
    return Fp(reduce(product));
}

Fp Fp::operator-() const {
    if (value_ == 0) return *this;
    return Fp(MODULUS - value_);
}

Fp& Fp::operator+=(const Fp& rhs) {
    *this = *this + rhs;
    return *this;
}

Fp& Fp::operator-=(const Fp& rhs) {
    *this = *this - rhs;
    return *this;
}

Fp& Fp::operator*=(const Fp& rhs) {
    *this = *this * rhs;
    return *this;
}

Fp Fp::pow(uint64_t exp) const {
    Fp result = Fp::one();
    Fp base = *this;
    while (exp > 0) {
        if (exp & 1) {
            result *= base;
        }
        base *= base;
        exp >>= 1;
    }
    return result;
}

Fp Fp::inverse() const {
    if (value_ == 0) {
        throw std::domain_error("Cannot invert zero");
    }
    // Fermat: a^(p-2) = a^(-1)
    return pow(MODULUS - 2);
}

void Fp::batch_invert(std::vector<Fp>& elements) {
    // Montgomery's trick over the non-zero entries
    std::vector<Fp> prefix_products;
    prefix_products.reserve(elements.size());
    Fp accumulator = Fp::one();
    for (const Fp& element : elements) {
        prefix_products.push_back(accumulator);
        if (!element.is_zero()) {
            accumulator *= element;
        }
    }

    Fp inverse_acc = accumulator.inverse();
    for (size_t i = elements.size(); i-- > 0;) {
        if (elements[i].is_zero()) {
            continue;
        }
        Fp inverted = prefix_products[i] * inverse_acc;
        inverse_acc *= elements[i];
        elements[i] = inverted;
    }
}

std::string Fp::to_string() const {
    return std::to_string(value_);
}

std::ostream& operator<<(std::ostream& os, const Fp& elem) {
    return os << elem.value_;
}

} // namespace plonkish
