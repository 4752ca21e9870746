#pragma once

#include "types/field_element.hpp"
#include <vector>

namespace plonkish {

/**
 * Assigned - A cell value kept as a fraction until the grid is finalized
 *
 * Rational assignments are inverted in one batch when fixed columns are
 * turned into key material, instead of once per cell.
 */
class Assigned {
public:
    enum class Kind { Zero, Trivial, Rational };

    Assigned() : kind_(Kind::Zero) {}
    Assigned(Fp value) : kind_(Kind::Trivial), numerator_(value) {}

    static Assigned rational(Fp numerator, Fp denominator) {
        Assigned a;
        a.kind_ = Kind::Rational;
        a.numerator_ = numerator;
        a.denominator_ = denominator;
        return a;
    }

    Kind kind() const { return kind_; }
    Fp numerator() const { return kind_ == Kind::Zero ? Fp::zero() : numerator_; }
    Fp denominator() const { return kind_ == Kind::Rational ? denominator_ : Fp::one(); }

    // A zero denominator evaluates to zero
    Fp evaluate() const;

    bool operator==(const Assigned& rhs) const { return evaluate() == rhs.evaluate(); }
    bool operator!=(const Assigned& rhs) const { return !(*this == rhs); }

private:
    Kind kind_;
    Fp numerator_;
    Fp denominator_ = Fp::one();
};

/**
 * Evaluate every column with one batch inversion per column.
 */
std::vector<std::vector<Fp>> batch_invert_assigned(const std::vector<std::vector<Assigned>>& columns);

} // namespace plonkish
