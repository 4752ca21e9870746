#include "types/assigned.hpp"
#ifdef _OPENMP
#include <omp.h>
#endif

namespace plonkish {

Fp Assigned::evaluate() const {
    switch (kind_) {
        case Kind::Zero:
            return Fp::zero();
        case Kind::Trivial:
            return numerator_;
        case Kind::Rational:
            if (denominator_.is_zero()) {
                return Fp::zero();
            }
            return numerator_ * denominator_.inverse();
    }
    return Fp::zero();
}

std::vector<std::vector<Fp>> batch_invert_assigned(const std::vector<std::vector<Assigned>>& columns) {
    std::vector<std::vector<Fp>> evaluated(columns.size());

    // Columns are independent
    #pragma omp parallel for schedule(dynamic)
    for (size_t c = 0; c < columns.size(); ++c) {
        const auto& column = columns[c];
        std::vector<Fp> denominators(column.size(), Fp::zero());
        for (size_t row = 0; row < column.size(); ++row) {
            if (column[row].kind() == Assigned::Kind::Rational) {
                denominators[row] = column[row].denominator();
            }
        }
        Fp::batch_invert(denominators);

        auto& out = evaluated[c];
        out.resize(column.size());
        for (size_t row = 0; row < column.size(); ++row) {
            const Assigned& cell = column[row];
            switch (cell.kind()) {
                case Assigned::Kind::Zero:
                    out[row] = Fp::zero();
                    break;
                case Assigned::Kind::Trivial:
                    out[row] = cell.numerator();
                    break;
                case Assigned::Kind::Rational:
                    // Zero denominators stayed zero through batch_invert
                    out[row] = cell.numerator() * denominators[row];
                    break;
            }
        }
    }

    return evaluated;
}

} // namespace plonkish
