#include "plonk/permutation.hpp"
#include "common/error.hpp"
#include <algorithm>
#include <map>

namespace plonkish {

void PermutationArgument::add_column(const Column& column) {
    if (!index_of(column)) {
        columns_.push_back(column);
    }
}

std::optional<size_t> PermutationArgument::index_of(const Column& column) const {
    auto it = std::find(columns_.begin(), columns_.end(), column);
    if (it == columns_.end()) {
        return std::nullopt;
    }
    return static_cast<size_t>(it - columns_.begin());
}

PermutationAssembly::PermutationAssembly(size_t n, const PermutationArgument& argument)
    : columns_(argument.columns()) {
    mapping_.resize(columns_.size());
    sizes_.assign(columns_.size(), std::vector<size_t>(n, 1));
    for (size_t i = 0; i < columns_.size(); ++i) {
        mapping_[i].reserve(n);
        for (size_t j = 0; j < n; ++j) {
            mapping_[i].emplace_back(i, j);
        }
    }
    aux_ = mapping_;
}

size_t PermutationAssembly::column_position(const Column& column) const {
    auto it = std::find(columns_.begin(), columns_.end(), column);
    if (it == columns_.end()) {
        throw Error::column_not_in_permutation(column.to_string());
    }
    return static_cast<size_t>(it - columns_.begin());
}

void PermutationAssembly::copy(const Column& left_column, size_t left_row,
                               const Column& right_column, size_t right_row) {
    const size_t left = column_position(left_column);
    const size_t right = column_position(right_column);

    if (left_row >= mapping_[left].size() || right_row >= mapping_[right].size()) {
        throw Error::bounds_failure("copy between rows " + std::to_string(left_row) + " and " +
                                    std::to_string(right_row) + " outside the permutation");
    }

    copies_.push_back({CopyCell{left_column, left_row}, CopyCell{right_column, right_row}});

    Position left_cycle = aux_[left][left_row];
    Position right_cycle = aux_[right][right_row];

    if (left_cycle == right_cycle) {
        return;
    }

    if (sizes_[left_cycle.first][left_cycle.second] < sizes_[right_cycle.first][right_cycle.second]) {
        std::swap(left_cycle, right_cycle);
    }

    // Merge the right cycle into the left one
    sizes_[left_cycle.first][left_cycle.second] += sizes_[right_cycle.first][right_cycle.second];
    Position i = right_cycle;
    do {
        aux_[i.first][i.second] = left_cycle;
        i = mapping_[i.first][i.second];
    } while (i != right_cycle);

    std::swap(mapping_[left][left_row], mapping_[right][right_row]);
}

bool PermutationAssembly::same_cycle(const CopyCell& a, const CopyCell& b) const {
    const size_t ca = column_position(a.column);
    const size_t cb = column_position(b.column);
    return aux_.at(ca).at(a.row) == aux_.at(cb).at(b.row);
}

std::vector<std::vector<CopyCell>> PermutationAssembly::cycles() const {
    std::map<Position, std::vector<CopyCell>> by_representative;
    for (size_t c = 0; c < aux_.size(); ++c) {
        for (size_t row = 0; row < aux_[c].size(); ++row) {
            if (mapping_[c][row] == Position(c, row)) {
                continue;   // singleton cycle
            }
            by_representative[aux_[c][row]].push_back(CopyCell{columns_[c], row});
        }
    }

    std::vector<std::vector<CopyCell>> result;
    result.reserve(by_representative.size());
    for (auto& entry : by_representative) {
        std::sort(entry.second.begin(), entry.second.end());
        result.push_back(std::move(entry.second));
    }
    std::sort(result.begin(), result.end());
    return result;
}

} // namespace plonkish
