#include "plonk/keygen.hpp"
#include <chrono>
#ifdef _OPENMP
#include <omp.h>
#endif

namespace plonkish {
namespace keygen {

namespace {

RowRange usable_window(uint32_t k, const ConstraintSystem& cs) {
    const size_t n = grid_rows(k);
    const size_t reserved = cs.blinding_factors() + 1;
    if (n <= reserved) {
        std::cerr << "[keygen] k=" << k << " leaves no usable rows (" << reserved
                  << " reserved)" << std::endl;
        throw Error::not_enough_rows_available(k);
    }
    return RowRange(0, n - reserved);
}

} // namespace

Assembly::Assembly(uint32_t k, const ConstraintSystem& cs)
    : k_(k)
    , fixed_(cs.num_fixed_columns(), RowRange(0, grid_rows(k)), Assigned())
    , selectors_(cs.num_selectors(), RowRange(0, grid_rows(k)), false)
    , permutation_(std::in_place, grid_rows(k), cs.permutation())
    , usable_rows_(usable_window(k, cs))
    , rw_rows_(usable_rows_) {}

Assembly::Assembly(uint32_t k, RowRange usable_rows, RowRange rw_rows,
                   ColumnStore<Assigned> fixed, ColumnStore<bool> selectors)
    : k_(k)
    , fixed_(std::move(fixed))
    , selectors_(std::move(selectors))
    , usable_rows_(usable_rows)
    , rw_rows_(rw_rows) {
    set_phase(SynthesisPhase::Synthesizing);
}

void Assembly::check_usable(size_t row) const {
    if (!usable_rows_.contains(row)) {
        throw Error::not_enough_rows_available(k_);
    }
}

void Assembly::check_rw(size_t row, const char* operation) const {
    if (!rw_rows_.contains(row)) {
        std::cerr << "[keygen] " << operation << " row " << row << " outside read/write window "
                  << rw_rows_.to_string() << std::endl;
        throw Error::synthesis(std::string(operation) + " at row " + std::to_string(row) +
                               " outside window " + rw_rows_.to_string());
    }
}

void Assembly::enable_selector(const std::string&, const Selector& selector, size_t row) {
    ensure_synthesizing("enable_selector");
    check_usable(row);
    check_rw(row, "enable_selector");
    selectors_.set(selector.index, row, true);
}

Fp Assembly::query_fixed(FixedColumn column, size_t row) const {
    check_usable(row);
    check_rw(row, "query_fixed");
    return fixed_.get(column.index, row).evaluate();
}

Value<Fp> Assembly::query_instance(InstanceColumn, size_t row) const {
    check_usable(row);
    return Value<Fp>::unknown();
}

void Assembly::assign_fixed(const std::string& annotation, FixedColumn column, size_t row, const ValueFn& to) {
    ensure_synthesizing("assign_fixed");
    check_usable(row);
    check_rw(row, "assign_fixed");

    Value<Assigned> value = to();
    if (!value.is_known()) {
        throw Error::synthesis("fixed cell " + annotation + " assigned an unknown value");
    }
    fixed_.set(column.index, row, value.get());
}

void Assembly::copy(const Column& left_column, size_t left_row,
                    const Column& right_column, size_t right_row) {
    ensure_synthesizing("copy");
    if (!usable_rows_.contains(left_row) || !usable_rows_.contains(right_row)) {
        throw Error::not_enough_rows_available(k_);
    }

    if (!permutation_) {
        copies_.push_back({CopyCell{left_column, left_row}, CopyCell{right_column, right_row}});
        return;
    }
    permutation_->copy(left_column, left_row, right_column, right_row);
}

void Assembly::fill_from_row(FixedColumn column, size_t from_row, const Value<Assigned>& to) {
    ensure_synthesizing("fill_from_row");
    check_usable(from_row);
    if (column.index >= fixed_.num_columns()) {
        throw Error::bounds_failure("fixed column " + std::to_string(column.index) + " of " +
                                    std::to_string(fixed_.num_columns()));
    }
    if (!to.is_known()) {
        throw Error::synthesis("fill_from_row with an unknown value");
    }
    const RowRange rows(from_row, usable_rows_.end);
    if (!rw_rows_.contains(rows)) {
        std::cerr << "[keygen] fill_from_row " << rows.to_string() << " outside read/write window "
                  << rw_rows_.to_string() << std::endl;
        throw Error::synthesis("fill_from_row over " + rows.to_string() + " outside window " +
                               rw_rows_.to_string());
    }
    fixed_.fill(column.index, rows, to.get());
}

std::vector<std::unique_ptr<Assignment>> Assembly::fork(const std::vector<RowRange>& ranges) {
    ensure_synthesizing("fork");
    validate_fork_ranges(ranges, rw_rows_);

    std::vector<ColumnStore<Assigned>> fixed_parts = fixed_.split_at_ranges(ranges);
    std::vector<ColumnStore<bool>> selector_parts = selectors_.split_at_ranges(ranges);

    std::vector<std::unique_ptr<Assignment>> sub_cs;
    sub_cs.reserve(ranges.size());
    for (size_t i = 0; i < ranges.size(); ++i) {
        sub_cs.push_back(std::unique_ptr<Assignment>(new Assembly(
            k_, usable_rows_, ranges[i], std::move(fixed_parts[i]), std::move(selector_parts[i]))));
    }
    return sub_cs;
}

void Assembly::merge(std::vector<std::unique_ptr<Assignment>> sub_cs) {
    ensure_synthesizing("merge");

    std::vector<ColumnStore<Assigned>> fixed_parts;
    std::vector<ColumnStore<bool>> selector_parts;
    fixed_parts.reserve(sub_cs.size());
    selector_parts.reserve(sub_cs.size());

    for (size_t i = 0; i < sub_cs.size(); ++i) {
        auto* sub = dynamic_cast<Assembly*>(sub_cs[i].get());
        if (sub == nullptr) {
            throw Error::synthesis("merge expects sub-assemblies returned by fork");
        }
        // Replay in sub-context order; the permutation mapping depends on it
        for (const auto& [left, right] : sub->copies_) {
            if (permutation_) {
                permutation_->copy(left.column, left.row, right.column, right.row);
            } else {
                copies_.emplace_back(left, right);
            }
        }
        PLONKISH_DEBUG_COUT("[keygen] merged subCS_" << i << " " << sub->rw_rows_.to_string()
                            << " (" << sub->copies_.size() << " copies)" << std::endl);
        fixed_parts.push_back(std::move(sub->fixed_));
        selector_parts.push_back(std::move(sub->selectors_));
    }

    fixed_.rejoin(std::move(fixed_parts));
    selectors_.rejoin(std::move(selector_parts));
}

Assembly::Artifacts Assembly::release() && {
    if (phase() != SynthesisPhase::Sealed) {
        throw Error::synthesis(std::string("key material requested while ") + synthesis_phase_name(phase()));
    }
    if (!permutation_) {
        throw Error::synthesis("a forked assembly holds no key material");
    }
    return Artifacts{
        std::move(fixed_).into_columns(),
        std::move(selectors_).into_columns(),
        std::move(*permutation_)
    };
}

} // namespace keygen

VerifyingKey finalize_vk(uint32_t k, ConstraintSystem cs, keygen::Assembly&& assembly) {
    auto start = std::chrono::high_resolution_clock::now();

    keygen::Assembly::Artifacts artifacts = std::move(assembly).release();

    VerifyingKey vk;
    vk.k = k;
    vk.cs = std::move(cs);
    vk.fixed = batch_invert_assigned(artifacts.fixed);
    vk.selectors = std::move(artifacts.selectors);
    vk.permutation_columns = artifacts.permutation.columns();
    vk.permutation_mapping = artifacts.permutation.mapping();
    vk.copies = artifacts.permutation.copies();

    PLONKISH_IF_PROFILE {
        auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
            std::chrono::high_resolution_clock::now() - start).count() / 1000.0;
        std::cout << "[keygen] verifying key (k=" << k << ", " << vk.fixed.size()
                  << " fixed columns) finalized in " << elapsed << " ms" << std::endl;
    }
    return vk;
}

ProvingKey keygen_pk(VerifyingKey vk) {
    const size_t n = vk.n();
    const size_t blinding = vk.cs.blinding_factors();
    if (n < vk.cs.minimum_rows()) {
        throw Error::not_enough_rows_available(vk.k);
    }

    ProvingKey pk;
    pk.l0.assign(n, Fp::zero());
    pk.l0[0] = Fp::one();

    pk.l_blind.assign(n, Fp::zero());
    for (size_t row = n - blinding; row < n; ++row) {
        pk.l_blind[row] = Fp::one();
    }

    pk.l_last.assign(n, Fp::zero());
    pk.l_last[n - blinding - 1] = Fp::one();

    pk.l_active_row.assign(n, Fp::zero());
    const Fp one = Fp::one();
    #pragma omp parallel for schedule(static)
    for (size_t row = 0; row < n; ++row) {
        pk.l_active_row[row] = one - (pk.l_last[row] + pk.l_blind[row]);
    }

    pk.vk = std::move(vk);
    return pk;
}

} // namespace plonkish
