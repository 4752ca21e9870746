#include "dev/mock_prover.hpp"
#include "common/debug_control.hpp"
#include <algorithm>
#include <random>

namespace plonkish {
namespace dev {

namespace {

std::string cell_name(const CopyCell& cell) {
    return cell.column.to_string() + "@" + std::to_string(cell.row);
}

constexpr uint64_t CHALLENGE_SEED = 0x6d6f636b70726f76ULL;

} // namespace

void RegionRecord::update_extent(const Column& column, size_t row) {
    columns.insert(column);
    if (!rows) {
        rows = std::make_pair(row, row);
        return;
    }
    rows->first = std::min(rows->first, row);
    rows->second = std::max(rows->second, row);
}

std::string VerifyFailure::to_string() const {
    std::string reason = kind == Kind::CellNotAssigned ? "cell not assigned" : "values differ";
    return cell_name(left) + " == " + cell_name(right) + ": " + reason;
}

MockProver::MockProver(uint32_t k, const ConstraintSystem& cs, const std::vector<std::vector<Fp>>& instances)
    : k_(k)
    , cs_(cs) {
    const size_t n = grid_rows(k);
    const size_t reserved = cs.blinding_factors() + 1;
    if (n <= reserved) {
        throw Error::not_enough_rows_available(k);
    }
    usable_rows_ = RowRange(0, n - reserved);
    rw_rows_ = usable_rows_;

    if (instances.size() != cs.num_instance_columns()) {
        std::cerr << "[mock] got " << instances.size() << " instance columns, circuit has "
                  << cs.num_instance_columns() << std::endl;
        throw Error::synthesis("instance column count mismatch");
    }

    auto instance = std::make_shared<std::vector<std::vector<CellValue>>>();
    instance->reserve(instances.size());
    for (const auto& values : instances) {
        if (values.size() > usable_rows_.size()) {
            throw Error::instance_too_large(values.size(), usable_rows_.size());
        }
        std::vector<CellValue> column(n, CellValue::poison());
        for (size_t row = 0; row < usable_rows_.end; ++row) {
            column[row] = CellValue::assigned(row < values.size() ? values[row] : Fp::zero());
        }
        instance->push_back(std::move(column));
    }
    instance_ = std::move(instance);

    const RowRange grid(0, n);
    const RowRange blinding(usable_rows_.end, n);
    advice_ = ColumnStore<CellValue>(cs.num_advice_columns(), grid, CellValue());
    for (size_t c = 0; c < advice_.num_columns(); ++c) {
        advice_.fill(c, blinding, CellValue::poison());
    }
    fixed_ = ColumnStore<CellValue>(cs.num_fixed_columns(), grid, CellValue());
    selectors_ = ColumnStore<bool>(cs.num_selectors(), grid, false);

    // Deterministic stand-ins for verifier challenges
    std::mt19937_64 rng(CHALLENGE_SEED);
    std::vector<Fp> challenges;
    for (size_t i = 0; i < cs.num_challenges(); ++i) {
        challenges.emplace_back(rng());
    }
    challenges_ = std::make_shared<const std::vector<Fp>>(std::move(challenges));

    permutation_.emplace(n, cs.permutation());
}

MockProver::MockProver(uint32_t k, ConstraintSystem cs, RowRange usable_rows, RowRange rw_rows,
                       ColumnStore<CellValue> advice, ColumnStore<CellValue> fixed, ColumnStore<bool> selectors,
                       SharedGrid instance, std::shared_ptr<const std::vector<Fp>> challenges)
    : k_(k)
    , cs_(std::move(cs))
    , usable_rows_(usable_rows)
    , rw_rows_(rw_rows)
    , advice_(std::move(advice))
    , fixed_(std::move(fixed))
    , selectors_(std::move(selectors))
    , instance_(std::move(instance))
    , challenges_(std::move(challenges)) {
    set_phase(SynthesisPhase::Synthesizing);
}

void MockProver::check_write(size_t row, const char* operation) const {
    if (!usable_rows_.contains(row)) {
        throw Error::not_enough_rows_available(k_);
    }
    if (!rw_rows_.contains(row)) {
        std::cerr << "[mock] " << operation << " row " << row << " outside read/write window "
                  << rw_rows_.to_string() << std::endl;
        throw Error::synthesis(std::string(operation) + " at row " + std::to_string(row) +
                               " outside window " + rw_rows_.to_string());
    }
}

void MockProver::record(const Column& column, size_t row) {
    if (current_region_) {
        current_region_->update_extent(column, row);
    }
}

void MockProver::enter_region(const std::string& name) {
    if (current_region_) {
        throw Error::synthesis("region " + name + " entered inside region " + current_region_->name);
    }
    RegionRecord region;
    region.name = name;
    current_region_ = std::move(region);
}

void MockProver::exit_region() {
    if (!current_region_) {
        throw Error::synthesis("exit_region without an open region");
    }
    regions_.push_back(std::move(*current_region_));
    current_region_.reset();
}

void MockProver::annotate_column(const std::string& annotation, const Column& column) {
    if (current_region_) {
        current_region_->annotations[column] = annotation;
    }
}

void MockProver::enable_selector(const std::string&, const Selector& selector, size_t row) {
    ensure_synthesizing("enable_selector");
    check_write(row, "enable_selector");
    selectors_.set(selector.index, row, true);
    if (current_region_) {
        current_region_->enabled_selectors[selector.index].push_back(row);
    }
}

Fp MockProver::query_advice(AdviceColumn column, size_t row) const {
    if (!usable_rows_.contains(row)) {
        throw Error::not_enough_rows_available(k_);
    }
    CellValue cell = advice_.get(column.index, row);
    return cell.is_assigned() ? cell.value : Fp::zero();
}

Fp MockProver::query_fixed(FixedColumn column, size_t row) const {
    if (!usable_rows_.contains(row)) {
        throw Error::not_enough_rows_available(k_);
    }
    CellValue cell = fixed_.get(column.index, row);
    return cell.is_assigned() ? cell.value : Fp::zero();
}

Value<Fp> MockProver::query_instance(InstanceColumn column, size_t row) const {
    if (!usable_rows_.contains(row)) {
        throw Error::not_enough_rows_available(k_);
    }
    if (column.index >= instance_->size()) {
        throw Error::bounds_failure("instance column " + std::to_string(column.index) + " of " +
                                    std::to_string(instance_->size()));
    }
    return Value<Fp>::known((*instance_)[column.index][row].value);
}

void MockProver::assign_advice(const std::string& annotation, AdviceColumn column, size_t row, const ValueFn& to) {
    ensure_synthesizing("assign_advice");
    check_write(row, "assign_advice");

    Value<Assigned> value = to();
    if (!value.is_known()) {
        throw Error::synthesis("advice cell " + annotation + " assigned an unknown value");
    }
    advice_.set(column.index, row, CellValue::assigned(value.get().evaluate()));
    record(column, row);
}

void MockProver::assign_fixed(const std::string& annotation, FixedColumn column, size_t row, const ValueFn& to) {
    ensure_synthesizing("assign_fixed");
    check_write(row, "assign_fixed");

    Value<Assigned> value = to();
    if (!value.is_known()) {
        throw Error::synthesis("fixed cell " + annotation + " assigned an unknown value");
    }
    fixed_.set(column.index, row, CellValue::assigned(value.get().evaluate()));
    record(column, row);
}

void MockProver::copy(const Column& left_column, size_t left_row,
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

void MockProver::fill_from_row(FixedColumn column, size_t from_row, const Value<Assigned>& to) {
    ensure_synthesizing("fill_from_row");
    if (!usable_rows_.contains(from_row)) {
        throw Error::not_enough_rows_available(k_);
    }
    if (column.index >= fixed_.num_columns()) {
        throw Error::bounds_failure("fixed column " + std::to_string(column.index) + " of " +
                                    std::to_string(fixed_.num_columns()));
    }
    if (!to.is_known()) {
        throw Error::synthesis("fill_from_row with an unknown value");
    }
    const RowRange rows(from_row, usable_rows_.end);
    if (!rw_rows_.contains(rows)) {
        std::cerr << "[mock] fill_from_row " << rows.to_string() << " outside read/write window "
                  << rw_rows_.to_string() << std::endl;
        throw Error::synthesis("fill_from_row over " + rows.to_string() + " outside window " +
                               rw_rows_.to_string());
    }
    fixed_.fill(column.index, rows, CellValue::assigned(to.get().evaluate()));
}

Value<Fp> MockProver::get_challenge(const Challenge& challenge) const {
    if (challenge.index >= challenges_->size()) {
        throw Error::bounds_failure("challenge " + std::to_string(challenge.index) + " of " +
                                    std::to_string(challenges_->size()));
    }
    return Value<Fp>::known((*challenges_)[challenge.index]);
}

std::vector<std::unique_ptr<Assignment>> MockProver::fork(const std::vector<RowRange>& ranges) {
    ensure_synthesizing("fork");
    validate_fork_ranges(ranges, rw_rows_);

    std::vector<ColumnStore<CellValue>> advice_parts = advice_.split_at_ranges(ranges);
    std::vector<ColumnStore<CellValue>> fixed_parts = fixed_.split_at_ranges(ranges);
    std::vector<ColumnStore<bool>> selector_parts = selectors_.split_at_ranges(ranges);

    std::vector<std::unique_ptr<Assignment>> sub_cs;
    sub_cs.reserve(ranges.size());
    for (size_t i = 0; i < ranges.size(); ++i) {
        sub_cs.push_back(std::unique_ptr<Assignment>(new MockProver(
            k_, cs_, usable_rows_, ranges[i],
            std::move(advice_parts[i]), std::move(fixed_parts[i]), std::move(selector_parts[i]),
            instance_, challenges_)));
    }
    return sub_cs;
}

void MockProver::merge(std::vector<std::unique_ptr<Assignment>> sub_cs) {
    ensure_synthesizing("merge");

    std::vector<ColumnStore<CellValue>> advice_parts;
    std::vector<ColumnStore<CellValue>> fixed_parts;
    std::vector<ColumnStore<bool>> selector_parts;

    for (size_t i = 0; i < sub_cs.size(); ++i) {
        auto* sub = dynamic_cast<MockProver*>(sub_cs[i].get());
        if (sub == nullptr) {
            throw Error::synthesis("merge expects sub-provers returned by fork");
        }
        for (const auto& [left, right] : sub->copies_) {
            if (permutation_) {
                permutation_->copy(left.column, left.row, right.column, right.row);
            } else {
                copies_.emplace_back(left, right);
            }
        }
        for (auto& region : sub->regions_) {
            regions_.push_back(std::move(region));
        }
        PLONKISH_DEBUG_COUT("[mock] merged subCS_" << i << " " << sub->rw_rows_.to_string()
                            << " (" << sub->copies_.size() << " copies)" << std::endl);
        advice_parts.push_back(std::move(sub->advice_));
        fixed_parts.push_back(std::move(sub->fixed_));
        selector_parts.push_back(std::move(sub->selectors_));
    }

    advice_.rejoin(std::move(advice_parts));
    fixed_.rejoin(std::move(fixed_parts));
    selectors_.rejoin(std::move(selector_parts));
}

CellValue MockProver::cell_at(const CopyCell& cell) const {
    switch (cell.column.column_type) {
        case ColumnType::Advice:
            return advice_.get(cell.column.index, cell.row);
        case ColumnType::Fixed:
            return fixed_.get(cell.column.index, cell.row);
        case ColumnType::Instance:
            return instance_->at(cell.column.index).at(cell.row);
    }
    return CellValue();
}

std::vector<VerifyFailure> MockProver::verify() const {
    const auto& copies = permutation_ ? permutation_->copies() : copies_;

    std::vector<VerifyFailure> failures;
    for (const auto& [left, right] : copies) {
        const CellValue a = cell_at(left);
        const CellValue b = cell_at(right);
        if (!a.is_assigned() || !b.is_assigned()) {
            failures.push_back(VerifyFailure{VerifyFailure::Kind::CellNotAssigned, left, right});
        } else if (a.value != b.value) {
            failures.push_back(VerifyFailure{VerifyFailure::Kind::Permutation, left, right});
        }
    }
    return failures;
}

nlohmann::json MockProver::layout_json() const {
    nlohmann::json json;
    json["k"] = k_;
    json["n"] = n();
    json["usable_rows"] = {usable_rows_.start, usable_rows_.end};

    nlohmann::json regions = nlohmann::json::array();
    for (const auto& region : regions_) {
        nlohmann::json entry;
        entry["name"] = region.name;
        if (region.rows) {
            entry["rows"] = {region.rows->first, region.rows->second + 1};
        } else {
            entry["rows"] = nullptr;
        }
        nlohmann::json columns = nlohmann::json::array();
        for (const auto& column : region.columns) {
            columns.push_back(column.to_string());
        }
        entry["columns"] = columns;
        nlohmann::json selectors = nlohmann::json::object();
        for (const auto& [index, rows] : region.enabled_selectors) {
            selectors[std::to_string(index)] = rows;
        }
        entry["enabled_selectors"] = selectors;
        nlohmann::json annotations = nlohmann::json::object();
        for (const auto& [column, annotation] : region.annotations) {
            annotations[column.to_string()] = annotation;
        }
        entry["annotations"] = annotations;
        regions.push_back(entry);
    }
    json["regions"] = regions;

    nlohmann::json constants = nlohmann::json::array();
    if (!cs_.constants().empty()) {
        const FixedColumn column = cs_.constants()[0];
        for (size_t row = usable_rows_.start; row < usable_rows_.end; ++row) {
            CellValue cell = fixed_.get(column.index, row);
            if (cell.is_assigned()) {
                constants.push_back({{"row", row}, {"value", cell.value.value()}});
            }
        }
    }
    json["constants"] = constants;

    nlohmann::json copies = nlohmann::json::array();
    const auto& copy_list = permutation_ ? permutation_->copies() : copies_;
    for (const auto& [left, right] : copy_list) {
        copies.push_back({cell_name(left), cell_name(right)});
    }
    json["copies"] = copies;

    return json;
}

} // namespace dev
} // namespace plonkish
