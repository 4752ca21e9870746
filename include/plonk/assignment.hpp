#pragma once

#include "plonk/column.hpp"
#include "plonk/row_range.hpp"
#include "types/assigned.hpp"
#include "types/field_element.hpp"
#include "types/value.hpp"
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace plonkish {

// Lazily produces the value of a cell; only invoked when the consumer needs it
using ValueFn = std::function<Value<Assigned>()>;

/**
 * Lifecycle of one synthesis pass. Transitions only move forward.
 */
enum class SynthesisPhase {
    Configuring,    // columns acquired, storage allocated
    Synthesizing,   // regions measured, placed and materialized
    Sealed          // fixed/selector/permutation data frozen
};

const char* synthesis_phase_name(SynthesisPhase phase);

/**
 * Assignment - Consumer of the cell writes, selectors and copies produced by a
 * floor planner.
 *
 * Rows are absolute grid rows. Implementations either carry witnesses
 * (MockProver) or only the data needed for key generation (keygen::Assembly).
 * Implementations that support fork() hand out disjoint row windows that can
 * be filled concurrently and are folded back, in order, by merge().
 */
class Assignment {
public:
    virtual ~Assignment() = default;

    SynthesisPhase phase() const { return phase_; }

    // Configuring -> Synthesizing
    void begin_synthesis();

    // Synthesizing -> Sealed; no writes are accepted afterwards
    void seal();

    // Diagnostic scoping markers; no effect on placement
    virtual void enter_region(const std::string& name) = 0;
    virtual void exit_region() = 0;
    virtual void annotate_column(const std::string& annotation, const Column& column) = 0;

    virtual void enable_selector(const std::string& annotation, const Selector& selector, size_t row) = 0;

    virtual Fp query_advice(AdviceColumn column, size_t row) const = 0;
    virtual Fp query_fixed(FixedColumn column, size_t row) const = 0;
    virtual Value<Fp> query_instance(InstanceColumn column, size_t row) const = 0;

    virtual void assign_advice(
        const std::string& annotation,
        AdviceColumn column,
        size_t row,
        const ValueFn& to) = 0;

    virtual void assign_fixed(
        const std::string& annotation,
        FixedColumn column,
        size_t row,
        const ValueFn& to) = 0;

    // Registers an equality constraint between two absolute positions
    virtual void copy(
        const Column& left_column, size_t left_row,
        const Column& right_column, size_t right_row) = 0;

    // Writes to every usable row >= from_row
    virtual void fill_from_row(FixedColumn column, size_t from_row, const Value<Assigned>& to) = 0;

    virtual Value<Fp> get_challenge(const Challenge& challenge) const = 0;

    virtual void push_namespace(const std::string& name) = 0;
    virtual void pop_namespace(const std::optional<std::string>& gadget_name) = 0;

    virtual bool supports_fork() const { return false; }

    /**
     * Split off one sub-assignment per range. Each sub-assignment exclusively
     * owns its rows until handed back to merge().
     *
     * @throws Error(Synthesis) if unsupported or the ranges are malformed
     */
    virtual std::vector<std::unique_ptr<Assignment>> fork(const std::vector<RowRange>& ranges);

    // Fold sub-assignments back in the order returned by fork()
    virtual void merge(std::vector<std::unique_ptr<Assignment>> sub_cs);

protected:
    Assignment() = default;

    void set_phase(SynthesisPhase phase) { phase_ = phase; }

    // @throws Error(Synthesis) unless the pass is synthesizing
    void ensure_synthesizing(const char* operation) const;

    /**
     * Ranges must be non-decreasing, non-overlapping and inside rw_rows.
     * @throws Error(Synthesis) naming the first offending range
     */
    static void validate_fork_ranges(const std::vector<RowRange>& ranges, const RowRange& rw_rows);

private:
    SynthesisPhase phase_ = SynthesisPhase::Configuring;
};

} // namespace plonkish
