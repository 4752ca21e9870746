#pragma once

#include "common/error.hpp"
#include "plonk/row_range.hpp"
#include <algorithm>
#include <iterator>
#include <string>
#include <utility>
#include <vector>

namespace plonkish {

/**
 * ColumnStore - Column-major storage for one row window of the grid
 *
 * Rows are addressed by their absolute grid row. split_at_ranges() moves the
 * rows of each range into a separate owned store and marks them as lent: the
 * parent rejects any access to a lent row until rejoin() moves them back.
 * Two live stores therefore never hold the same row.
 */
template<typename T>
class ColumnStore {
public:
    ColumnStore() = default;

    ColumnStore(size_t num_columns, RowRange window, const T& init)
        : window_(window)
        , columns_(num_columns, std::vector<T>(window.size(), init)) {}

    size_t num_columns() const { return columns_.size(); }
    const RowRange& window() const { return window_; }
    bool is_lent() const { return !lent_.empty(); }

    T get(size_t column, size_t row) const {
        return columns_[column][slot(column, row)];
    }

    void set(size_t column, size_t row, T value) {
        columns_[column][slot(column, row)] = std::move(value);
    }

    // Writes value to every row of rows that lies inside the window
    void fill(size_t column, const RowRange& rows, const T& value) {
        RowRange clipped(std::max(rows.start, window_.start), std::min(rows.end, window_.end));
        if (clipped.empty()) {
            return;
        }
        slot(column, clipped.start);
        for (const RowRange& lent : lent_) {
            if (lent.start < clipped.end && clipped.start < lent.end) {
                throw Error::synthesis("fill over rows " + clipped.to_string() +
                                       " overlaps lent window " + lent.to_string());
            }
        }
        auto& col = columns_[column];
        std::fill(col.begin() + (clipped.start - window_.start),
                  col.begin() + (clipped.end - window_.start),
                  value);
    }

    /**
     * Move the rows of every range into its own store.
     *
     * @param ranges Sorted, non-overlapping ranges inside the window
     * @throws Error(Synthesis) if the store is already lent or ranges are malformed
     */
    std::vector<ColumnStore> split_at_ranges(const std::vector<RowRange>& ranges) {
        if (is_lent()) {
            throw Error::synthesis("column store window " + window_.to_string() + " is already lent");
        }
        size_t cursor = window_.start;
        for (const RowRange& range : ranges) {
            if (range.start < cursor || range.end < range.start || range.end > window_.end) {
                throw Error::synthesis("cannot split range " + range.to_string() +
                                       " out of window " + window_.to_string());
            }
            cursor = range.end;
        }

        std::vector<ColumnStore> parts;
        parts.reserve(ranges.size());
        for (const RowRange& range : ranges) {
            ColumnStore part;
            part.window_ = range;
            part.columns_.resize(columns_.size());
            const size_t offset = range.start - window_.start;
            for (size_t c = 0; c < columns_.size(); ++c) {
                auto first = columns_[c].begin() + offset;
                part.columns_[c].assign(std::make_move_iterator(first),
                                        std::make_move_iterator(first + range.size()));
            }
            parts.push_back(std::move(part));
        }
        lent_ = ranges;
        return parts;
    }

    /**
     * Move lent rows back. parts must be exactly the stores returned by
     * split_at_ranges(), in the same order.
     */
    void rejoin(std::vector<ColumnStore>&& parts) {
        if (parts.size() != lent_.size()) {
            throw Error::synthesis("rejoin expects " + std::to_string(lent_.size()) +
                                   " windows, got " + std::to_string(parts.size()));
        }
        for (size_t i = 0; i < parts.size(); ++i) {
            if (parts[i].window_ != lent_[i] || parts[i].columns_.size() != columns_.size()) {
                throw Error::synthesis("window " + parts[i].window_.to_string() +
                                       " does not match lent range " + lent_[i].to_string());
            }
        }
        for (auto& part : parts) {
            const size_t offset = part.window_.start - window_.start;
            for (size_t c = 0; c < columns_.size(); ++c) {
                std::move(part.columns_[c].begin(), part.columns_[c].end(),
                          columns_[c].begin() + offset);
            }
        }
        lent_.clear();
        parts.clear();
    }

    // Hand the backing columns out; the store must own every row
    std::vector<std::vector<T>> into_columns() && {
        if (is_lent()) {
            throw Error::synthesis("cannot release a column store while rows are lent");
        }
        return std::move(columns_);
    }

private:
    size_t slot(size_t column, size_t row) const {
        if (column >= columns_.size()) {
            throw Error::bounds_failure("column " + std::to_string(column) + " of " +
                                        std::to_string(columns_.size()));
        }
        if (!window_.contains(row)) {
            throw Error::bounds_failure("row " + std::to_string(row) +
                                        " outside window " + window_.to_string());
        }
        for (const RowRange& lent : lent_) {
            if (lent.contains(row)) {
                throw Error::synthesis("row " + std::to_string(row) +
                                       " is owned by a forked sub-context");
            }
        }
        return row - window_.start;
    }

    RowRange window_;
    std::vector<std::vector<T>> columns_;
    std::vector<RowRange> lent_;
};

} // namespace plonkish
