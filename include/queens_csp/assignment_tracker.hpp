/**
 * @file assignment_tracker.hpp
 * @brief 使用済みの行・列・領域を管理するビットセット
 */
#ifndef QUEENS_CSP_ASSIGNMENT_TRACKER_HPP
#define QUEENS_CSP_ASSIGNMENT_TRACKER_HPP

#include "queens_csp/grid.hpp"
#include <cstdint>
#include <cstddef>

namespace queens_csp {

/**
 * @brief 行・列・領域の使用状況（各 64bit）
 *
 * 全て O(1)。サイズの検証は GridSpec 構築時に済んでいる前提。
 */
class AssignmentTracker {
public:
    explicit AssignmentTracker(const GridSpec& grid)
        : full_rows_(full_mask(grid.rows()))
        , full_cols_(full_mask(grid.cols()))
        , full_regions_(full_mask(grid.num_regions())) {}

    bool is_used(size_t row, size_t col, size_t region) const {
        return ((rows_ >> row) & 1) || ((cols_ >> col) & 1) || ((regions_ >> region) & 1);
    }

    bool row_used(size_t row) const { return (rows_ >> row) & 1; }
    bool col_used(size_t col) const { return (cols_ >> col) & 1; }
    bool region_used(size_t region) const { return (regions_ >> region) & 1; }

    /**
     * @brief (row, col, region) を一括で使用済み/未使用に設定
     */
    void set(size_t row, size_t col, size_t region, bool value) {
        uint64_t bit = value ? 1 : 0;
        rows_ = (rows_ & ~(uint64_t{1} << row)) | (bit << row);
        cols_ = (cols_ & ~(uint64_t{1} << col)) | (bit << col);
        regions_ = (regions_ & ~(uint64_t{1} << region)) | (bit << region);
    }

    /**
     * @brief 全ての行・列・領域が使用済みか
     */
    bool is_solved() const {
        return rows_ == full_rows_ && cols_ == full_cols_ && regions_ == full_regions_;
    }

    uint64_t rows() const { return rows_; }
    uint64_t cols() const { return cols_; }
    uint64_t regions() const { return regions_; }

    /**
     * @brief 下位 n ビットが立ったマスク（n == 64 を含む）
     */
    static uint64_t full_mask(size_t n) {
        return n >= 64 ? ~uint64_t{0} : (uint64_t{1} << n) - 1;
    }

private:
    uint64_t rows_ = 0;
    uint64_t cols_ = 0;
    uint64_t regions_ = 0;
    uint64_t full_rows_;
    uint64_t full_cols_;
    uint64_t full_regions_;
};

} // namespace queens_csp

#endif // QUEENS_CSP_ASSIGNMENT_TRACKER_HPP
