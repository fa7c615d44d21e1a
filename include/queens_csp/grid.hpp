/**
 * @file grid.hpp
 * @brief パズル入力（Puzzle）と検証済みグリッド定義（GridSpec）
 */
#ifndef QUEENS_CSP_GRID_HPP
#define QUEENS_CSP_GRID_HPP

#include <vector>
#include <cstdint>
#include <cstddef>

namespace queens_csp {

/**
 * @brief 行・列・領域の最大数（ビットセット幅）
 */
constexpr size_t kMaxDimension = 64;

/**
 * @brief 外部から渡されるパズル定義
 *
 * セル番号は row * cols + col。
 */
struct Puzzle {
    size_t rows = 0;
    size_t cols = 0;
    std::vector<int64_t> colors;          ///< 長さが領域数になる
    std::vector<size_t> idx_to_color;     ///< セル番号 -> 領域ID
};

/**
 * @brief 検証済みのグリッド定義（不変）
 */
class GridSpec {
public:
    /**
     * @brief Puzzle を検証して GridSpec を構築
     * @throws std::runtime_error 行数・列数・領域数が 0 または kMaxDimension 超、
     *         idx_to_color の長さが rows * cols と異なる場合
     * @throws std::out_of_range 領域IDが領域数以上の場合
     */
    explicit GridSpec(const Puzzle& puzzle);

    size_t rows() const { return rows_; }
    size_t cols() const { return cols_; }
    size_t num_regions() const { return num_regions_; }
    size_t num_cells() const { return regions_.size(); }

    /**
     * @brief セルの領域IDを取得
     */
    size_t region(size_t idx) const { return regions_[idx]; }

    size_t index(size_t row, size_t col) const { return row * cols_ + col; }
    size_t row_of(size_t idx) const { return idx / cols_; }
    size_t col_of(size_t idx) const { return idx % cols_; }

private:
    size_t rows_;
    size_t cols_;
    size_t num_regions_;
    std::vector<size_t> regions_;
};

} // namespace queens_csp

#endif // QUEENS_CSP_GRID_HPP
