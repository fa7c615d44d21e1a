/**
 * @file adjacency.hpp
 * @brief 斜め隣接テーブルと干渉カウンタ
 */
#ifndef QUEENS_CSP_ADJACENCY_HPP
#define QUEENS_CSP_ADJACENCY_HPP

#include "queens_csp/grid.hpp"
#include <vector>
#include <cstddef>

namespace queens_csp {

/**
 * @brief セルごとの斜め隣接セル（最大4つ）と干渉カウンタ
 *
 * 隣接リストは構築後に変更しない。カウンタは配置時に +1、取り消し時に -1。
 * カウンタが正のセルには配置できない。
 */
class AdjacencyTable {
public:
    explicit AdjacencyTable(const GridSpec& grid);

    /**
     * @brief セルの斜め隣接セル一覧
     */
    const std::vector<size_t>& neighbors(size_t idx) const { return neighbors_[idx]; }

    /**
     * @brief 干渉カウンタ
     */
    size_t count(size_t idx) const { return counts_[idx]; }

    /**
     * @brief 斜め隣接により配置不可か
     */
    bool is_blocked(size_t idx) const { return counts_[idx] > 0; }

    /**
     * @brief idx の隣接セルのカウンタを +1
     */
    void block_neighbors(size_t idx);

    /**
     * @brief idx の隣接セルのカウンタを -1
     */
    void unblock_neighbors(size_t idx);

private:
    std::vector<std::vector<size_t>> neighbors_;
    std::vector<size_t> counts_;
};

} // namespace queens_csp

#endif // QUEENS_CSP_ADJACENCY_HPP
