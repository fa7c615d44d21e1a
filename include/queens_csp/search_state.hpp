/**
 * @file search_state.hpp
 * @brief 探索中の可変状態（使用ビット、干渉カウンタ、部分解）
 */
#ifndef QUEENS_CSP_SEARCH_STATE_HPP
#define QUEENS_CSP_SEARCH_STATE_HPP

#include "queens_csp/grid.hpp"
#include "queens_csp/adjacency.hpp"
#include "queens_csp/assignment_tracker.hpp"
#include <vector>

namespace queens_csp {

/**
 * @brief 探索の可変コンテキスト
 *
 * commit() と uncommit() は対で呼ぶ（スタック規律）。
 * 部分解・使用ビット・干渉カウンタは常に同期している。
 */
class SearchState {
public:
    explicit SearchState(const GridSpec& grid);

    /**
     * @brief セルに配置（部分解へ push、ビット設定、隣接カウンタ +1）
     * @pre is_available(idx)
     */
    void commit(size_t idx);

    /**
     * @brief 最後に配置したセルを取り消す
     * @pre depth() > 0
     */
    void uncommit();

    /**
     * @brief セルが現在配置可能か（行・列・領域が未使用かつ干渉なし）
     */
    bool is_available(size_t idx) const;

    bool is_solved() const { return tracker_.is_solved(); }

    /**
     * @brief 配置順の部分解
     */
    const std::vector<size_t>& partial() const { return partial_; }

    size_t depth() const { return partial_.size(); }

    const GridSpec& grid() const { return grid_; }
    const AssignmentTracker& tracker() const { return tracker_; }
    const AdjacencyTable& adjacency() const { return adjacency_; }

private:
    const GridSpec& grid_;
    AssignmentTracker tracker_;
    AdjacencyTable adjacency_;
    std::vector<size_t> partial_;
};

} // namespace queens_csp

#endif // QUEENS_CSP_SEARCH_STATE_HPP
