/**
 * @file solver.hpp
 * @brief バックトラック探索ソルバー（フォワードチェック、MRV、NoGood キャッシュ）
 */
#ifndef QUEENS_CSP_SOLVER_HPP
#define QUEENS_CSP_SOLVER_HPP

#include "queens_csp/grid.hpp"
#include "queens_csp/search_state.hpp"
#include "queens_csp/candidate_generator.hpp"
#include "queens_csp/nogood_cache.hpp"
#include <optional>
#include <vector>

namespace queens_csp {

/**
 * @brief 解を表す型（配置順のセル番号）
 */
using Solution = std::vector<size_t>;

/**
 * @brief 探索結果
 */
enum class SearchResult {
    SAT,      // 解が見つかった
    UNSAT     // この部分木に解は存在しない
};

/**
 * @brief ソルバー統計情報
 */
struct SolverStats {
    size_t node_count = 0;
    size_t max_depth = 0;
    size_t fail_count = 0;
    size_t forward_check_fail_count = 0;
    size_t nogood_count = 0;
    size_t nogood_check_count = 0;
    size_t nogood_prune_count = 0;
    size_t nogood_nodes = 0;
};

/**
 * @brief パズルソルバー
 *
 * 以下の技術を使用：
 * - 行・列・領域ビットセットと斜め隣接カウンタによる O(1) 判定
 * - フォワードチェック（残り候補 0 の次元を検出して即失敗）
 * - MRV 順序付け
 * - NoGood キャッシュ（失敗した部分解の記録と枝刈り）
 *
 * 最初に見つかった解を返す。呼び出しごとに状態を作り直し、共有しない。
 */
class Solver {
public:
    Solver() = default;

    /**
     * @brief 最初の解を探索
     * @param grid 解くグリッド
     * @return 解が見つかればその解、なければstd::nullopt
     */
    std::optional<Solution> solve(const GridSpec& grid);

    /**
     * @brief 統計情報を取得
     */
    const SolverStats& stats() const { return stats_; }

    /**
     * @brief NoGood キャッシュを有効/無効にする
     */
    void set_nogood_learning(bool enabled) { nogood_learning_ = enabled; }

    /**
     * @brief verbose モードを有効/無効にする
     */
    void set_verbose(bool enabled) { verbose_ = enabled; }

private:
    /**
     * @brief 再帰探索
     * @param depth 現在の配置数
     */
    SearchResult run_search(SearchState& state, CandidateGenerator& generator, size_t depth);

    /**
     * @brief 現在の部分解を NoGood として記録
     */
    void record_nogood(const SearchState& state);

    bool nogood_learning_ = true;
    bool verbose_ = false;

    NoGoodCache nogoods_;
    SolverStats stats_;
};

/**
 * @brief Puzzle を検証して解く
 * @return 解（配置順のセル番号）。解がなければ空
 * @throws std::runtime_error, std::out_of_range 入力が不正な場合（GridSpec 参照）
 */
Solution solve(const Puzzle& puzzle);

} // namespace queens_csp

#endif // QUEENS_CSP_SOLVER_HPP
