/**
 * @file candidate_generator.hpp
 * @brief 候補セルの列挙、フォワードチェック、MRV 順序付け
 */
#ifndef QUEENS_CSP_CANDIDATE_GENERATOR_HPP
#define QUEENS_CSP_CANDIDATE_GENERATOR_HPP

#include "queens_csp/search_state.hpp"
#include <vector>
#include <cstddef>

namespace queens_csp {

/**
 * @brief 次に配置可能なセル
 */
struct Candidate {
    size_t index;
    size_t row;
    size_t col;
    size_t region;
    size_t score;  ///< 行・列・領域の残り候補数の最小値
};

/**
 * @brief 候補生成器
 *
 * 全セルを走査して配置可能なセルを集め、未使用の行・列・領域ごとに
 * 残り候補数を数える。残り 0 の未使用次元があれば空を返す（フォワードチェック）。
 * 残りは score 昇順に安定ソートする（同点は行優先の走査順）。
 */
class CandidateGenerator {
public:
    explicit CandidateGenerator(const GridSpec& grid);

    /**
     * @brief 順序付き候補を生成
     * @return 候補リスト。行き止まりなら空
     */
    std::vector<Candidate> generate(const SearchState& state);

    /**
     * @brief 直前の generate() がフォワードチェックで失敗したか
     */
    bool forward_check_failed() const { return forward_check_failed_; }

    // 直前の走査での残り候補数
    const std::vector<size_t>& row_spots() const { return row_spots_; }
    const std::vector<size_t>& col_spots() const { return col_spots_; }
    const std::vector<size_t>& region_spots() const { return region_spots_; }

private:
    bool forward_check_failure(const AssignmentTracker& tracker) const;

    const GridSpec& grid_;
    std::vector<size_t> row_spots_;
    std::vector<size_t> col_spots_;
    std::vector<size_t> region_spots_;
    bool forward_check_failed_ = false;
};

} // namespace queens_csp

#endif // QUEENS_CSP_CANDIDATE_GENERATOR_HPP
