/**
 * @file nogood_cache.hpp
 * @brief 失敗した部分解を記録するトライ（NoGood キャッシュ）
 */
#ifndef QUEENS_CSP_NOGOOD_CACHE_HPP
#define QUEENS_CSP_NOGOOD_CACHE_HPP

#include <vector>
#include <memory>
#include <unordered_map>
#include <cstddef>

namespace queens_csp {

/**
 * @brief NoGood キャッシュ
 *
 * 記録済みの失敗集合（セル番号の昇順パス）をトライで保持する。
 *
 * search() は昇順に並べたクエリを根から順に辿り、途中で終端ノードに
 * 到達したら true を返す。子が見つからなければその時点で false。
 * つまり記録済み集合がクエリの「最小要素から隙間なく並んだ接頭辞」と
 * 一致する場合のみ検出する（健全だが不完全）。
 */
class NoGoodCache {
public:
    NoGoodCache();
    ~NoGoodCache();

    NoGoodCache(const NoGoodCache&) = delete;
    NoGoodCache& operator=(const NoGoodCache&) = delete;

    /**
     * @brief 失敗集合を記録
     * @param cells 同時に配置されていたセル番号（順不同）
     */
    void insert(std::vector<size_t> cells);

    /**
     * @brief クエリが記録済み集合を接頭辞として含むか
     * @param cells 判定するセル番号（順不同）
     * @return 記録済みの失敗集合を検出したら true
     */
    bool search(std::vector<size_t> cells) const;

    /**
     * @brief 記録した集合の数（重複挿入も数える）
     */
    size_t size() const { return inserted_; }

    /**
     * @brief トライのノード数（根を含む）
     */
    size_t node_count() const { return node_count_; }

    /**
     * @brief 全て削除
     */
    void clear();

private:
    struct Node {
        std::unordered_map<size_t, std::unique_ptr<Node>> children;
        bool terminal = false;
    };

    std::unique_ptr<Node> root_;
    size_t inserted_ = 0;
    size_t node_count_ = 1;
};

} // namespace queens_csp

#endif // QUEENS_CSP_NOGOOD_CACHE_HPP
