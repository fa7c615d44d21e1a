#include "queens_csp/nogood_cache.hpp"
#include <algorithm>

namespace queens_csp {

NoGoodCache::NoGoodCache()
    : root_(std::make_unique<Node>()) {}

NoGoodCache::~NoGoodCache() = default;

void NoGoodCache::insert(std::vector<size_t> cells) {
    std::sort(cells.begin(), cells.end());

    Node* current = root_.get();
    for (size_t idx : cells) {
        auto& child = current->children[idx];
        if (!child) {
            child = std::make_unique<Node>();
            node_count_++;
        }
        current = child.get();
    }

    current->terminal = true;
    inserted_++;
}

bool NoGoodCache::search(std::vector<size_t> cells) const {
    std::sort(cells.begin(), cells.end());

    const Node* current = root_.get();
    for (size_t idx : cells) {
        auto it = current->children.find(idx);
        if (it == current->children.end()) {
            // 要素を読み飛ばさない
            return false;
        }
        current = it->second.get();
        if (current->terminal) {
            return true;
        }
    }

    return false;
}

void NoGoodCache::clear() {
    root_ = std::make_unique<Node>();
    inserted_ = 0;
    node_count_ = 1;
}

} // namespace queens_csp
