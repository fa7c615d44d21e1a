#include "queens_csp/search_state.hpp"

namespace queens_csp {

SearchState::SearchState(const GridSpec& grid)
    : grid_(grid)
    , tracker_(grid)
    , adjacency_(grid) {
    partial_.reserve(kMaxDimension);
}

void SearchState::commit(size_t idx) {
    partial_.push_back(idx);
    tracker_.set(grid_.row_of(idx), grid_.col_of(idx), grid_.region(idx), true);
    adjacency_.block_neighbors(idx);
}

void SearchState::uncommit() {
    size_t idx = partial_.back();
    partial_.pop_back();
    tracker_.set(grid_.row_of(idx), grid_.col_of(idx), grid_.region(idx), false);
    adjacency_.unblock_neighbors(idx);
}

bool SearchState::is_available(size_t idx) const {
    return !tracker_.is_used(grid_.row_of(idx), grid_.col_of(idx), grid_.region(idx)) &&
           !adjacency_.is_blocked(idx);
}

} // namespace queens_csp
