#include "queens_csp/adjacency.hpp"

namespace queens_csp {

AdjacencyTable::AdjacencyTable(const GridSpec& grid)
    : neighbors_(grid.num_cells())
    , counts_(grid.num_cells(), 0) {
    const int rows = static_cast<int>(grid.rows());
    const int cols = static_cast<int>(grid.cols());
    static constexpr int dr[] = {-1, -1, 1, 1};
    static constexpr int dc[] = {-1, 1, -1, 1};

    for (int row = 0; row < rows; ++row) {
        for (int col = 0; col < cols; ++col) {
            auto& list = neighbors_[grid.index(row, col)];
            list.reserve(4);
            for (int k = 0; k < 4; ++k) {
                int r = row + dr[k];
                int c = col + dc[k];
                if (r >= 0 && r < rows && c >= 0 && c < cols) {
                    list.push_back(grid.index(r, c));
                }
            }
        }
    }
}

void AdjacencyTable::block_neighbors(size_t idx) {
    for (size_t n : neighbors_[idx]) {
        counts_[n]++;
    }
}

void AdjacencyTable::unblock_neighbors(size_t idx) {
    for (size_t n : neighbors_[idx]) {
        counts_[n]--;
    }
}

} // namespace queens_csp
