#include "queens_csp/solver.hpp"
#include <iostream>

namespace queens_csp {

std::optional<Solution> Solver::solve(const GridSpec& grid) {
    // 初期化
    nogoods_.clear();
    stats_ = SolverStats{};

    SearchState state(grid);
    CandidateGenerator generator(grid);

    if (verbose_) {
        std::cerr << "% [verbose] search start: " << grid.rows() << "x" << grid.cols()
                  << " grid, " << grid.num_regions() << " regions"
                  << (nogood_learning_ ? "" : ", nogood cache disabled") << "\n";
    }

    auto res = run_search(state, generator, 0);
    stats_.nogood_nodes = nogoods_.node_count();

    if (verbose_) {
        std::cerr << "% [verbose] search " << (res == SearchResult::SAT ? "SAT" : "UNSAT")
                  << ": nodes=" << stats_.node_count
                  << " fails=" << stats_.fail_count
                  << " nogoods=" << stats_.nogood_count << "\n";
    }

    if (res == SearchResult::SAT) {
        return state.partial();
    }
    return std::nullopt;
}

SearchResult Solver::run_search(SearchState& state, CandidateGenerator& generator, size_t depth) {
    // 統計更新
    stats_.node_count++;
    if (depth > stats_.max_depth) {
        stats_.max_depth = depth;
    }

    if (state.is_solved()) {
        return SearchResult::SAT;
    }

    auto candidates = generator.generate(state);
    if (generator.forward_check_failed()) {
        stats_.forward_check_fail_count++;
        if (verbose_ && depth == 0) {
            std::cerr << "% [verbose] forward check failed at root\n";
        }
    }

    for (const auto& c : candidates) {
        // NoGood チェック（配置前に安価に棄却）
        if (nogood_learning_) {
            auto key = state.partial();
            key.push_back(c.index);
            stats_.nogood_check_count++;
            if (nogoods_.search(std::move(key))) {
                stats_.nogood_prune_count++;
                continue;
            }
        }

        state.commit(c.index);

        if (run_search(state, generator, depth + 1) == SearchResult::SAT) {
            return SearchResult::SAT;
        }

        state.uncommit();
    }

    // 失敗: 候補なし、または全候補が失敗
    stats_.fail_count++;
    record_nogood(state);

    return SearchResult::UNSAT;
}

void Solver::record_nogood(const SearchState& state) {
    if (!nogood_learning_) {
        return;
    }
    nogoods_.insert(state.partial());
    stats_.nogood_count++;
}

Solution solve(const Puzzle& puzzle) {
    GridSpec grid(puzzle);
    Solver solver;
    auto sol = solver.solve(grid);
    if (sol) {
        return *sol;
    }
    return {};
}

} // namespace queens_csp
