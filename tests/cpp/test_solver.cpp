#include <catch2/catch_test_macros.hpp>
#include "queens_csp/solver.hpp"
#include "queens_csp/grid.hpp"
#include <algorithm>
#include <cstdlib>
#include <numeric>
#include <random>
#include <set>
#include <stdexcept>

using namespace queens_csp;

namespace {

// Checks rows, columns, regions and diagonal adjacency of a full solution
bool is_valid_solution(const GridSpec& grid, const Solution& sol) {
    if (sol.size() != grid.rows()) return false;
    std::set<size_t> rows, cols, regions;
    for (size_t idx : sol) {
        if (idx >= grid.num_cells()) return false;
        rows.insert(grid.row_of(idx));
        cols.insert(grid.col_of(idx));
        regions.insert(grid.region(idx));
    }
    if (rows.size() != sol.size() || cols.size() != sol.size() ||
        regions.size() != sol.size()) {
        return false;
    }
    for (size_t i = 0; i < sol.size(); ++i) {
        for (size_t j = i + 1; j < sol.size(); ++j) {
            auto dr = static_cast<long>(grid.row_of(sol[i])) - static_cast<long>(grid.row_of(sol[j]));
            auto dc = static_cast<long>(grid.col_of(sol[i])) - static_cast<long>(grid.col_of(sol[j]));
            if (std::abs(dr) == 1 && std::abs(dc) == 1) return false;
        }
    }
    return true;
}

// Exhaustive count over column permutations (square grids only)
size_t brute_force_count(const GridSpec& grid) {
    size_t n = grid.rows();
    if (grid.cols() != n || grid.num_regions() != n) return 0;

    std::vector<size_t> perm(n);
    std::iota(perm.begin(), perm.end(), 0);
    size_t count = 0;
    do {
        bool ok = true;
        std::vector<bool> region_used(n, false);
        for (size_t r = 0; r < n && ok; ++r) {
            size_t region = grid.region(grid.index(r, perm[r]));
            if (region_used[region]) ok = false;
            region_used[region] = true;
            if (r > 0) {
                auto d = static_cast<long>(perm[r]) - static_cast<long>(perm[r - 1]);
                if (d == 1 || d == -1) ok = false;
            }
        }
        if (ok) count++;
    } while (std::next_permutation(perm.begin(), perm.end()));
    return count;
}

Puzzle make_puzzle(size_t rows, size_t cols, size_t regions, std::vector<size_t> idx_to_color) {
    Puzzle p;
    p.rows = rows;
    p.cols = cols;
    for (size_t i = 0; i < regions; ++i) {
        p.colors.push_back(static_cast<int64_t>(i));
    }
    p.idx_to_color = std::move(idx_to_color);
    return p;
}

// n x n puzzle with random regions
Puzzle random_puzzle(size_t n, std::mt19937& rng) {
    std::uniform_int_distribution<size_t> dist(0, n - 1);
    std::vector<size_t> cells(n * n);
    for (auto& c : cells) c = dist(rng);
    return make_puzzle(n, n, n, std::move(cells));
}

// n x n puzzle built around a random placement, so it has at least one solution
// (n = 2 and n = 3 admit no placement)
Puzzle seeded_puzzle(size_t n, std::mt19937& rng) {
    std::vector<size_t> perm(n);
    std::iota(perm.begin(), perm.end(), 0);
    bool ok = false;
    while (!ok) {
        std::shuffle(perm.begin(), perm.end(), rng);
        ok = true;
        for (size_t r = 1; r < n; ++r) {
            auto d = static_cast<long>(perm[r]) - static_cast<long>(perm[r - 1]);
            if (d == 1 || d == -1) ok = false;
        }
    }

    std::uniform_int_distribution<size_t> dist(0, n - 1);
    std::vector<size_t> cells(n * n);
    for (auto& c : cells) c = dist(rng);
    for (size_t r = 0; r < n; ++r) {
        cells[r * n + perm[r]] = r;
    }
    return make_puzzle(n, n, n, std::move(cells));
}

}  // namespace

// ============================================================================
// Boundary cases
// ============================================================================

TEST_CASE("Solver 1x1 grid", "[solver]") {
    GridSpec grid(make_puzzle(1, 1, 1, {0}));
    Solver solver;

    auto sol = solver.solve(grid);
    REQUIRE(sol.has_value());
    REQUIRE(*sol == Solution{0});
}

TEST_CASE("Solver region without cells is unsatisfiable", "[solver]") {
    GridSpec grid(make_puzzle(1, 1, 2, {0}));
    Solver solver;

    REQUIRE(!solver.solve(grid).has_value());
    REQUIRE(solver.stats().max_depth == 0);
    REQUIRE(solver.stats().forward_check_fail_count == 1);
}

TEST_CASE("Solver two regions in one 2x2 block", "[solver]") {
    // Region 0 on one diagonal, region 1 on the other
    GridSpec grid(make_puzzle(2, 2, 2, {0, 1, 1, 0}));
    Solver solver;

    REQUIRE(!solver.solve(grid).has_value());

    // Every first placement is rejected one level down by the forward check
    const auto& s = solver.stats();
    REQUIRE(s.max_depth == 1);
    REQUIRE(s.node_count == 5);
    REQUIRE(s.forward_check_fail_count == 4);
    REQUIRE(s.fail_count == 5);
}

TEST_CASE("Solver confined region is rejected without deep recursion", "[solver]") {
    // Region 1 is the single cell (1,1); region 0 fills the rest of the
    // top-left 2x2 block, so every cell of region 0 conflicts with it.
    GridSpec grid(make_puzzle(4, 4, 4, {
        0, 0, 2, 2,
        0, 1, 2, 2,
        3, 3, 3, 3,
        3, 3, 3, 3,
    }));

    SECTION("with nogood cache") {
        Solver solver;
        REQUIRE(!solver.solve(grid).has_value());
        REQUIRE(solver.stats().max_depth <= 2);
        REQUIRE(solver.stats().forward_check_fail_count > 0);
    }

    SECTION("without nogood cache") {
        Solver solver;
        solver.set_nogood_learning(false);
        REQUIRE(!solver.solve(grid).has_value());
        REQUIRE(solver.stats().max_depth <= 2);
    }
}

TEST_CASE("Solver non-square grid is unsatisfiable", "[solver]") {
    GridSpec grid(make_puzzle(2, 3, 2, {0, 0, 0, 1, 1, 1}));
    Solver solver;

    REQUIRE(!solver.solve(grid).has_value());
}

// ============================================================================
// Scenarios
// ============================================================================

TEST_CASE("Solver 5x5 with a single placement", "[solver]") {
    // Regions 0-3 are single cells at (0,0), (1,2), (2,4), (3,1);
    // region 4 covers the rest, leaving only (4,3) for it.
    std::vector<size_t> cells(25, 4);
    cells[0] = 0;
    cells[7] = 1;
    cells[14] = 2;
    cells[16] = 3;
    GridSpec grid(make_puzzle(5, 5, 5, cells));
    REQUIRE(brute_force_count(grid) == 1);

    Solver solver;
    auto sol = solver.solve(grid);
    REQUIRE(sol.has_value());
    REQUIRE(is_valid_solution(grid, *sol));

    auto sorted = *sol;
    std::sort(sorted.begin(), sorted.end());
    REQUIRE(sorted == Solution{0, 7, 14, 16, 23});
}

TEST_CASE("Solver band layout", "[solver]") {
    // Each region is a horizontal band, so only rows and diagonals matter
    GridSpec grid(make_puzzle(4, 4, 4, {
        0, 0, 0, 0,
        1, 1, 1, 1,
        2, 2, 2, 2,
        3, 3, 3, 3,
    }));
    Solver solver;

    auto sol = solver.solve(grid);
    REQUIRE(sol.has_value());
    REQUIRE(is_valid_solution(grid, *sol));
    REQUIRE(*sol == Solution{1, 7, 8, 14});

    // Some candidates are rejected by the nogood cache before commit
    REQUIRE(solver.stats().nogood_prune_count > 0);
}

TEST_CASE("solve(Puzzle) returns empty sequence when unsatisfiable", "[solver]") {
    REQUIRE(solve(make_puzzle(2, 2, 2, {0, 1, 1, 0})).empty());
    REQUIRE(solve(make_puzzle(1, 1, 1, {0})) == Solution{0});
}

TEST_CASE("solve(Puzzle) rejects malformed input", "[solver]") {
    REQUIRE_THROWS_AS(solve(make_puzzle(2, 2, 2, {0, 1, 1})), std::runtime_error);
    REQUIRE_THROWS_AS(solve(make_puzzle(2, 2, 2, {0, 1, 1, 5})), std::out_of_range);
}

// ============================================================================
// Properties
// ============================================================================

TEST_CASE("Solver is deterministic", "[solver]") {
    std::mt19937 rng(20240611);
    for (int i = 0; i < 20; ++i) {
        GridSpec grid(seeded_puzzle(6, rng));
        Solver a;
        Solver b;
        auto sol_a = a.solve(grid);
        auto sol_b = b.solve(grid);
        REQUIRE(sol_a == sol_b);

        // Reusing a solver does not carry state across calls
        auto sol_again = a.solve(grid);
        REQUIRE(sol_again == sol_a);
        REQUIRE(a.stats().node_count == b.stats().node_count);
    }
}

TEST_CASE("Solver agrees with brute force on small grids", "[solver][nogood]") {
    auto run_test = [](bool nogood_learning, const GridSpec& grid) {
        Solver solver;
        solver.set_nogood_learning(nogood_learning);
        return solver.solve(grid);
    };

    std::mt19937 rng(12345678);
    size_t solvable = 0;
    size_t unsat = 0;

    for (size_t n = 1; n <= 6; ++n) {
        for (int i = 0; i < 60; ++i) {
            bool seeded = (i % 2 == 1) && (n == 1 || n >= 4);
            Puzzle p = seeded ? seeded_puzzle(n, rng) : random_puzzle(n, rng);
            GridSpec grid(p);
            size_t expected = brute_force_count(grid);

            auto sol_on = run_test(true, grid);
            auto sol_off = run_test(false, grid);

            REQUIRE(sol_on.has_value() == (expected > 0));
            REQUIRE(sol_off.has_value() == (expected > 0));
            if (expected > 0) {
                REQUIRE(is_valid_solution(grid, *sol_on));
                REQUIRE(is_valid_solution(grid, *sol_off));
                solvable++;
            } else {
                unsat++;
            }
        }
    }

    // Sanity check: both verdicts occur
    REQUIRE(solvable > 0);
    REQUIRE(unsat > 0);
}

TEST_CASE("Solver without nogood cache records nothing", "[solver][nogood]") {
    std::mt19937 rng(42);
    GridSpec grid(random_puzzle(6, rng));
    Solver solver;
    solver.set_nogood_learning(false);
    solver.solve(grid);

    REQUIRE(solver.stats().nogood_count == 0);
    REQUIRE(solver.stats().nogood_check_count == 0);
    REQUIRE(solver.stats().nogood_prune_count == 0);
    REQUIRE(solver.stats().nogood_nodes == 1);
}

TEST_CASE("Solver records a nogood for every dead end", "[solver][nogood]") {
    GridSpec grid(make_puzzle(2, 2, 2, {0, 1, 1, 0}));
    Solver solver;
    solver.solve(grid);

    REQUIRE(solver.stats().nogood_count == solver.stats().fail_count);
    // Root plus one node per single-cell dead end
    REQUIRE(solver.stats().nogood_nodes == 5);
}
