#include "queens_csp/json/puzzle.hpp"
#include "queens_csp/solver.hpp"
#include <iostream>
#include <iterator>
#include <string>
#include <cstring>

void print_usage(const char* program) {
    std::cerr << "Usage: " << program << " [-n] [-s] [-v] <puzzle.json | ->\n";
    std::cerr << "  -n      Disable the nogood cache\n";
    std::cerr << "  -s      Print solver statistics to stderr\n";
    std::cerr << "  -v      Verbose mode (print search progress)\n";
    std::cerr << "  -       Read the puzzle from stdin\n";
}

bool g_print_stats = false;
bool g_verbose = false;

void print_stats(const queens_csp::Solver& solver) {
    if (!g_print_stats) return;
    const auto& s = solver.stats();
    std::cerr << "% Stats: nodes=" << s.node_count
              << " fails=" << s.fail_count
              << " max_depth=" << s.max_depth
              << " fc_fails=" << s.forward_check_fail_count
              << " nogoods=" << s.nogood_count
              << " nogood_checks=" << s.nogood_check_count
              << " nogood_prunes=" << s.nogood_prune_count
              << " trie_nodes=" << s.nogood_nodes
              << "\n";
}

int main(int argc, char* argv[]) {
    bool nogood_learning = true;
    const char* filename = nullptr;

    // Parse command line arguments
    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "-n") == 0) {
            nogood_learning = false;
        } else if (std::strcmp(argv[i], "-s") == 0) {
            g_print_stats = true;
        } else if (std::strcmp(argv[i], "-v") == 0) {
            g_verbose = true;
        } else if (std::strcmp(argv[i], "-h") == 0 ||
                   std::strcmp(argv[i], "--help") == 0) {
            print_usage(argv[0]);
            return 0;
        } else if (std::strcmp(argv[i], "-") == 0 || argv[i][0] != '-') {
            filename = argv[i];
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    if (!filename) {
        print_usage(argv[0]);
        return 1;
    }

    try {
        queens_csp::Puzzle puzzle;
        if (std::strcmp(filename, "-") == 0) {
            std::string input((std::istreambuf_iterator<char>(std::cin)),
                              std::istreambuf_iterator<char>());
            puzzle = queens_csp::json::parse_string(input);
        } else {
            puzzle = queens_csp::json::parse_file(filename);
        }

        queens_csp::GridSpec grid(puzzle);
        queens_csp::Solver solver;
        solver.set_nogood_learning(nogood_learning);
        solver.set_verbose(g_verbose);

        auto sol = solver.solve(grid);
        print_stats(solver);
        std::cout << queens_csp::json::to_json(sol.value_or(queens_csp::Solution{})) << "\n";
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
