#include "queens_csp/candidate_generator.hpp"
#include <algorithm>

namespace queens_csp {

CandidateGenerator::CandidateGenerator(const GridSpec& grid)
    : grid_(grid)
    , row_spots_(grid.rows(), 0)
    , col_spots_(grid.cols(), 0)
    , region_spots_(grid.num_regions(), 0) {}

std::vector<Candidate> CandidateGenerator::generate(const SearchState& state) {
    std::fill(row_spots_.begin(), row_spots_.end(), 0);
    std::fill(col_spots_.begin(), col_spots_.end(), 0);
    std::fill(region_spots_.begin(), region_spots_.end(), 0);
    forward_check_failed_ = false;

    std::vector<Candidate> candidates;

    for (size_t row = 0; row < grid_.rows(); ++row) {
        for (size_t col = 0; col < grid_.cols(); ++col) {
            size_t idx = grid_.index(row, col);
            if (!state.is_available(idx)) {
                continue;
            }
            size_t region = grid_.region(idx);
            row_spots_[row]++;
            col_spots_[col]++;
            region_spots_[region]++;
            candidates.push_back({idx, row, col, region, 0});
        }
    }

    // フォワードチェック
    if (forward_check_failure(state.tracker())) {
        forward_check_failed_ = true;
        return {};
    }

    // MRV: 最も制約の強い次元を持つセルから試す
    for (auto& c : candidates) {
        c.score = std::min({row_spots_[c.row], col_spots_[c.col], region_spots_[c.region]});
    }
    std::stable_sort(candidates.begin(), candidates.end(),
                     [](const Candidate& a, const Candidate& b) {
                         return a.score < b.score;
                     });

    return candidates;
}

bool CandidateGenerator::forward_check_failure(const AssignmentTracker& tracker) const {
    for (size_t row = 0; row < row_spots_.size(); ++row) {
        if (!tracker.row_used(row) && row_spots_[row] == 0) {
            return true;
        }
    }
    for (size_t col = 0; col < col_spots_.size(); ++col) {
        if (!tracker.col_used(col) && col_spots_[col] == 0) {
            return true;
        }
    }
    for (size_t region = 0; region < region_spots_.size(); ++region) {
        if (!tracker.region_used(region) && region_spots_[region] == 0) {
            return true;
        }
    }
    return false;
}

} // namespace queens_csp
