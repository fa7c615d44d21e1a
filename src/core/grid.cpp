#include "queens_csp/grid.hpp"
#include <stdexcept>
#include <string>

namespace queens_csp {

namespace {

void check_dimension(const char* what, size_t value) {
    if (value == 0) {
        throw std::runtime_error(std::string(what) + " must be positive");
    }
    if (value > kMaxDimension) {
        throw std::runtime_error(std::string(what) + " exceeds " +
                                 std::to_string(kMaxDimension) + ": " +
                                 std::to_string(value));
    }
}

}  // namespace

GridSpec::GridSpec(const Puzzle& puzzle)
    : rows_(puzzle.rows)
    , cols_(puzzle.cols)
    , num_regions_(puzzle.colors.size())
    , regions_(puzzle.idx_to_color) {
    check_dimension("rows", rows_);
    check_dimension("cols", cols_);
    check_dimension("region count", num_regions_);

    if (regions_.size() != rows_ * cols_) {
        throw std::runtime_error("idxToColor length " + std::to_string(regions_.size()) +
                                 " does not match rows * cols = " +
                                 std::to_string(rows_ * cols_));
    }

    for (size_t idx = 0; idx < regions_.size(); ++idx) {
        if (regions_[idx] >= num_regions_) {
            throw std::out_of_range("Region id " + std::to_string(regions_[idx]) +
                                    " out of range at cell " + std::to_string(idx));
        }
    }
}

} // namespace queens_csp
