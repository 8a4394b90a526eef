#ifndef DCX_ASSIGNMENT_SOLVER_H
#define DCX_ASSIGNMENT_SOLVER_H

#include "dcx_candidate_builder.h"
#include "dcx_match_result.h"
#include <vector>

/**
 * Optimal one-to-one page assignment.
 *
 * Candidates are placed in a square cost matrix of side max(nL, nR);
 * cost = hash distance + |i/nL - j/nR| * position_weight * bit_length.
 * Cells without a candidate, and the padding, hold no_match_cost. The
 * Hungarian method picks the cheapest perfect matching; pairs that land on
 * no_match_cost are thrown away and their pages reported as unmatched.
 */
class dcx_assignment_solver {
private:
    double position_weight;

public:
    // Far above any real cost, which is bounded by bit_length * (1 + position_weight)
    static constexpr double no_match_cost = 1e9;

    explicit dcx_assignment_solver(double position_weight = 0.1);

    double weight() const { return position_weight; }

    dcx_matching_result solve(const dcx_candidate_map& candidates,
                              int left_count, int right_count,
                              size_t bit_length) const;

    double position_penalty(int left, int right, int left_count, int right_count,
                            size_t bit_length) const;

    /**
     * Minimum cost assignment of rows to columns (rows <= columns) using
     * row and column potentials with shortest augmenting paths, O(n^3).
     * Returns the column for every row.
     * @throws std::invalid_argument for ragged input or more rows than columns
     */
    static std::vector<int> hungarian(const std::vector<std::vector<double>>& cost);
};

#endif // DCX_ASSIGNMENT_SOLVER_H
