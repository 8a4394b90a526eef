#include "dcx_assignment_solver.h"
#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>

dcx_assignment_solver::dcx_assignment_solver(double position_weight)
  : position_weight(position_weight)
{
  if (position_weight < 0.0) {
    throw std::invalid_argument("position_weight must not be negative");
  }
}

double dcx_assignment_solver::position_penalty(int left, int right, int left_count, int right_count,
                                               size_t bit_length) const
{
  if (left_count <= 0 || right_count <= 0) {
    return 0.0;
  }
  double left_pos = static_cast<double>(left) / left_count;
  double right_pos = static_cast<double>(right) / right_count;
  return std::fabs(left_pos - right_pos) * position_weight * static_cast<double>(bit_length);
}

std::vector<int> dcx_assignment_solver::hungarian(const std::vector<std::vector<double>>& cost)
{
  const size_t n = cost.size();
  if (n == 0) {
    return std::vector<int>();
  }
  const size_t m = cost[0].size();
  for (const std::vector<double>& row : cost) {
    if (row.size() != m) {
      throw std::invalid_argument("Cost matrix rows must have equal length");
    }
  }
  if (n > m) {
    throw std::invalid_argument("Cost matrix needs at least as many columns as rows");
  }

  const double inf = std::numeric_limits<double>::infinity();

  // 1-based; column 0 is the virtual start of each augmenting path
  std::vector<double> u(n + 1, 0.0);
  std::vector<double> v(m + 1, 0.0);
  std::vector<size_t> p(m + 1, 0);
  std::vector<size_t> way(m + 1, 0);

  for (size_t i = 1; i <= n; ++i) {
    p[0] = i;
    size_t j0 = 0;
    std::vector<double> minv(m + 1, inf);
    std::vector<bool> used(m + 1, false);

    do {
      used[j0] = true;
      size_t i0 = p[j0];
      double delta = inf;
      size_t j1 = 0;

      for (size_t j = 1; j <= m; ++j) {
        if (used[j]) {
          continue;
        }
        double cur = cost[i0 - 1][j - 1] - u[i0] - v[j];
        if (cur < minv[j]) {
          minv[j] = cur;
          way[j] = j0;
        }
        if (minv[j] < delta) {
          delta = minv[j];
          j1 = j;
        }
      }

      for (size_t j = 0; j <= m; ++j) {
        if (used[j]) {
          u[p[j]] += delta;
          v[j] -= delta;
        } else {
          minv[j] -= delta;
        }
      }
      j0 = j1;
    } while (p[j0] != 0);

    // flip the augmenting path
    do {
      size_t j1 = way[j0];
      p[j0] = p[j1];
      j0 = j1;
    } while (j0 != 0);
  }

  std::vector<int> assignment(n, -1);
  for (size_t j = 1; j <= m; ++j) {
    if (p[j] != 0) {
      assignment[p[j] - 1] = static_cast<int>(j - 1);
    }
  }
  return assignment;
}

dcx_matching_result dcx_assignment_solver::solve(const dcx_candidate_map& candidates,
                                                 int left_count, int right_count,
                                                 size_t bit_length) const
{
  dcx_matching_result result;
  std::vector<bool> left_done(static_cast<size_t>(std::max(left_count, 0)), false);
  std::vector<bool> right_done(static_cast<size_t>(std::max(right_count, 0)), false);

  if (left_count > 0 && right_count > 0 && !candidates.empty()) {
    const size_t n = static_cast<size_t>(std::max(left_count, right_count));
    std::vector<std::vector<double>> cost(n, std::vector<double>(n, no_match_cost));

    for (const auto& entry : candidates) {
      const dcx_match_candidate& c = entry.second;
      if (c.left_index < 0 || c.left_index >= left_count ||
          c.right_index < 0 || c.right_index >= right_count) {
        continue;
      }
      cost[c.left_index][c.right_index] =
        c.hash_distance + position_penalty(c.left_index, c.right_index, left_count, right_count, bit_length);
    }

    std::vector<int> assignment = hungarian(cost);
    for (size_t i = 0; i < assignment.size(); ++i) {
      int j = assignment[i];
      if (static_cast<int>(i) >= left_count || j < 0 || j >= right_count) {
        continue;
      }
      if (cost[i][j] >= no_match_cost) {
        continue;
      }
      const dcx_match_candidate& c = candidates.at(std::make_pair(static_cast<int>(i), j));
      result.add(dcx_match_result::make_matched(c.left_index, c.right_index, c.similarity, c.hash_distance));
      left_done[i] = true;
      right_done[j] = true;
    }
  }

  for (size_t i = 0; i < left_done.size(); ++i) {
    if (!left_done[i]) {
      result.add(dcx_match_result::make_unmatched_left(static_cast<int>(i)));
    }
  }
  for (size_t j = 0; j < right_done.size(); ++j) {
    if (!right_done[j]) {
      result.add(dcx_match_result::make_unmatched_right(static_cast<int>(j)));
    }
  }

  result.sort_matches();
  return result;
}
