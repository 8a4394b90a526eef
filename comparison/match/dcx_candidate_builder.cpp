#include "dcx_candidate_builder.h"
#include "../../utils/dcx_worker_pool.h"
#include <algorithm>
#include <atomic>
#include <iostream>
#include <mutex>
#include <stdexcept>

dcx_candidate_builder::dcx_candidate_builder(int phash_threshold, int max_workers)
  : phash_threshold(phash_threshold), max_workers(max_workers)
{
  if (phash_threshold < 0) {
    throw std::invalid_argument("phash_threshold must not be negative");
  }
}

double dcx_candidate_builder::similarity_for(int distance, size_t bit_length)
{
  if (bit_length == 0) {
    return 0.0;
  }
  double similarity = 1.0 - static_cast<double>(distance) / static_cast<double>(bit_length);
  return std::max(0.0, std::min(1.0, similarity));
}

dcx_candidate_map dcx_candidate_builder::build(const std::vector<dcx_fingerprint>& left,
                                               const std::vector<dcx_fingerprint>& right,
                                               const dcx_progress_callback& progress) const
{
  dcx_candidate_map candidates;
  if (left.empty() || right.empty()) {
    return candidates;
  }

  const size_t total = left.size() * right.size();
  std::vector<std::vector<dcx_match_candidate>> rows(left.size());
  std::atomic<size_t> done(0);
  std::atomic<bool> length_mismatch(false);
  std::mutex progress_mutex;

  dcx_parallel_for(left.size(), max_workers, [&](size_t i) {
    const dcx_fingerprint& a = left[i];
    for (size_t j = 0; j < right.size(); ++j) {
      const dcx_fingerprint& b = right[j];
      size_t finished = ++done;
      if (progress && finished % progress_interval == 0) {
        std::lock_guard<std::mutex> lock(progress_mutex);
        progress(finished, total, "Computing similarities...");
      }

      if (a.empty() || b.empty()) {
        continue;
      }
      if (a.bit_length() != b.bit_length()) {
        length_mismatch = true;
        continue;
      }

      int distance = a.hamming_distance(b);
      if (distance <= phash_threshold) {
        rows[i].push_back(dcx_match_candidate{static_cast<int>(i), static_cast<int>(j), distance,
                                              similarity_for(distance, a.bit_length())});
      }
    }
  });

  if (length_mismatch) {
    std::cerr << "[match] Skipped page pairs with fingerprints of different bit length" << std::endl;
  }

  for (const std::vector<dcx_match_candidate>& row : rows) {
    for (const dcx_match_candidate& candidate : row) {
      candidates[std::make_pair(candidate.left_index, candidate.right_index)] = candidate;
    }
  }
  return candidates;
}

dcx_candidate_map dcx_candidate_builder::build(const std::vector<dcx_page>& left,
                                               const std::vector<dcx_page>& right,
                                               const dcx_progress_callback& progress) const
{
  std::vector<dcx_fingerprint> left_prints;
  std::vector<dcx_fingerprint> right_prints;
  for (const dcx_page& page : left) {
    left_prints.push_back(page.fingerprint());
  }
  for (const dcx_page& page : right) {
    right_prints.push_back(page.fingerprint());
  }
  return build(left_prints, right_prints, progress);
}
