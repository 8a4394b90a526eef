#include "dcx_page_matcher.h"
#include "../dcx_compare_exceptions.h"
#include "../../utils/dcx_worker_pool.h"
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <atomic>
#include <iostream>
#include <mutex>

namespace {

  cv::Mat to_gray(const cv::Mat& image) {
    if (image.depth() != CV_8U) {
      throw dcx_invalid_image_error("ssim", "expected 8-bit pixels");
    }
    cv::Mat gray;
    switch (image.channels()) {
      case 1:
        gray = image.clone();
        break;
      case 3:
        cv::cvtColor(image, gray, cv::COLOR_BGR2GRAY);
        break;
      case 4:
        cv::cvtColor(image, gray, cv::COLOR_BGRA2GRAY);
        break;
      default:
        throw dcx_invalid_image_error("ssim", "expected 1, 3 or 4 channels");
    }
    return gray;
  }

}

dcx_page_matcher::dcx_page_matcher(int phash_threshold, double position_weight, int max_workers)
  : phash_threshold(phash_threshold), position_weight(position_weight), max_workers(max_workers)
{
}

dcx_page_matcher dcx_page_matcher::from_config(const dcx_compare_config& config)
{
  return dcx_page_matcher(static_cast<int>(*config.phash_threshold),
                          *config.position_weight,
                          static_cast<int>(*config.max_workers));
}

void dcx_page_matcher::check_fingerprints(const std::vector<dcx_page>& pages, const dcx_string& side)
{
  for (const dcx_page& page : pages) {
    if (page.has_thumbnail() && !page.fingerprint_attempted()) {
      throw dcx_fingerprint_missing_error(side, page.index());
    }
  }
}

dcx_matching_result dcx_page_matcher::match(const std::vector<dcx_page>& left,
                                            const std::vector<dcx_page>& right,
                                            const dcx_progress_callback& progress) const
{
  // an empty side never needs fingerprints
  if (left.empty() || right.empty()) {
    dcx_assignment_solver solver(position_weight);
    return solver.solve(dcx_candidate_map(), static_cast<int>(left.size()),
                        static_cast<int>(right.size()), 0);
  }

  check_fingerprints(left, "left");
  check_fingerprints(right, "right");

  std::vector<dcx_fingerprint> left_prints;
  std::vector<dcx_fingerprint> right_prints;
  for (const dcx_page& page : left) {
    left_prints.push_back(page.fingerprint());
  }
  for (const dcx_page& page : right) {
    right_prints.push_back(page.fingerprint());
  }
  return match_fingerprints(left_prints, right_prints, progress);
}

dcx_matching_result dcx_page_matcher::match(const dcx_document& left, const dcx_document& right,
                                            const dcx_progress_callback& progress) const
{
  return match(left.pages(), right.pages(), progress);
}

dcx_matching_result dcx_page_matcher::match_fingerprints(const std::vector<dcx_fingerprint>& left,
                                                         const std::vector<dcx_fingerprint>& right,
                                                         const dcx_progress_callback& progress) const
{
  dcx_assignment_solver solver(position_weight);
  const int left_count = static_cast<int>(left.size());
  const int right_count = static_cast<int>(right.size());
  if (left.empty() || right.empty()) {
    return solver.solve(dcx_candidate_map(), left_count, right_count, 0);
  }

  size_t bit_length = 0;
  for (const dcx_fingerprint& fp : left) {
    if (!fp.empty()) {
      bit_length = fp.bit_length();
      break;
    }
  }

  const size_t total = left.size() * right.size();
  if (progress) {
    progress(0, total, "Computing similarity matrix...");
  }

  dcx_candidate_builder builder(phash_threshold, max_workers);
  dcx_candidate_map candidates = builder.build(left, right, progress);

  if (progress) {
    progress(total, total, "Running assignment...");
  }
  return solver.solve(candidates, left_count, right_count, bit_length);
}

std::vector<dcx_pair_diff> dcx_page_matcher::diff_matched_pairs(const dcx_matching_result& result,
                                                                const std::vector<dcx_page>& left,
                                                                const std::vector<dcx_page>& right,
                                                                const dcx_image_diff& diff,
                                                                const dcx_exclusion_zone_set& zones) const
{
  std::vector<dcx_matched_pair> pairs = result.matched_pairs();
  std::vector<dcx_pair_diff> diffs(pairs.size());

  // each task fills only its own slot
  dcx_parallel_for(pairs.size(), max_workers, [&](size_t i) {
    const dcx_matched_pair& pair = pairs[i];
    const cv::Mat& left_image = left.at(static_cast<size_t>(pair.left_index)).thumbnail();
    const cv::Mat& right_image = right.at(static_cast<size_t>(pair.right_index)).thumbnail();

    dcx_pair_diff& slot = diffs[i];
    slot.left_index = pair.left_index;
    slot.right_index = pair.right_index;
    slot.left_result = diff.compare(left_image, right_image, zones, dcx_exclusion_zone::left);
    slot.right_result = diff.compare(right_image, left_image, zones, dcx_exclusion_zone::right);
  });

  return diffs;
}

double dcx_page_matcher::ssim(const cv::Mat& a, const cv::Mat& b)
{
  if (a.empty() || b.empty()) {
    throw dcx_invalid_image_error("ssim", "empty image");
  }

  cv::Mat gray_a = to_gray(a);
  cv::Mat gray_b = to_gray(b);
  cv::Size target(std::min(gray_a.cols, gray_b.cols), std::min(gray_a.rows, gray_b.rows));
  if (gray_a.size() != target) {
    cv::resize(gray_a, gray_a, target, 0, 0, cv::INTER_AREA);
  }
  if (gray_b.size() != target) {
    cv::resize(gray_b, gray_b, target, 0, 0, cv::INTER_AREA);
  }

  // Wang et al. with an 11x11 Gaussian window, sigma 1.5
  const double c1 = (0.01 * 255) * (0.01 * 255);
  const double c2 = (0.03 * 255) * (0.03 * 255);
  const cv::Size window(11, 11);
  const double sigma = 1.5;

  cv::Mat x, y;
  gray_a.convertTo(x, CV_64F);
  gray_b.convertTo(y, CV_64F);

  cv::Mat mu_x, mu_y;
  cv::GaussianBlur(x, mu_x, window, sigma);
  cv::GaussianBlur(y, mu_y, window, sigma);

  cv::Mat mu_x2 = mu_x.mul(mu_x);
  cv::Mat mu_y2 = mu_y.mul(mu_y);
  cv::Mat mu_xy = mu_x.mul(mu_y);

  cv::Mat sigma_x2, sigma_y2, sigma_xy;
  cv::GaussianBlur(x.mul(x), sigma_x2, window, sigma);
  sigma_x2 -= mu_x2;
  cv::GaussianBlur(y.mul(y), sigma_y2, window, sigma);
  sigma_y2 -= mu_y2;
  cv::GaussianBlur(x.mul(y), sigma_xy, window, sigma);
  sigma_xy -= mu_xy;

  cv::Mat numerator = (2 * mu_xy + c1).mul(2 * sigma_xy + c2);
  cv::Mat denominator = (mu_x2 + mu_y2 + c1).mul(sigma_x2 + sigma_y2 + c2);
  cv::Mat ssim_map;
  cv::divide(numerator, denominator, ssim_map);

  double score = cv::mean(ssim_map)[0];
  return std::max(0.0, std::min(1.0, score));
}

size_t dcx_page_matcher::refine_with_ssim(dcx_matching_result& result,
                                          const std::vector<dcx_page>& left,
                                          const std::vector<dcx_page>& right,
                                          const dcx_progress_callback& progress) const
{
  std::vector<dcx_matched_pair> pairs = result.matched_pairs();
  std::vector<double> scores(pairs.size(), -1.0);
  std::atomic<size_t> done(0);
  std::mutex progress_mutex;

  dcx_parallel_for(pairs.size(), max_workers, [&](size_t i) {
    const dcx_page& left_page = left.at(static_cast<size_t>(pairs[i].left_index));
    const dcx_page& right_page = right.at(static_cast<size_t>(pairs[i].right_index));
    if (left_page.has_thumbnail() && right_page.has_thumbnail()) {
      scores[i] = ssim(left_page.thumbnail(), right_page.thumbnail());
    }

    size_t finished = ++done;
    if (progress) {
      std::lock_guard<std::mutex> lock(progress_mutex);
      progress(finished, pairs.size(), "Computing SSIM...");
    }
  });

  size_t refined = 0;
  for (size_t i = 0; i < pairs.size(); ++i) {
    if (scores[i] < 0.0) {
      std::cerr << "[match] No thumbnail for pair L" << pairs[i].left_index
                << " R" << pairs[i].right_index << ", keeping pHash similarity" << std::endl;
      continue;
    }
    if (result.update_similarity(pairs[i].left_index, pairs[i].right_index, scores[i])) {
      ++refined;
    }
  }
  return refined;
}
