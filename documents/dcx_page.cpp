#include "dcx_page.h"
#include "../utils/dcx_worker_pool.h"
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <iostream>

dcx_page::dcx_page(int index, const cv::Mat& thumbnail)
  : page_index(index), thumbnail_image(thumbnail), attempted(false)
{
}

bool dcx_page::compute_fingerprint(const dcx_fingerprint_provider& provider)
{
  if (attempted) {
    return has_fingerprint();
  }

  try {
    page_fingerprint = provider.hash(thumbnail_image);
  } catch (const std::exception& e) {
    std::cerr << "[fingerprint] Page " << page_index << ": " << e.what() << std::endl;
    page_fingerprint = dcx_fingerprint();
  }
  attempted = true;
  return has_fingerprint();
}

void dcx_page::set_fingerprint(const dcx_fingerprint& fingerprint)
{
  page_fingerprint = fingerprint;
  attempted = true;
}

void dcx_page::invalidate_fingerprint()
{
  page_fingerprint = dcx_fingerprint();
  attempted = false;
}

size_t dcx_ensure_fingerprints(std::vector<dcx_page>& pages,
                               const dcx_fingerprint_provider& provider,
                               int max_workers)
{
  std::vector<size_t> pending;
  for (size_t i = 0; i < pages.size(); ++i) {
    if (!pages[i].fingerprint_attempted()) {
      pending.push_back(i);
    }
  }

  // each task writes only its own page
  dcx_parallel_for(pending.size(), max_workers, [&](size_t task) {
    pages[pending[task]].compute_fingerprint(provider);
  });

  size_t missing = 0;
  for (const dcx_page& page : pages) {
    if (!page.has_fingerprint()) {
      ++missing;
    }
  }
  if (missing > 0) {
    std::cerr << "[fingerprint] " << missing << " of " << pages.size()
              << " pages have no fingerprint and will stay unmatched" << std::endl;
  }
  return missing;
}

cv::Mat dcx_make_thumbnail(const cv::Mat& image, int max_width, int max_height)
{
  if (image.empty()) {
    return cv::Mat();
  }
  double scale = std::min(static_cast<double>(max_width) / image.cols,
                          static_cast<double>(max_height) / image.rows);
  if (scale >= 1.0) {
    return image.clone();
  }

  cv::Size size(std::max(1, static_cast<int>(image.cols * scale)),
                std::max(1, static_cast<int>(image.rows * scale)));
  cv::Mat thumbnail;
  cv::resize(image, thumbnail, size, 0, 0, cv::INTER_AREA);
  return thumbnail;
}

cv::Mat dcx_placeholder_thumbnail(int width, int height)
{
  return cv::Mat(height, width, CV_8UC3, cv::Scalar(200, 200, 200));
}
