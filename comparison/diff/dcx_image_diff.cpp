#include "dcx_image_diff.h"
#include "../dcx_compare_exceptions.h"
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <cmath>

dcx_image_diff::dcx_image_diff(int pixel_threshold, int min_region_area,
                               const cv::Scalar& highlight_rgb, double highlight_alpha,
                               int border_thickness)
  : pixel_threshold(pixel_threshold),
    min_region_area(min_region_area),
    highlight_bgr(highlight_rgb[2], highlight_rgb[1], highlight_rgb[0]),
    highlight_alpha(highlight_alpha),
    border_thickness(border_thickness)
{
  if (pixel_threshold < 0 || pixel_threshold > 255) {
    throw std::invalid_argument("pixel_threshold must be between 0 and 255");
  }
  if (min_region_area < 0) {
    throw std::invalid_argument("min_region_area must not be negative");
  }
  if (highlight_alpha < 0.0 || highlight_alpha > 1.0) {
    throw std::invalid_argument("highlight_alpha must be between 0 and 1");
  }
}

dcx_image_diff dcx_image_diff::from_config(const dcx_compare_config& config)
{
  return dcx_image_diff(static_cast<int>(*config.pixel_threshold),
                        static_cast<int>(*config.min_region_area),
                        cv::Scalar(static_cast<double>(*config.highlight_r),
                                   static_cast<double>(*config.highlight_g),
                                   static_cast<double>(*config.highlight_b)),
                        *config.highlight_alpha);
}

cv::Mat dcx_image_diff::to_bgr(const cv::Mat& image, const dcx_string& argument)
{
  if (image.empty() || image.cols == 0 || image.rows == 0) {
    throw dcx_invalid_image_error(argument, "image is empty");
  }
  if (image.depth() != CV_8U) {
    throw dcx_invalid_image_error(argument, "only 8-bit images are supported");
  }

  cv::Mat bgr;
  switch (image.channels()) {
    case 1:
      cv::cvtColor(image, bgr, cv::COLOR_GRAY2BGR);
      break;
    case 3:
      bgr = image.clone();
      break;
    case 4:
      cv::cvtColor(image, bgr, cv::COLOR_BGRA2BGR);
      break;
    default:
      throw dcx_invalid_image_error(argument, "unsupported channel count " + dcx_string(image.channels()));
  }
  return bgr;
}

dcx_diff_result dcx_image_diff::compare(const cv::Mat& first, const cv::Mat& second,
                                        const std::vector<dcx_exclusion_zone>& zones) const
{
  cv::Mat a = to_bgr(first, "first");
  cv::Mat b = to_bgr(second, "second");

  // common size, never downscale either side
  cv::Size size(std::max(a.cols, b.cols), std::max(a.rows, b.rows));
  if (a.size() != size) {
    cv::resize(a, a, size, 0, 0, cv::INTER_LANCZOS4);
  }
  if (b.size() != size) {
    cv::resize(b, b, size, 0, 0, cv::INTER_LANCZOS4);
  }

  cv::Mat gray_a, gray_b;
  cv::cvtColor(a, gray_a, cv::COLOR_BGR2GRAY);
  cv::cvtColor(b, gray_b, cv::COLOR_BGR2GRAY);

  dcx_diff_result result;
  cv::absdiff(gray_a, gray_b, result.diff_image);

  const cv::Rect page(0, 0, size.width, size.height);
  for (const dcx_exclusion_zone& zone : zones) {
    if (!*zone.enabled) {
      continue;
    }
    zone.validate();
    cv::Rect masked = zone.to_pixel_rect(size.width, size.height) & page;
    if (masked.area() > 0) {
      result.diff_image(masked).setTo(cv::Scalar(0));
    }
  }

  cv::Mat mask;
  cv::threshold(result.diff_image, mask, pixel_threshold, 255, cv::THRESH_BINARY);

  std::vector<std::vector<cv::Point>> contours;
  cv::findContours(mask.clone(), contours, cv::RETR_EXTERNAL, cv::CHAIN_APPROX_SIMPLE);

  for (const std::vector<cv::Point>& contour : contours) {
    double area = cv::contourArea(contour);
    if (area < min_region_area) {
      continue;
    }
    cv::Rect box = cv::boundingRect(contour) & page;
    if (box.area() == 0) {
      continue;
    }
    dcx_diff_region region;
    region.x = box.x;
    region.y = box.y;
    region.width = box.width;
    region.height = box.height;
    region.area = area;
    region.intensity = cv::mean(result.diff_image(box))[0] / 255.0;
    result.regions.push_back(region);
  }

  double total = static_cast<double>(size.width) * size.height;
  result.diff_score = cv::countNonZero(mask) / total;

  result.highlight_image = a.clone();
  for (const dcx_diff_region& region : result.regions) {
    cv::Mat roi = result.highlight_image(region.rect());
    cv::Mat overlay(roi.size(), roi.type(), highlight_bgr);
    cv::addWeighted(overlay, highlight_alpha, roi, 1.0 - highlight_alpha, 0.0, roi);
    cv::rectangle(result.highlight_image,
                  cv::Point(region.x, region.y),
                  cv::Point(region.x + region.width, region.y + region.height),
                  highlight_bgr, border_thickness);
  }

  return result;
}

dcx_diff_result dcx_image_diff::compare(const cv::Mat& first, const cv::Mat& second,
                                        const dcx_exclusion_zone_set& zones,
                                        dcx_exclusion_zone::side s) const
{
  return compare(first, second, zones.zones_for(s));
}

namespace {

  cv::Mat scale_to_height(const cv::Mat& image, int height) {
    if (image.rows == height) {
      return image;
    }
    int width = std::max(1, static_cast<int>(std::lround(
                  static_cast<double>(image.cols) * height / image.rows)));
    cv::Mat scaled;
    cv::resize(image, scaled, cv::Size(width, height), 0, 0, cv::INTER_LANCZOS4);
    return scaled;
  }

}

cv::Mat dcx_image_diff::create_side_by_side(const cv::Mat& left, const cv::Mat& right,
                                            const dcx_diff_result* diff, int gap)
{
  cv::Mat l = to_bgr(left, "left");
  cv::Mat r;
  if (diff != nullptr && !diff->highlight_image.empty()) {
    r = to_bgr(diff->highlight_image, "highlight");
  } else {
    r = to_bgr(right, "right");
  }
  gap = std::max(0, gap);

  int height = std::max(l.rows, r.rows);
  l = scale_to_height(l, height);
  r = scale_to_height(r, height);

  cv::Mat canvas(height, l.cols + gap + r.cols, CV_8UC3, cv::Scalar(255, 255, 255));
  l.copyTo(canvas(cv::Rect(0, 0, l.cols, l.rows)));
  r.copyTo(canvas(cv::Rect(l.cols + gap, 0, r.cols, r.rows)));
  return canvas;
}
