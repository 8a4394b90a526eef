#include "dcx_fingerprint.h"
#include "../dcx_compare_exceptions.h"
#include <opencv2/opencv.hpp>
#include <algorithm>
#include <bitset>

dcx_fingerprint::dcx_fingerprint(size_t bit_count)
  : words((bit_count + 63) / 64, 0), bits(bit_count)
{
}

bool dcx_fingerprint::bit(size_t index) const
{
  if (index >= bits) {
    throw std::out_of_range("Fingerprint bit index out of range");
  }
  return (words[index / 64] >> (index % 64)) & 1u;
}

void dcx_fingerprint::set_bit(size_t index, bool on)
{
  if (index >= bits) {
    throw std::out_of_range("Fingerprint bit index out of range");
  }
  uint64_t mask = uint64_t(1) << (index % 64);
  if (on) {
    words[index / 64] |= mask;
  } else {
    words[index / 64] &= ~mask;
  }
}

int dcx_fingerprint::hamming_distance(const dcx_fingerprint& other) const
{
  if (bits != other.bits) {
    throw std::invalid_argument("Cannot compare fingerprints of different bit length");
  }
  size_t distance = 0;
  for (size_t i = 0; i < words.size(); ++i) {
    distance += std::bitset<64>(words[i] ^ other.words[i]).count();
  }
  return static_cast<int>(distance);
}

dcx_phash_provider::dcx_phash_provider(int hash_size, int highfreq_factor)
  : hash_size(hash_size), highfreq_factor(highfreq_factor)
{
  if (hash_size < 2 || highfreq_factor < 1) {
    throw std::invalid_argument("pHash needs hash_size >= 2 and highfreq_factor >= 1");
  }
  if ((hash_size * highfreq_factor) % 2 != 0) {
    // cv::dct only handles even sizes
    throw std::invalid_argument("pHash sample size must be even");
  }
}

dcx_fingerprint dcx_phash_provider::hash(const cv::Mat& image) const
{
  if (image.empty() || image.cols == 0 || image.rows == 0) {
    throw dcx_invalid_image_error("page", "image is empty");
  }
  if (image.depth() != CV_8U) {
    throw dcx_invalid_image_error("page", "expected 8-bit pixels");
  }

  cv::Mat gray;
  switch (image.channels()) {
    case 1:
      gray = image;
      break;
    case 3:
      cv::cvtColor(image, gray, cv::COLOR_BGR2GRAY);
      break;
    case 4:
      cv::cvtColor(image, gray, cv::COLOR_BGRA2GRAY);
      break;
    default:
      throw dcx_invalid_image_error("page", "expected 1, 3 or 4 channels");
  }

  int sample_size = hash_size * highfreq_factor;
  cv::Mat small;
  cv::resize(gray, small, cv::Size(sample_size, sample_size), 0, 0, cv::INTER_AREA);

  cv::Mat samples;
  small.convertTo(samples, CV_32F);
  cv::Mat coefficients;
  cv::dct(samples, coefficients);

  cv::Mat low_freq = coefficients(cv::Rect(0, 0, hash_size, hash_size));
  std::vector<float> values;
  values.reserve(static_cast<size_t>(hash_size * hash_size));
  for (int y = 0; y < hash_size; ++y) {
    for (int x = 0; x < hash_size; ++x) {
      values.push_back(low_freq.at<float>(y, x));
    }
  }

  std::vector<float> sorted = values;
  std::sort(sorted.begin(), sorted.end());
  size_t mid = sorted.size() / 2;
  double median = sorted.size() % 2 == 0
    ? (static_cast<double>(sorted[mid - 1]) + sorted[mid]) / 2.0
    : sorted[mid];

  dcx_fingerprint fingerprint(values.size());
  for (size_t i = 0; i < values.size(); ++i) {
    fingerprint.set_bit(i, values[i] > median);
  }
  return fingerprint;
}
