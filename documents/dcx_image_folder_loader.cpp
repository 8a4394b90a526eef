#include "dcx_image_folder_loader.h"
#include "dcx_page.h"
#include <opencv2/imgcodecs.hpp>
#include <algorithm>
#include <filesystem>
#include <iostream>

dcx_image_folder_loader::dcx_image_folder_loader(int thumbnail_width, int thumbnail_height)
  : thumbnail_width(thumbnail_width), thumbnail_height(thumbnail_height)
{
}

bool dcx_image_folder_loader::is_image_file(const dcx_string& filename)
{
  dcx_string lower = filename.lower();
  const char* extensions[] = {".png", ".jpg", ".jpeg", ".bmp", ".tif", ".tiff"};
  for (const char* ext : extensions) {
    if (lower.ends_with(ext)) {
      return true;
    }
  }
  return false;
}

std::vector<dcx_string> dcx_image_folder_loader::list_images(const dcx_string& dir)
{
  std::vector<std::string> names;
  std::error_code ec;
  for (const auto& entry : std::filesystem::directory_iterator(dir.to_std_const(), ec)) {
    if (entry.is_regular_file() && is_image_file(entry.path().filename().string())) {
      names.push_back(entry.path().string());
    }
  }
  if (ec) {
    std::cerr << "[images] Cannot list " << dir.c_str() << ": " << ec.message() << std::endl;
  }

  std::sort(names.begin(), names.end());
  std::vector<dcx_string> paths;
  for (const std::string& name : names) {
    paths.push_back(name);
  }
  return paths;
}

bool dcx_image_folder_loader::load(const dcx_string& dir, std::vector<cv::Mat>& thumbnails) const
{
  thumbnails.clear();
  if (!std::filesystem::is_directory(dir.to_std_const())) {
    std::cerr << "[images] Not a directory: " << dir.c_str() << std::endl;
    return false;
  }

  std::vector<dcx_string> files = list_images(dir);
  for (const dcx_string& file : files) {
    cv::Mat image = cv::imread(file.to_std_const(), cv::IMREAD_COLOR);
    if (image.empty()) {
      std::cerr << "[images] Cannot read " << file.c_str() << ", using placeholder" << std::endl;
      thumbnails.push_back(dcx_placeholder_thumbnail(thumbnail_width, thumbnail_height));
    } else {
      thumbnails.push_back(dcx_make_thumbnail(image, thumbnail_width, thumbnail_height));
    }
  }

  std::cout << "[images] Loaded " << thumbnails.size() << " pages from " << dir.c_str() << std::endl;
  return true;
}
