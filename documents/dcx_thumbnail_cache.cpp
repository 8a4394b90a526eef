#include "dcx_thumbnail_cache.h"
#include "../api/json/dcx_json.h"
#include "../utils/dcx_datetime.h"
#include <opencv2/imgcodecs.hpp>
#include <filesystem>
#include <functional>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace {

  std::string page_file_name(size_t index) {
    std::ostringstream oss;
    oss << "page_" << std::setw(4) << std::setfill('0') << index << ".png";
    return oss.str();
  }

}

dcx_thumbnail_cache::dcx_thumbnail_cache()
  : root_dir(""), opened(false)
{
}

dcx_thumbnail_cache::~dcx_thumbnail_cache()
{
  close();
}

bool dcx_thumbnail_cache::open(const dcx_string& dir)
{
  std::error_code ec;
  std::filesystem::create_directories(dir.to_std_const(), ec);
  if (ec || !std::filesystem::is_directory(dir.to_std_const())) {
    std::cerr << "[cache] Cannot use cache directory " << dir.c_str() << ": " << ec.message() << std::endl;
    opened = false;
    return false;
  }
  root_dir = dir;
  opened = true;
  return true;
}

void dcx_thumbnail_cache::close()
{
  opened = false;
  root_dir = "";
}

dcx_string dcx_thumbnail_cache::entry_dir(const dcx_string& key) const
{
  return (std::filesystem::path(root_dir.to_std_const()) / key.to_std_const()).string();
}

dcx_string dcx_thumbnail_cache::render_profile(int thumbnail_width, int thumbnail_height, int dpi)
{
  return std::to_string(thumbnail_width) + "x" + std::to_string(thumbnail_height) + "@" + std::to_string(dpi);
}

dcx_string dcx_thumbnail_cache::key_for(const dcx_string& source_path, const dcx_string& profile)
{
  std::error_code ec;
  std::filesystem::path source = std::filesystem::absolute(source_path.to_std_const(), ec);
  if (ec || !std::filesystem::exists(source, ec)) {
    return "";
  }

  auto mtime = std::filesystem::last_write_time(source, ec);
  if (ec) {
    return "";
  }
  uintmax_t size = 0;
  if (std::filesystem::is_regular_file(source, ec)) {
    size = std::filesystem::file_size(source, ec);
    if (ec) {
      return "";
    }
  }

  std::ostringstream material;
  material << source.string() << "|" << mtime.time_since_epoch().count() << "|" << size << "|" << profile.to_std_const();

  std::ostringstream key;
  key << std::hex << std::setw(16) << std::setfill('0') << std::hash<std::string>()(material.str());
  return key.str();
}

bool dcx_thumbnail_cache::lookup(const dcx_string& source_path, const dcx_string& profile,
                                 std::vector<cv::Mat>& pages) const
{
  pages.clear();
  if (!opened) {
    return false;
  }
  dcx_string key = key_for(source_path, profile);
  if (key.empty()) {
    return false;
  }

  std::filesystem::path dir(entry_dir(key).to_std_const());
  std::filesystem::path meta_path = dir / "meta.json";
  if (!std::filesystem::exists(meta_path)) {
    return false;
  }

  dcxv_map meta;
  dcx_json json(&meta);
  if (!json.read_file(meta_path.string())) {
    return false;
  }
  dcxv_map::const_iterator it = meta.find("page_count");
  if (it == meta.end() || !it->second.is_int() || it->second.int_value() < 0) {
    std::cerr << "[cache] Ignoring entry " << key.c_str() << " with bad meta.json" << std::endl;
    return false;
  }

  size_t count = static_cast<size_t>(it->second.int_value());
  std::vector<cv::Mat> loaded;
  for (size_t i = 0; i < count; ++i) {
    cv::Mat page = cv::imread((dir / page_file_name(i)).string(), cv::IMREAD_COLOR);
    if (page.empty()) {
      std::cerr << "[cache] Entry " << key.c_str() << " is incomplete" << std::endl;
      return false;
    }
    loaded.push_back(page);
  }

  pages.swap(loaded);
  std::cout << "[cache] Hit for " << source_path.c_str() << " at " << profile.c_str()
            << " (" << count << " pages)" << std::endl;
  return true;
}

bool dcx_thumbnail_cache::store(const dcx_string& source_path, const dcx_string& profile,
                                const std::vector<cv::Mat>& pages)
{
  if (!opened) {
    return false;
  }
  dcx_string key = key_for(source_path, profile);
  if (key.empty()) {
    std::cerr << "[cache] Cannot key " << source_path.c_str() << std::endl;
    return false;
  }

  std::filesystem::path dir(entry_dir(key).to_std_const());
  std::error_code ec;
  std::filesystem::remove_all(dir, ec);
  std::filesystem::create_directories(dir, ec);
  if (ec) {
    std::cerr << "[cache] Cannot create " << dir.string() << ": " << ec.message() << std::endl;
    return false;
  }

  try {
    for (size_t i = 0; i < pages.size(); ++i) {
      if (!cv::imwrite((dir / page_file_name(i)).string(), pages[i])) {
        std::cerr << "[cache] Cannot write page " << i << " of " << source_path.c_str() << std::endl;
        std::filesystem::remove_all(dir, ec);
        return false;
      }
    }
  } catch (const cv::Exception& e) {
    std::cerr << "[cache] " << e.what() << std::endl;
    std::filesystem::remove_all(dir, ec);
    return false;
  }

  std::error_code abs_ec;
  dcxv_map meta;
  meta["source_path"] = dcx_string(std::filesystem::absolute(source_path.to_std_const(), abs_ec).string());
  meta["render_profile"] = profile;
  meta["page_count"] = static_cast<long long>(pages.size());
  meta["cached_at"] = dcx_iso_now();

  dcx_json json(&meta);
  if (!json.write_file((dir / "meta.json").string())) {
    std::filesystem::remove_all(dir, ec);
    return false;
  }
  return true;
}

bool dcx_thumbnail_cache::clear()
{
  if (!opened) {
    return false;
  }
  std::error_code ec;
  for (const auto& entry : std::filesystem::directory_iterator(root_dir.to_std_const(), ec)) {
    std::error_code remove_ec;
    std::filesystem::remove_all(entry.path(), remove_ec);
    if (remove_ec) {
      std::cerr << "[cache] Cannot remove " << entry.path().string() << ": " << remove_ec.message() << std::endl;
      return false;
    }
  }
  if (ec) {
    std::cerr << "[cache] Cannot list " << root_dir.c_str() << ": " << ec.message() << std::endl;
    return false;
  }
  return true;
}
