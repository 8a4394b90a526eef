#ifndef DCX_THUMBNAIL_CACHE_H
#define DCX_THUMBNAIL_CACHE_H

#include "../utils/dcx_string.h"
#include <vector>
#include <opencv2/core.hpp>

/**
 * On-disk cache of rendered page thumbnails.
 *
 * One subdirectory per source file and render profile, named after a hash
 * of the absolute path, modification time, size and profile. An edited file
 * or a change of thumbnail size or dpi misses the cache.
 * Each entry holds page_0000.png, page_0001.png, ... and a meta.json
 * with source_path, render_profile, page_count and cached_at.
 *
 * The handle is explicit: a closed cache misses every lookup and ignores
 * stores. Pass it to dcx_document::from_file() to use it.
 */
class dcx_thumbnail_cache
{
private:
  dcx_string root_dir;
  bool opened;

  dcx_string entry_dir(const dcx_string& key) const;

public:
  dcx_thumbnail_cache();
  ~dcx_thumbnail_cache();

  dcx_thumbnail_cache(const dcx_thumbnail_cache&) = delete;
  dcx_thumbnail_cache& operator=(const dcx_thumbnail_cache&) = delete;

  // Creates the directory if needed
  bool open(const dcx_string& dir);
  void close();
  bool is_open() const { return opened; }
  const dcx_string& directory() const { return root_dir; }

  // "1200x900@216"; folders of images pass dpi 0
  static dcx_string render_profile(int thumbnail_width, int thumbnail_height, int dpi);

  // Empty if the source does not exist
  static dcx_string key_for(const dcx_string& source_path, const dcx_string& profile);

  // Fills pages and returns true on a complete hit
  bool lookup(const dcx_string& source_path, const dcx_string& profile, std::vector<cv::Mat>& pages) const;

  bool store(const dcx_string& source_path, const dcx_string& profile, const std::vector<cv::Mat>& pages);

  // Removes every entry, keeps the cache open
  bool clear();
};

#endif // DCX_THUMBNAIL_CACHE_H
