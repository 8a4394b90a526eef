#ifndef DCX_IMAGE_FOLDER_LOADER_H
#define DCX_IMAGE_FOLDER_LOADER_H

#include "../utils/dcx_string.h"
#include <vector>
#include <opencv2/core.hpp>

// Slide decks exported as one image per page, in lexical file name order
class dcx_image_folder_loader
{
private:
  int thumbnail_width;
  int thumbnail_height;

public:
  dcx_image_folder_loader(int thumbnail_width = 1200, int thumbnail_height = 900);

  // .png .jpg .jpeg .bmp .tif .tiff, any case
  static bool is_image_file(const dcx_string& filename);

  // Sorted full paths of the image files directly inside dir
  static std::vector<dcx_string> list_images(const dcx_string& dir);

  bool load(const dcx_string& dir, std::vector<cv::Mat>& thumbnails) const;
};

#endif // DCX_IMAGE_FOLDER_LOADER_H
