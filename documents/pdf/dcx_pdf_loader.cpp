#include "dcx_pdf_loader.h"
#include "../dcx_page.h"
#include <main/PdfMemDocument.h>
#include <opencv2/imgcodecs.hpp>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <map>

using namespace PoDoFo;

dcx_pdf_loader::dcx_pdf_loader(int thumbnail_width, int thumbnail_height, int dpi)
  : thumbnail_width(thumbnail_width), thumbnail_height(thumbnail_height), dpi(dpi)
{
}

int dcx_pdf_loader::page_count(const dcx_string& path)
{
  try {
    PdfMemDocument doc;
    doc.Load(path.to_std_const());
    return static_cast<int>(doc.GetPages().GetCount());
  } catch (const std::exception& e) {
    std::cerr << "[pdf] Cannot open " << path.c_str() << ": " << e.what() << std::endl;
    return -1;
  }
}

int dcx_pdf_loader::page_number_from_filename(const dcx_string& filename)
{
  dcx_string stem = filename;
  size_t dot = stem.rfind(".");
  if (dot != std::string::npos) {
    stem = stem.substr(0, dot);
  }
  size_t dash = stem.rfind("-");
  if (dash == std::string::npos) {
    return -1;
  }
  dcx_string number = stem.substr(dash + 1);
  if (number.empty() || !number.is_integer()) {
    return -1;
  }
  return static_cast<int>(number.to_int());
}

dcx_string dcx_pdf_loader::render_command(const dcx_string& input_pdf, const dcx_string& output_prefix, int dpi)
{
  return "pdftoppm -png -r " + std::to_string(dpi) + " '" + input_pdf.to_std_const() + "' '" + output_prefix.to_std_const() + "'";
}

bool dcx_pdf_loader::load(const dcx_string& path, std::vector<cv::Mat>& thumbnails) const
{
  thumbnails.clear();

  int count = page_count(path);
  if (count < 0) {
    return false;
  }
  if (count == 0) {
    std::cout << "[pdf] " << path.c_str() << " has no pages" << std::endl;
    return true;
  }

  long long timestamp = std::chrono::steady_clock::now().time_since_epoch().count();
  std::filesystem::path temp_dir = std::filesystem::temp_directory_path() / ("dcx_pdf_render_" + std::to_string(timestamp));

  try {
    std::filesystem::create_directories(temp_dir);

    // pdftoppm only ever sees paths we created ourselves
    std::filesystem::path temp_pdf = temp_dir / "input.pdf";
    std::error_code copy_error;
    std::filesystem::copy_file(path.to_std_const(), temp_pdf, copy_error);
    if (copy_error) {
      std::cerr << "[pdf] Cannot stage " << path.c_str() << ": " << copy_error.message() << std::endl;
      std::filesystem::remove_all(temp_dir);
      return false;
    }

    std::string cmd = render_command(temp_pdf.string(), (temp_dir / "page").string(), dpi).to_std_const();
    int result = std::system(cmd.c_str());
    if (result != 0) {
      std::cerr << "[pdf] pdftoppm failed with code " << result << " for " << path.c_str() << std::endl;
      std::filesystem::remove_all(temp_dir);
      return false;
    }

    std::map<int, std::filesystem::path> rendered;
    for (const auto& entry : std::filesystem::directory_iterator(temp_dir)) {
      if (entry.path().extension() != ".png") {
        continue;
      }
      int number = page_number_from_filename(entry.path().filename().string());
      if (number >= 1) {
        rendered[number] = entry.path();
      }
    }

    for (int page = 1; page <= count; ++page) {
      cv::Mat image;
      std::map<int, std::filesystem::path>::const_iterator it = rendered.find(page);
      if (it != rendered.end()) {
        image = cv::imread(it->second.string(), cv::IMREAD_COLOR);
      }
      if (image.empty()) {
        std::cerr << "[pdf] Page " << page << " of " << path.c_str() << " could not be rendered, using placeholder" << std::endl;
        thumbnails.push_back(dcx_placeholder_thumbnail(thumbnail_width, thumbnail_height));
      } else {
        thumbnails.push_back(dcx_make_thumbnail(image, thumbnail_width, thumbnail_height));
      }
    }

    std::filesystem::remove_all(temp_dir);
    std::cout << "[pdf] Loaded " << thumbnails.size() << " pages from " << path.c_str() << std::endl;
    return true;

  } catch (const std::exception& e) {
    std::cerr << "[pdf] Error rendering " << path.c_str() << ": " << e.what() << std::endl;
    std::error_code ec;
    std::filesystem::remove_all(temp_dir, ec);
    thumbnails.clear();
    return false;
  }
}
