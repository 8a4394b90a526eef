#ifndef dcx_PDF_LOADER_H
#define dcx_PDF_LOADER_H

#include "../../utils/dcx_string.h"
#include <vector>
#include <opencv2/core.hpp>

/**
 * Rasterizes a PDF into page thumbnails.
 * PoDoFo opens the file and counts pages; pdftoppm does the rendering.
 * Pages pdftoppm could not produce become grey placeholders so indices
 * stay aligned with the PDF.
 */
class dcx_pdf_loader
{
private:
  int thumbnail_width;
  int thumbnail_height;
  int dpi;

public:
  dcx_pdf_loader(int thumbnail_width = 1200, int thumbnail_height = 900, int dpi = 216);

  // -1 if PoDoFo cannot open the file
  static int page_count(const dcx_string& path);

  bool load(const dcx_string& path, std::vector<cv::Mat>& thumbnails) const;

  // Shell command for pdftoppm; both paths must be ones the loader created
  static dcx_string render_command(const dcx_string& input_pdf, const dcx_string& output_prefix, int dpi);

  // Page number encoded in a pdftoppm output name ("page-07.png" -> 7), -1 if none
  static int page_number_from_filename(const dcx_string& filename);
};

#endif // dcx_PDF_LOADER_H
