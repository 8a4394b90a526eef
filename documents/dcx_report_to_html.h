#ifndef DCX_REPORT_TO_HTML_H
#define DCX_REPORT_TO_HTML_H

#include "../utils/dcx_model.h"
#include "../comparison/match/dcx_page_matcher.h"
#include "dcx_document.h"
#include <vector>

class dcx_report_config : public dcx_model
{
public:
  dcxp_bool(include_identical);
  dcxp_bool(include_thumbnails);
  dcxp_int(thumbnail_width);
  dcxp_string(title);
  dcxp_bool(show_exclusion_zones);

  static dcx_report_config defaults() {
    dcx_report_config config;
    config.include_identical = false;
    config.include_thumbnails = true;
    config.thumbnail_width = 400;
    config.title = "Document Comparison Report";
    config.show_exclusion_zones = true;
    return config;
  }
};

/**
 * Self-contained HTML comparison report. Thumbnails are embedded as base64
 * PNG data URIs; differing pairs show their highlight images.
 */
class dcx_report_to_html
{
public:
  explicit dcx_report_to_html(const dcx_report_config& config = dcx_report_config::defaults());

  // diffs may be empty; pairs without a diff fall back to the match similarity
  dcx_string convert(const dcx_document& left, const dcx_document& right,
                     const dcx_matching_result& matching,
                     const std::vector<dcx_pair_diff>& diffs,
                     const dcx_exclusion_zone_set& zones) const;

  bool write(const dcx_string& path,
             const dcx_document& left, const dcx_document& right,
             const dcx_matching_result& matching,
             const std::vector<dcx_pair_diff>& diffs,
             const dcx_exclusion_zone_set& zones) const;

  static dcx_string base64_encode(const std::vector<unsigned char>& data);
  static dcx_string escape_html(const dcx_string& text);

private:
  dcx_report_config config;

  dcx_string generate_css_style() const;
  dcx_string generate_zone_list(const dcx_exclusion_zone_set& zones) const;
  dcx_string render_pair(const dcx_match_result& match,
                         const dcx_document& left, const dcx_document& right,
                         const dcx_pair_diff* diff, bool has_diff) const;
  dcx_string render_unmatched(int page_index, const dcx_document& doc, const dcx_string& side) const;
  dcx_string image_block(const cv::Mat& image, const dcx_string& caption) const;
};

#endif // DCX_REPORT_TO_HTML_H
