#include "dcx_report_to_html.h"
#include "../utils/dcx_datetime.h"
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace {

  const dcx_pair_diff* find_diff(const std::vector<dcx_pair_diff>& diffs, int left, int right) {
    for (const dcx_pair_diff& d : diffs) {
      if (d.left_index == left && d.right_index == right) {
        return &d;
      }
    }
    return nullptr;
  }

}

dcx_report_to_html::dcx_report_to_html(const dcx_report_config& config)
  : config(config)
{
}

dcx_string dcx_report_to_html::convert(const dcx_document& left, const dcx_document& right,
                                       const dcx_matching_result& matching,
                                       const std::vector<dcx_pair_diff>& diffs,
                                       const dcx_exclusion_zone_set& zones) const
{
  std::vector<const dcx_match_result*> with_diff;
  std::vector<const dcx_match_result*> identical;
  std::vector<const dcx_match_result*> left_only;
  std::vector<const dcx_match_result*> right_only;

  for (const dcx_match_result& match : matching.matches()) {
    switch (match.get_status()) {
      case dcx_match_result::matched: {
        const dcx_pair_diff* d = find_diff(diffs, match.left(), match.right());
        bool has_diff = d != nullptr ? d->left_result.has_differences() : match.has_difference();
        (has_diff ? with_diff : identical).push_back(&match);
        break;
      }
      case dcx_match_result::unmatched_left:
        left_only.push_back(&match);
        break;
      case dcx_match_result::unmatched_right:
        right_only.push_back(&match);
        break;
    }
  }

  dcx_string title = escape_html(*config.title);
  std::ostringstream html;

  html << "<!DOCTYPE html>\n";
  html << "<html lang=\"en\">\n";
  html << "<head>\n";
  html << "    <meta charset=\"UTF-8\">\n";
  html << "    <title>" << title.c_str() << "</title>\n";
  html << generate_css_style().c_str();
  html << "</head>\n";
  html << "<body>\n";
  html << "<div class=\"container\">\n";
  html << "    <h1>" << title.c_str() << "</h1>\n";

  html << "    <div class=\"meta\">\n";
  html << "        <p>Generated: " << dcx_iso_now().replace("T", " ").c_str() << "</p>\n";
  html << "        <p>Left Document: <strong>" << escape_html(left.name()).c_str() << "</strong> ("
       << left.page_count() << " pages)</p>\n";
  html << "        <p>Right Document: <strong>" << escape_html(right.name()).c_str() << "</strong> ("
       << right.page_count() << " pages)</p>\n";
  html << "    </div>\n";

  html << "    <div class=\"summary\">\n";
  html << "        <div class=\"stat diff\">Pages with Differences: <strong>" << with_diff.size() << "</strong></div>\n";
  html << "        <div class=\"stat identical\">Identical Pages: <strong>" << identical.size() << "</strong></div>\n";
  html << "        <div class=\"stat unmatched\">Unmatched Left: <strong>" << left_only.size() << "</strong></div>\n";
  html << "        <div class=\"stat unmatched\">Unmatched Right: <strong>" << right_only.size() << "</strong></div>\n";
  html << "    </div>\n";

  if (*config.show_exclusion_zones && !zones.empty()) {
    html << generate_zone_list(zones).c_str();
  }

  if (!with_diff.empty()) {
    html << "    <h2 class=\"section-diff\">Pages with Differences</h2>\n";
    html << "    <div class=\"pages\">\n";
    for (const dcx_match_result* match : with_diff) {
      html << render_pair(*match, left, right, find_diff(diffs, match->left(), match->right()), true).c_str();
    }
    html << "    </div>\n";
  }

  if (*config.include_identical && !identical.empty()) {
    html << "    <h2 class=\"section-identical\">Identical Pages</h2>\n";
    html << "    <div class=\"pages\">\n";
    for (const dcx_match_result* match : identical) {
      html << render_pair(*match, left, right, nullptr, false).c_str();
    }
    html << "    </div>\n";
  }

  if (!left_only.empty()) {
    html << "    <h2 class=\"section-unmatched\">Unmatched Pages (Left Only)</h2>\n";
    html << "    <div class=\"pages\">\n";
    for (const dcx_match_result* match : left_only) {
      html << render_unmatched(match->left(), left, "left").c_str();
    }
    html << "    </div>\n";
  }

  if (!right_only.empty()) {
    html << "    <h2 class=\"section-unmatched\">Unmatched Pages (Right Only)</h2>\n";
    html << "    <div class=\"pages\">\n";
    for (const dcx_match_result* match : right_only) {
      html << render_unmatched(match->right(), right, "right").c_str();
    }
    html << "    </div>\n";
  }

  html << "</div>\n";
  html << "</body>\n";
  html << "</html>\n";

  return dcx_string(html.str());
}

bool dcx_report_to_html::write(const dcx_string& path,
                               const dcx_document& left, const dcx_document& right,
                               const dcx_matching_result& matching,
                               const std::vector<dcx_pair_diff>& diffs,
                               const dcx_exclusion_zone_set& zones) const
{
  dcx_string html;
  try {
    html = convert(left, right, matching, diffs, zones);
  } catch (const std::exception& e) {
    std::cerr << "[report] Cannot build report: " << e.what() << std::endl;
    return false;
  }

  std::filesystem::path file(path.to_std_const());
  std::error_code ec;
  if (file.has_parent_path()) {
    std::filesystem::create_directories(file.parent_path(), ec);
  }
  std::ofstream out(file, std::ios::binary);
  if (!out.is_open()) {
    std::cerr << "[report] Cannot write " << path.c_str() << std::endl;
    return false;
  }
  out << html.c_str();
  out.close();
  if (!out) {
    std::cerr << "[report] Write to " << path.c_str() << " failed" << std::endl;
    return false;
  }
  std::cout << "[report] Saved " << path.c_str() << std::endl;
  return true;
}

// ============================================================================
// HTML Generation
// ============================================================================

dcx_string dcx_report_to_html::generate_css_style() const
{
  std::ostringstream css;

  css << "    <style>\n";
  css << "        * { box-sizing: border-box; margin: 0; padding: 0; }\n";
  css << "        body { font-family: Arial, sans-serif; background: #f5f5f5; color: #333; line-height: 1.6; }\n";
  css << "        .container { max-width: 1400px; margin: 0 auto; padding: 20px; }\n";
  css << "        h1 { color: #2c3e50; margin-bottom: 20px; border-bottom: 3px solid #3498db; padding-bottom: 10px; }\n";
  css << "        h2 { margin: 30px 0 15px; padding: 10px; border-radius: 5px; }\n";
  css << "        .section-diff { background: #fee; color: #c0392b; }\n";
  css << "        .section-identical { background: #efe; color: #27ae60; }\n";
  css << "        .section-unmatched { background: #fec; color: #e67e22; }\n";
  css << "        .meta, .zones { background: white; padding: 15px; border-radius: 8px; margin-bottom: 20px; box-shadow: 0 2px 5px rgba(0,0,0,0.1); }\n";
  css << "        .summary { display: flex; gap: 15px; flex-wrap: wrap; margin-bottom: 30px; }\n";
  css << "        .stat { padding: 15px 25px; border-radius: 8px; color: white; }\n";
  css << "        .stat.diff { background: #e74c3c; }\n";
  css << "        .stat.identical { background: #27ae60; }\n";
  css << "        .stat.unmatched { background: #f39c12; }\n";
  css << "        .pages { display: flex; flex-direction: column; gap: 20px; }\n";
  css << "        .page-pair { background: white; border-radius: 8px; padding: 20px; box-shadow: 0 2px 5px rgba(0,0,0,0.1); }\n";
  css << "        .page-pair.has-diff { border-left: 5px solid #e74c3c; }\n";
  css << "        .page-pair.identical { border-left: 5px solid #27ae60; }\n";
  css << "        .page-pair.unmatched { border-left: 5px solid #f39c12; }\n";
  css << "        .page-header { display: flex; justify-content: space-between; margin-bottom: 15px; border-bottom: 1px solid #eee; }\n";
  css << "        .page-images { display: flex; gap: 20px; justify-content: center; flex-wrap: wrap; }\n";
  css << "        .page-image { text-align: center; }\n";
  css << "        .page-image img { max-width: 100%; border: 1px solid #ddd; border-radius: 4px; }\n";
  css << "    </style>\n";

  return dcx_string(css.str());
}

dcx_string dcx_report_to_html::generate_zone_list(const dcx_exclusion_zone_set& zones) const
{
  std::ostringstream html;
  html << std::fixed << std::setprecision(2);
  html << "    <div class=\"zones\">\n";
  html << "        <h3>Exclusion Zones</h3>\n";
  html << "        <ul>\n";
  for (const dcx_exclusion_zone& zone : zones.all()) {
    dcx_string label = (*zone.name).empty() ? dcx_string("(unnamed)") : *zone.name;
    html << "            <li>" << escape_html(label).c_str()
         << ": x=" << *zone.x << ", y=" << *zone.y
         << ", w=" << *zone.width << ", h=" << *zone.height
         << " (" << (*zone.applies_to).c_str()
         << (*zone.enabled ? "" : ", disabled") << ")</li>\n";
  }
  html << "        </ul>\n";
  html << "    </div>\n";
  return dcx_string(html.str());
}

dcx_string dcx_report_to_html::render_pair(const dcx_match_result& match,
                                           const dcx_document& left, const dcx_document& right,
                                           const dcx_pair_diff* diff, bool has_diff) const
{
  std::ostringstream html;
  int l = match.left();
  int r = match.right();

  html << "        <div class=\"page-pair " << (has_diff ? "has-diff" : "identical") << "\">\n";
  html << "            <div class=\"page-header\">\n";
  html << "                <span class=\"page-label\">Left Page " << (l + 1) << " &harr; Right Page " << (r + 1) << "</span>\n";
  html << "                <span class=\"status\">" << (has_diff ? "Differences detected" : "Identical")
       << " (similarity " << std::fixed << std::setprecision(3) << *match.similarity << ")</span>\n";
  html << "            </div>\n";
  html << "            <div class=\"page-images\">\n";

  if (*config.include_thumbnails) {
    if (diff != nullptr && !diff->left_result.highlight_image.empty()) {
      html << image_block(diff->left_result.highlight_image, "Left: Page " + dcx_string(l + 1)).c_str();
      html << image_block(diff->right_result.highlight_image, "Right: Page " + dcx_string(r + 1)).c_str();
    } else {
      html << image_block(left.page(static_cast<size_t>(l)).thumbnail(), "Left: Page " + dcx_string(l + 1)).c_str();
      html << image_block(right.page(static_cast<size_t>(r)).thumbnail(), "Right: Page " + dcx_string(r + 1)).c_str();
    }
  }

  html << "            </div>\n";
  html << "        </div>\n";
  return dcx_string(html.str());
}

dcx_string dcx_report_to_html::render_unmatched(int page_index, const dcx_document& doc, const dcx_string& side) const
{
  dcx_string side_label = side == "left" ? "Left" : "Right";
  std::ostringstream html;

  html << "        <div class=\"page-pair unmatched\">\n";
  html << "            <div class=\"page-header\">\n";
  html << "                <span class=\"page-label\">" << side_label.c_str() << " Page " << (page_index + 1) << " (No Match)</span>\n";
  html << "            </div>\n";
  html << "            <div class=\"page-images\">\n";
  if (*config.include_thumbnails) {
    html << image_block(doc.page(static_cast<size_t>(page_index)).thumbnail(),
                        side_label + ": Page " + dcx_string(page_index + 1)).c_str();
  }
  html << "            </div>\n";
  html << "        </div>\n";
  return dcx_string(html.str());
}

dcx_string dcx_report_to_html::image_block(const cv::Mat& image, const dcx_string& caption) const
{
  if (image.empty()) {
    return "";
  }

  cv::Mat scaled = image;
  int max_width = static_cast<int>(*config.thumbnail_width);
  if (max_width > 0 && image.cols > max_width) {
    int height = std::max(1, static_cast<int>(static_cast<double>(image.rows) * max_width / image.cols));
    cv::resize(image, scaled, cv::Size(max_width, height), 0, 0, cv::INTER_AREA);
  }

  std::vector<unsigned char> png;
  if (!cv::imencode(".png", scaled, png)) {
    std::cerr << "[report] PNG encoding failed for " << caption.c_str() << std::endl;
    return "";
  }

  dcx_string text = escape_html(caption);
  std::ostringstream html;
  html << "                <div class=\"page-image\"><img src=\"data:image/png;base64,"
       << base64_encode(png).c_str() << "\" alt=\"" << text.c_str() << "\"><p>"
       << text.c_str() << "</p></div>\n";
  return dcx_string(html.str());
}

// ============================================================================
// Helper Methods
// ============================================================================

dcx_string dcx_report_to_html::base64_encode(const std::vector<unsigned char>& data)
{
  static const char table[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
  std::string out;
  out.reserve(((data.size() + 2) / 3) * 4);

  size_t i = 0;
  for (; i + 2 < data.size(); i += 3) {
    unsigned int n = (data[i] << 16) | (data[i + 1] << 8) | data[i + 2];
    out.push_back(table[(n >> 18) & 0x3F]);
    out.push_back(table[(n >> 12) & 0x3F]);
    out.push_back(table[(n >> 6) & 0x3F]);
    out.push_back(table[n & 0x3F]);
  }

  size_t rest = data.size() - i;
  if (rest == 1) {
    unsigned int n = data[i] << 16;
    out.push_back(table[(n >> 18) & 0x3F]);
    out.push_back(table[(n >> 12) & 0x3F]);
    out += "==";
  } else if (rest == 2) {
    unsigned int n = (data[i] << 16) | (data[i + 1] << 8);
    out.push_back(table[(n >> 18) & 0x3F]);
    out.push_back(table[(n >> 12) & 0x3F]);
    out.push_back(table[(n >> 6) & 0x3F]);
    out.push_back('=');
  }
  return dcx_string(out);
}

dcx_string dcx_report_to_html::escape_html(const dcx_string& text)
{
  std::string result;
  for (char c : text.to_std_const()) {
    switch (c) {
      case '&': result += "&amp;"; break;
      case '<': result += "&lt;"; break;
      case '>': result += "&gt;"; break;
      case '"': result += "&quot;"; break;
      default: result.push_back(c);
    }
  }
  return dcx_string(result);
}
