#include <catch2/catch_all.hpp>
#include <documents/dcx_report_to_html.h>
#include <filesystem>
#include <fstream>
#include <sstream>

using Catch::Matchers::ContainsSubstring;

namespace {

  cv::Mat flat_page(int value) {
    return cv::Mat(80, 60, CV_8UC3, cv::Scalar(value, value, value));
  }

  // left pages 0-1 match right 0-1 (pair 1 differs), left 2 and right 2 are unmatched
  dcx_matching_result sample_matching() {
    dcx_matching_result result;
    result.add(dcx_match_result::make_matched(0, 0, 1.0, 0));
    result.add(dcx_match_result::make_matched(1, 1, 0.8, 15));
    result.add(dcx_match_result::make_unmatched_left(2));
    result.add(dcx_match_result::make_unmatched_right(2));
    return result;
  }

  size_t count_of(const std::string& text, const std::string& needle) {
    size_t count = 0;
    for (size_t pos = text.find(needle); pos != std::string::npos; pos = text.find(needle, pos + 1)) {
      ++count;
    }
    return count;
  }

}

SCENARIO("HTML report helpers", "[unit][report]") {
    THEN("Base64 follows RFC 4648 padding") {
        REQUIRE(dcx_report_to_html::base64_encode({}) == "");
        REQUIRE(dcx_report_to_html::base64_encode({'f'}) == "Zg==");
        REQUIRE(dcx_report_to_html::base64_encode({'f', 'o'}) == "Zm8=");
        REQUIRE(dcx_report_to_html::base64_encode({'f', 'o', 'o'}) == "Zm9v");
        REQUIRE(dcx_report_to_html::base64_encode({'f', 'o', 'o', 'b', 'a', 'r'}) == "Zm9vYmFy");
    }

    THEN("Markup characters are escaped") {
        REQUIRE(dcx_report_to_html::escape_html("a < b & \"c\" > d") ==
                "a &lt; b &amp; &quot;c&quot; &gt; d");
    }
}

SCENARIO("HTML comparison report", "[unit][report]") {
    GIVEN("Two small documents, a matching and one exclusion zone") {
        dcx_document left = dcx_document::from_images("v1.pdf", {flat_page(255), flat_page(255), flat_page(0)});
        dcx_document right = dcx_document::from_images("v2.pdf", {flat_page(255), flat_page(128), flat_page(60)});
        dcx_matching_result matching = sample_matching();
        dcx_exclusion_zone_set zones;
        zones.add(dcx_exclusion_zone_set::preset("footer"));

        WHEN("A default report is generated") {
            std::string html = dcx_report_to_html().convert(left, right, matching, {}, zones).to_std_const();

            THEN("It summarizes the comparison") {
                REQUIRE_THAT(html, ContainsSubstring("<title>Document Comparison Report</title>"));
                REQUIRE_THAT(html, ContainsSubstring("<strong>v1.pdf</strong> (3 pages)"));
                REQUIRE_THAT(html, ContainsSubstring("Pages with Differences: <strong>1</strong>"));
                REQUIRE_THAT(html, ContainsSubstring("Identical Pages: <strong>1</strong>"));
                REQUIRE_THAT(html, ContainsSubstring("Unmatched Left: <strong>1</strong>"));
                REQUIRE_THAT(html, ContainsSubstring("Unmatched Right: <strong>1</strong>"));
            }

            THEN("Identical pages are left out and the rest are embedded") {
                REQUIRE_FALSE(html.find("section-identical\">") != std::string::npos);
                REQUIRE_THAT(html, ContainsSubstring("Left Page 2 &harr; Right Page 2"));
                REQUIRE_THAT(html, ContainsSubstring("Left Page 3 (No Match)"));
                REQUIRE_THAT(html, ContainsSubstring("Right Page 3 (No Match)"));
                REQUIRE(count_of(html, "data:image/png;base64,") == 4);
            }

            THEN("The exclusion zones are listed") {
                REQUIRE_THAT(html, ContainsSubstring("Footer: x=0.00, y=0.92, w=1.00, h=0.08 (both)"));
            }
        }

        WHEN("Identical pages are included and thumbnails are off") {
            dcx_report_config config = dcx_report_config::defaults();
            config.include_identical = true;
            config.include_thumbnails = false;
            config.show_exclusion_zones = false;
            config.title = "Q3 <draft>";
            std::string html = dcx_report_to_html(config).convert(left, right, matching, {}, zones).to_std_const();

            THEN("The identical section appears without images") {
                REQUIRE_THAT(html, ContainsSubstring("Identical Pages</h2>"));
                REQUIRE_THAT(html, ContainsSubstring("Left Page 1 &harr; Right Page 1"));
                REQUIRE(count_of(html, "data:image/png") == 0);
                REQUIRE_FALSE(html.find("Exclusion Zones") != std::string::npos);
                REQUIRE_THAT(html, ContainsSubstring("<h1>Q3 &lt;draft&gt;</h1>"));
            }
        }

        WHEN("Pair diffs are given") {
            dcx_page_matcher matcher;
            std::vector<dcx_pair_diff> diffs = matcher.diff_matched_pairs(
                matching, left.pages(), right.pages(), dcx_image_diff(), zones);
            std::string html = dcx_report_to_html().convert(left, right, matching, diffs, zones).to_std_const();

            THEN("The diff decides which pairs differ") {
                REQUIRE(diffs.size() == 2);
                REQUIRE_THAT(html, ContainsSubstring("Pages with Differences: <strong>1</strong>"));
                REQUIRE_THAT(html, ContainsSubstring("Differences detected"));
            }
        }

        WHEN("The report is written to a nested path") {
            std::filesystem::path dir = std::filesystem::temp_directory_path() / "dcx_report_test";
            std::filesystem::remove_all(dir);
            std::filesystem::path file = dir / "out" / "report.html";
            bool ok = dcx_report_to_html().write(file.string(), left, right, matching, {}, zones);

            THEN("The file holds the same document") {
                REQUIRE(ok);
                std::ifstream in(file.string());
                std::stringstream content;
                content << in.rdbuf();
                REQUIRE_THAT(content.str(), ContainsSubstring("<!DOCTYPE html>"));
                REQUIRE_THAT(content.str(), ContainsSubstring("</html>"));
            }

            std::filesystem::remove_all(dir);
        }
    }
}
