#include <catch2/catch_all.hpp>
#include <comparison/diff/dcx_image_diff.h>
#include <comparison/dcx_compare_exceptions.h>
#include <opencv2/imgproc.hpp>

namespace {

  cv::Mat white_page(int width = 200, int height = 200) {
    return cv::Mat(height, width, CV_8UC3, cv::Scalar(255, 255, 255));
  }

  cv::Mat page_with_block(const cv::Rect& block) {
    cv::Mat page = white_page();
    cv::rectangle(page, block, cv::Scalar(0, 0, 0), cv::FILLED);
    return page;
  }

}

SCENARIO("Identical pages have no differences", "[unit][diff]") {
    GIVEN("Two copies of a page") {
        cv::Mat page = page_with_block(cv::Rect(20, 20, 60, 10));
        dcx_image_diff diff;

        WHEN("They are compared") {
            dcx_diff_result result = diff.compare(page, page.clone());

            THEN("Nothing is reported") {
                REQUIRE(result.diff_score == Catch::Approx(0.0));
                REQUIRE(result.regions.empty());
                REQUIRE_FALSE(result.has_differences());
                REQUIRE(result.diff_image.type() == CV_8UC1);
                REQUIRE(result.highlight_image.type() == CV_8UC3);
            }
        }
    }

    GIVEN("Pages of different size with the same flat content") {
        dcx_image_diff diff;

        WHEN("They are compared") {
            dcx_diff_result result = diff.compare(white_page(100, 100), white_page(200, 200));

            THEN("The smaller one is scaled up") {
                REQUIRE(result.diff_image.cols == 200);
                REQUIRE(result.diff_image.rows == 200);
                REQUIRE_FALSE(result.has_differences());
            }
        }
    }
}

SCENARIO("A changed block becomes one region", "[unit][diff]") {
    GIVEN("A white page and the same page with a 40 x 40 black block") {
        cv::Mat original = white_page();
        cv::Mat changed = page_with_block(cv::Rect(50, 50, 40, 40));
        dcx_image_diff diff;

        WHEN("They are compared") {
            dcx_diff_result result = diff.compare(original, changed);

            THEN("The block is found with its score and intensity") {
                REQUIRE(result.diff_count() == 1);
                const dcx_diff_region& region = result.regions[0];
                REQUIRE(region.x == 50);
                REQUIRE(region.y == 50);
                REQUIRE(region.width == 40);
                REQUIRE(region.height == 40);
                REQUIRE(region.bounds() == cv::Vec4i(50, 50, 90, 90));
                REQUIRE(region.intensity == Catch::Approx(1.0));
                REQUIRE(result.diff_score == Catch::Approx(1600.0 / 40000.0));
                REQUIRE(result.has_differences());
            }

            THEN("The highlight is drawn in red on the first page") {
                REQUIRE(result.highlight_image.at<cv::Vec3b>(50, 50) == cv::Vec3b(0, 0, 255));
                REQUIRE(result.highlight_image.at<cv::Vec3b>(10, 10) == cv::Vec3b(255, 255, 255));
            }
        }

        WHEN("The block is covered by an exclusion zone") {
            std::vector<dcx_exclusion_zone> zones = {dcx_exclusion_zone(0.2, 0.2, 0.3, 0.3, "block")};
            dcx_diff_result result = diff.compare(original, changed, zones);

            THEN("It is not reported") {
                REQUIRE(result.diff_score == Catch::Approx(0.0));
                REQUIRE(result.regions.empty());
                REQUIRE(result.diff_image.at<uchar>(60, 60) == 0);
            }
        }

        WHEN("The covering zone is disabled") {
            std::vector<dcx_exclusion_zone> zones = {
                dcx_exclusion_zone(0.2, 0.2, 0.3, 0.3, "block", dcx_exclusion_zone::both, false)};
            dcx_diff_result result = diff.compare(original, changed, zones);

            THEN("The block is reported again") {
                REQUIRE(result.diff_count() == 1);
            }
        }
    }
}

SCENARIO("Small changes are filtered by area", "[unit][diff]") {
    GIVEN("A 5 x 5 speck") {
        cv::Mat changed = page_with_block(cv::Rect(100, 100, 5, 5));
        dcx_image_diff diff;

        WHEN("It is compared with the default minimum area") {
            dcx_diff_result result = diff.compare(white_page(), changed);

            THEN("No region and no difference are reported") {
                REQUIRE(result.regions.empty());
                REQUIRE(result.diff_score > 0.0);
                REQUIRE_FALSE(result.has_differences());
            }
        }

        WHEN("The minimum area is lowered") {
            dcx_image_diff sensitive(30, 10);
            dcx_diff_result result = sensitive.compare(white_page(), changed);

            THEN("The speck is a region") {
                REQUIRE(result.diff_count() == 1);
            }
        }
    }

    GIVEN("Many tiny specks spread over the page") {
        cv::Mat changed = white_page();
        for (int y = 0; y < 200; y += 10) {
            for (int x = 0; x < 200; x += 10) {
                cv::rectangle(changed, cv::Rect(x, y, 3, 3), cv::Scalar(0, 0, 0), cv::FILLED);
            }
        }

        WHEN("They are compared") {
            dcx_diff_result result = dcx_image_diff().compare(white_page(), changed);

            THEN("The score alone flags a difference") {
                REQUIRE(result.regions.empty());
                REQUIRE(result.diff_score > 0.01);
                REQUIRE(result.has_differences());
            }
        }
    }

    GIVEN("A change below the pixel threshold") {
        cv::Mat faint = white_page();
        faint.setTo(cv::Scalar(240, 240, 240));

        THEN("It is ignored") {
            REQUIRE_FALSE(dcx_image_diff().compare(white_page(), faint).has_differences());
        }
    }
}

SCENARIO("Diffs depend on direction and side", "[unit][diff]") {
    GIVEN("Two pages and no zones") {
        cv::Mat a = white_page();
        cv::Mat b = page_with_block(cv::Rect(50, 50, 40, 40));
        dcx_image_diff diff;

        WHEN("They are compared both ways") {
            dcx_diff_result forward = diff.compare(a, b);
            dcx_diff_result backward = diff.compare(b, a);

            THEN("Score and regions agree and each highlight uses its first image") {
                REQUIRE(forward.diff_score == Catch::Approx(backward.diff_score));
                REQUIRE(forward.diff_count() == backward.diff_count());
                REQUIRE(forward.regions[0].rect() == backward.regions[0].rect());
                REQUIRE(forward.highlight_image.at<cv::Vec3b>(70, 70) != backward.highlight_image.at<cv::Vec3b>(70, 70));
            }
        }
    }

    GIVEN("A zone set that only applies to the left page") {
        cv::Mat left = white_page();
        cv::Mat right = page_with_block(cv::Rect(50, 50, 40, 40));
        dcx_exclusion_zone_set zones;
        zones.add(dcx_exclusion_zone(0.2, 0.2, 0.3, 0.3, "stamp", dcx_exclusion_zone::left));
        dcx_image_diff diff;

        WHEN("Both directions are compared") {
            dcx_diff_result left_result = diff.compare(left, right, zones, dcx_exclusion_zone::left);
            dcx_diff_result right_result = diff.compare(right, left, zones, dcx_exclusion_zone::right);

            THEN("Only the right side reports the block, drawn on its own pixels") {
                REQUIRE_FALSE(left_result.has_differences());
                REQUIRE(right_result.diff_count() == 1);
                REQUIRE(right_result.highlight_image.at<cv::Vec3b>(70, 70) != cv::Vec3b(255, 255, 255));
                REQUIRE(left_result.highlight_image.at<cv::Vec3b>(70, 70) == cv::Vec3b(255, 255, 255));
            }
        }
    }
}

SCENARIO("Side by side view", "[unit][diff]") {
    GIVEN("A tall left page and a short right page") {
        cv::Mat left(200, 100, CV_8UC3, cv::Scalar(0, 0, 0));
        cv::Mat right(100, 50, CV_8UC1, cv::Scalar(0));

        WHEN("They are placed side by side") {
            cv::Mat canvas = dcx_image_diff::create_side_by_side(left, right);

            THEN("Both share the taller height with a white gap") {
                REQUIRE(canvas.rows == 200);
                REQUIRE(canvas.cols == 100 + 10 + 100);
                REQUIRE(canvas.at<cv::Vec3b>(100, 105) == cv::Vec3b(255, 255, 255));
                REQUIRE(canvas.at<cv::Vec3b>(100, 150) == cv::Vec3b(0, 0, 0));
            }
        }
    }
}

SCENARIO("Invalid diff input", "[unit][diff]") {
    dcx_image_diff diff;

    THEN("Empty and non 8-bit images are rejected") {
        REQUIRE_THROWS_AS(diff.compare(cv::Mat(), white_page()), dcx_invalid_image_error);
        REQUIRE_THROWS_AS(diff.compare(white_page(), cv::Mat(10, 10, CV_32FC1, cv::Scalar(0))),
                          dcx_invalid_image_error);
    }

    THEN("An enabled zone moved off the page is rejected") {
        dcx_exclusion_zone zone(0.2, 0.2, 0.3, 0.3, "edited");
        zone.width = 1.5;
        std::vector<dcx_exclusion_zone> zones = {zone};
        REQUIRE_THROWS_AS(diff.compare(white_page(), white_page(), zones), dcx_invalid_zone_error);
    }

    THEN("Out of range settings are rejected") {
        REQUIRE_THROWS_AS(dcx_image_diff(300), std::invalid_argument);
        REQUIRE_THROWS_AS(dcx_image_diff(30, -1), std::invalid_argument);
        REQUIRE_THROWS_AS(dcx_image_diff(30, 100, cv::Scalar(255, 0, 0), 1.5), std::invalid_argument);
    }
}
