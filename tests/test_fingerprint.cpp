#include <catch2/catch_all.hpp>
#include <comparison/fingerprint/dcx_fingerprint.h>
#include <comparison/dcx_compare_exceptions.h>
#include <documents/dcx_page.h>
#include <opencv2/imgproc.hpp>
#include <random>

namespace {

  cv::Mat noise_page(unsigned seed, int size = 256) {
    std::mt19937 rng(seed);
    std::uniform_int_distribution<int> value(0, 255);
    cv::Mat image(size, size, CV_8UC1);
    for (int y = 0; y < image.rows; ++y) {
      for (int x = 0; x < image.cols; ++x) {
        image.at<uchar>(y, x) = static_cast<uchar>(value(rng));
      }
    }
    return image;
  }

}

SCENARIO("Fingerprint bit vectors", "[unit][fingerprint]") {
    GIVEN("Two fingerprints of 100 bits") {
        dcx_fingerprint a(100);
        dcx_fingerprint b(100);

        WHEN("Bits are set in different words") {
            a.set_bit(0, true);
            a.set_bit(70, true);
            b.set_bit(70, true);
            b.set_bit(99, true);

            THEN("The distance counts differing bits only") {
                REQUIRE(a.bit(70));
                REQUIRE_FALSE(a.bit(99));
                REQUIRE(a.hamming_distance(b) == 2);
                REQUIRE(b.hamming_distance(a) == 2);
                REQUIRE(a.hamming_distance(a) == 0);
            }
        }

        THEN("Out of range bits throw") {
            REQUIRE_THROWS_AS(a.bit(100), std::out_of_range);
            REQUIRE_THROWS_AS(a.set_bit(100, true), std::out_of_range);
        }
    }

    GIVEN("Fingerprints of different lengths") {
        dcx_fingerprint a(64);
        dcx_fingerprint b(256);

        THEN("They cannot be compared") {
            REQUIRE_THROWS_AS(a.hamming_distance(b), std::invalid_argument);
        }
    }

    GIVEN("A default fingerprint") {
        dcx_fingerprint none;

        THEN("It is empty") {
            REQUIRE(none.empty());
            REQUIRE(none.bit_length() == 0);
        }
    }
}

SCENARIO("pHash provider", "[unit][fingerprint]") {
    GIVEN("The default provider") {
        dcx_phash_provider provider;

        THEN("Fingerprints have 256 bits") {
            REQUIRE(provider.bit_length() == 256);
            REQUIRE(provider.hash(noise_page(1)).bit_length() == 256);
        }

        WHEN("The same page is hashed twice") {
            cv::Mat page = noise_page(7);

            THEN("The fingerprints are identical") {
                REQUIRE(provider.hash(page).hamming_distance(provider.hash(page.clone())) == 0);
            }
        }

        WHEN("A grey page is hashed as colour") {
            cv::Mat gray = noise_page(11);
            cv::Mat color;
            cv::cvtColor(gray, color, cv::COLOR_GRAY2BGR);

            THEN("The result matches the grey hash") {
                REQUIRE(provider.hash(gray).hamming_distance(provider.hash(color)) == 0);
            }
        }

        WHEN("A page is rendered at twice the resolution") {
            cv::Mat page = noise_page(13);
            cv::Mat larger;
            cv::resize(page, larger, cv::Size(512, 512), 0, 0, cv::INTER_NEAREST);

            THEN("The fingerprint barely moves") {
                REQUIRE(provider.hash(page).hamming_distance(provider.hash(larger)) <= 4);
            }
        }

        WHEN("Two unrelated pages are hashed") {
            int distance = provider.hash(noise_page(21)).hamming_distance(provider.hash(noise_page(22)));

            THEN("They are far apart") {
                REQUIRE(distance > 60);
            }
        }

        THEN("Unusable images are rejected") {
            REQUIRE_THROWS_AS(provider.hash(cv::Mat()), dcx_invalid_image_error);
            REQUIRE_THROWS_AS(provider.hash(cv::Mat(32, 32, CV_16UC1, cv::Scalar(0))), dcx_invalid_image_error);
        }
    }

    GIVEN("Invalid provider settings") {
        THEN("Construction throws") {
            REQUIRE_THROWS_AS(dcx_phash_provider(1, 4), std::invalid_argument);
            REQUIRE_THROWS_AS(dcx_phash_provider(3, 1), std::invalid_argument);
        }
    }
}

SCENARIO("Fingerprints are computed once per page", "[unit][fingerprint]") {
    GIVEN("Three pages, one of them without an image") {
        std::vector<dcx_page> pages;
        pages.push_back(dcx_page(0, noise_page(31)));
        pages.push_back(dcx_page(1, cv::Mat()));
        pages.push_back(dcx_page(2, noise_page(32)));
        dcx_phash_provider provider;

        WHEN("Fingerprints are ensured") {
            size_t missing = dcx_ensure_fingerprints(pages, provider, 2);

            THEN("The failing page stays without a fingerprint") {
                REQUIRE(missing == 1);
                REQUIRE(pages[0].has_fingerprint());
                REQUIRE_FALSE(pages[1].has_fingerprint());
                REQUIRE(pages[1].fingerprint_attempted());
                REQUIRE(pages[2].has_fingerprint());
            }

            AND_WHEN("They are ensured again") {
                dcx_fingerprint before = pages[0].fingerprint();
                size_t again = dcx_ensure_fingerprints(pages, provider, 2);

                THEN("Nothing is recomputed") {
                    REQUIRE(again == 1);
                    REQUIRE(pages[0].fingerprint() == before);
                }
            }
        }

        WHEN("A fingerprint is invalidated") {
            dcx_ensure_fingerprints(pages, provider, 1);
            pages[0].invalidate_fingerprint();

            THEN("The page needs a new attempt") {
                REQUIRE_FALSE(pages[0].fingerprint_attempted());
                REQUIRE_FALSE(pages[0].has_fingerprint());
                REQUIRE(pages[0].compute_fingerprint(provider));
            }
        }
    }
}

SCENARIO("Thumbnails", "[unit][fingerprint]") {
    GIVEN("A large landscape image") {
        cv::Mat image(1000, 2000, CV_8UC3, cv::Scalar(255, 255, 255));

        WHEN("It is shrunk into 400 x 400") {
            cv::Mat thumb = dcx_make_thumbnail(image, 400, 400);

            THEN("The aspect ratio is kept") {
                REQUIRE(thumb.cols == 400);
                REQUIRE(thumb.rows == 200);
            }
        }

        WHEN("The box is larger than the image") {
            cv::Mat thumb = dcx_make_thumbnail(image, 4000, 4000);

            THEN("It is not upscaled") {
                REQUIRE(thumb.cols == 2000);
                REQUIRE(thumb.rows == 1000);
            }
        }
    }

    THEN("Placeholders are flat grey") {
        cv::Mat placeholder = dcx_placeholder_thumbnail(30, 20);
        REQUIRE(placeholder.cols == 30);
        REQUIRE(placeholder.rows == 20);
        REQUIRE(placeholder.at<cv::Vec3b>(5, 5) == cv::Vec3b(200, 200, 200));
    }
}
