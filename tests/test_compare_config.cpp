#include <catch2/catch_all.hpp>
#include <comparison/dcx_compare_config.h>
#include <cstdlib>
#include <filesystem>
#include <fstream>

SCENARIO("Comparison defaults", "[unit][config]") {
    GIVEN("The default configuration") {
        dcx_compare_config config = dcx_compare_config::defaults();

        THEN("It carries the stock values and validates") {
            REQUIRE(config.phash_threshold == 20);
            REQUIRE(*config.position_weight == Catch::Approx(0.1));
            REQUIRE(config.hash_size == 16);
            REQUIRE_FALSE(*config.use_ssim);
            REQUIRE(config.pixel_threshold == 30);
            REQUIRE(config.min_region_area == 100);
            REQUIRE(config.highlight_r == 255);
            REQUIRE(*config.highlight_alpha == Catch::Approx(0.5));
            REQUIRE(config.max_workers == 4);
            REQUIRE(config.render_dpi == 216);
            REQUIRE_NOTHROW(config.validate());
        }
    }

    GIVEN("Values out of range") {
        dcx_compare_config negative = dcx_compare_config::defaults();
        negative.phash_threshold = -1;

        dcx_compare_config bright = dcx_compare_config::defaults();
        bright.pixel_threshold = 256;

        dcx_compare_config idle = dcx_compare_config::defaults();
        idle.max_workers = 0;

        THEN("Validation names the problem") {
            REQUIRE_THROWS_WITH(negative.validate(), Catch::Matchers::ContainsSubstring("phash_threshold"));
            REQUIRE_THROWS_AS(bright.validate(), std::invalid_argument);
            REQUIRE_THROWS_AS(idle.validate(), std::invalid_argument);
        }
    }

    GIVEN("A configuration with a missing value") {
        dcx_compare_config config = dcx_compare_config::defaults();
        config.hash_size.set_null();

        THEN("Validation fails") {
            REQUIRE_THROWS_AS(config.validate(), std::invalid_argument);
        }
    }
}

SCENARIO("Configuration from the environment", "[unit][config]") {
    GIVEN("Threshold and worker variables plus one that does not parse") {
        setenv("DCX_PHASH_THRESHOLD", "12", 1);
        setenv("DCX_MAX_WORKERS", " 8 ", 1);
        setenv("DCX_POSITION_WEIGHT", "heavy", 1);

        WHEN("They are applied") {
            dcx_compare_config config = dcx_compare_config::defaults();
            int applied = config.apply_env();

            THEN("Valid values override the defaults") {
                REQUIRE(applied == 2);
                REQUIRE(config.phash_threshold == 12);
                REQUIRE(config.max_workers == 8);
                REQUIRE(*config.position_weight == Catch::Approx(0.1));
            }
        }

        unsetenv("DCX_PHASH_THRESHOLD");
        unsetenv("DCX_MAX_WORKERS");
        unsetenv("DCX_POSITION_WEIGHT");
    }
}

SCENARIO("Configuration from a JSON file", "[unit][config]") {
    std::filesystem::path file = std::filesystem::temp_directory_path() / "dcx_config_test.json";

    GIVEN("A file overriding three keys") {
        std::ofstream(file.string()) << R"({"min_region_area": 250, "position_weight": 0.3, "use_ssim": true, "color": "blue"})";

        WHEN("It is loaded on top of the defaults") {
            dcx_compare_config config = dcx_compare_config::defaults();
            bool ok = config.load_json(file.string());

            THEN("Only those keys change") {
                REQUIRE(ok);
                REQUIRE(config.min_region_area == 250);
                REQUIRE(*config.position_weight == Catch::Approx(0.3));
                REQUIRE(*config.use_ssim);
                REQUIRE(config.pixel_threshold == 30);
            }
        }
    }

    GIVEN("A file with a value of the wrong type") {
        std::ofstream(file.string()) << R"({"phash_threshold": "many"})";

        THEN("Loading fails") {
            dcx_compare_config config = dcx_compare_config::defaults();
            REQUIRE_FALSE(config.load_json(file.string()));
        }
    }

    GIVEN("A path that does not exist") {
        THEN("Loading fails") {
            dcx_compare_config config = dcx_compare_config::defaults();
            REQUIRE_FALSE(config.load_json("/nonexistent/doccomp.json"));
        }
    }

    std::filesystem::remove(file);
}
