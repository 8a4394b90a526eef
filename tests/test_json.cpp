#include <catch2/catch_all.hpp>
#include <api/json/dcx_json.h>
#include <filesystem>

SCENARIO("dcx_json parses objects into variant maps", "[unit][json]") {
    GIVEN("A JSON object with every value kind") {
        dcx_string text = R"({
            "name": "report",
            "count": 3,
            "ratio": 0.25,
            "enabled": true,
            "missing": null,
            "list": [1, 2, 3],
            "nested": {"x": 0.5}
        })";

        WHEN("It is parsed") {
            dcxv_map data;
            dcx_json json(&data);
            bool ok = json.parse(text);

            THEN("Each value keeps its type") {
                REQUIRE(ok);
                REQUIRE(data["name"].is_string());
                REQUIRE(data["name"].string_value() == "report");
                REQUIRE(data["count"].is_int());
                REQUIRE(data["count"].int_value() == 3);
                REQUIRE(data["ratio"].is_double());
                REQUIRE(data["ratio"].double_value() == Catch::Approx(0.25));
                REQUIRE(data["enabled"].is_bool());
                REQUIRE(data["missing"].is_null());
                REQUIRE(data["list"].vector_value().size() == 3);
                REQUIRE(data["nested"].map_value().at("x").double_value() == Catch::Approx(0.5));
            }
        }
    }

    GIVEN("Text that is not a JSON object") {
        dcxv_map data;
        dcx_json json(&data);

        THEN("parse reports failure") {
            REQUIRE_FALSE(json.parse("[1, 2, 3]"));
            REQUIRE_FALSE(json.parse("{broken"));
        }
    }
}

SCENARIO("dcx_json writes and reads files", "[unit][json]") {
    GIVEN("A map with a float that has no fraction") {
        dcxv_map data;
        data["similarity"] = 1.0;
        data["index"] = 4;
        data["label"] = "page";

        std::filesystem::path file = std::filesystem::temp_directory_path() / "dcx_json_test.json";

        WHEN("It is written and read back") {
            dcx_json writer(&data);
            REQUIRE(writer.write_file(file.string()));

            dcxv_map loaded;
            dcx_json reader(&loaded);
            REQUIRE(reader.read_file(file.string()));

            THEN("Integers and doubles stay distinct") {
                REQUIRE(loaded["similarity"].is_double());
                REQUIRE(loaded["index"].is_int());
                REQUIRE(loaded["label"].string_value() == "page");
            }
        }

        std::filesystem::remove(file);
    }

    GIVEN("A path that does not exist") {
        dcxv_map data;
        dcx_json json(&data);

        THEN("read_file fails without throwing") {
            REQUIRE_FALSE(json.read_file("/nonexistent/dir/file.json"));
        }
    }
}
