#include <catch2/catch_all.hpp>
#include <comparison/dcx_session.h>
#include <comparison/dcx_compare_exceptions.h>
#include <utils/dcx_datetime.h>
#include <filesystem>
#include <fstream>

namespace {

  std::filesystem::path session_dir() {
    return std::filesystem::temp_directory_path() / "dcx_session_test";
  }

  dcx_matching_result two_page_result() {
    dcx_matching_result result;
    result.add(dcx_match_result::make_matched(0, 0, 0.97, 4));
    result.add(dcx_match_result::make_unmatched_left(1));
    result.add(dcx_match_result::make_unmatched_right(1));
    result.set_manual_match(1, 1);
    return result;
  }

}

SCENARIO("A new session", "[unit][session]") {
    GIVEN("A default session") {
        dcx_session session;

        THEN("It has a version, timestamps and no documents") {
            REQUIRE(session.version == "1.0");
            REQUIRE(session.left_document_path.is_null());
            REQUIRE_FALSE(session.has_documents());
            REQUIRE_FALSE(session.has_matching_result());
            REQUIRE(session.exclusion_zones().empty());
            REQUIRE(dcx_is_iso_timestamp(*session.created_at));
            REQUIRE(dcx_is_iso_timestamp(*session.modified_at));
        }

        WHEN("Both documents are set") {
            session.left_document_path = "/docs/v1.pdf";
            session.right_document_path = "/docs/v2.pdf";

            THEN("It has documents") {
                REQUIRE(session.has_documents());
            }

            AND_WHEN("The session is cleared") {
                session.set_matching_result(two_page_result());
                session.exclusion_zones().add(dcx_exclusion_zone_set::preset("header"));
                session.notes = "checked";
                session.clear_session();

                THEN("Everything but version and creation time is reset") {
                    REQUIRE_FALSE(session.has_documents());
                    REQUIRE_FALSE(session.has_matching_result());
                    REQUIRE(session.exclusion_zones().empty());
                    REQUIRE(session.notes == "");
                    REQUIRE(session.version == "1.0");
                }
            }
        }
    }
}

SCENARIO("Sessions are saved and loaded", "[integration][session]") {
    GIVEN("A session with documents, matching, zones and notes") {
        std::filesystem::remove_all(session_dir());
        dcx_string path = (session_dir() / "nested" / "review.json").string();

        dcx_session session;
        session.left_document_path = "/docs/v1.pdf";
        session.right_document_path = "/docs/v2";
        session.created_at = "2024-01-15T10:30:00";
        session.notes = "Quarterly report";
        session.set_matching_result(two_page_result());
        session.exclusion_zones().add(
            dcx_exclusion_zone(0.0, 0.9, 1.0, 0.1, "footer", dcx_exclusion_zone::right));

        WHEN("It is saved into a directory that does not exist yet") {
            REQUIRE(session.save(path));
            dcx_session loaded = dcx_session::load(path);

            THEN("Everything comes back") {
                REQUIRE(loaded.version == "1.0");
                REQUIRE(loaded.left_document_path == "/docs/v1.pdf");
                REQUIRE(loaded.right_document_path == "/docs/v2");
                REQUIRE(loaded.created_at == "2024-01-15T10:30:00");
                REQUIRE(loaded.modified_at == *session.modified_at);
                REQUIRE(loaded.notes == "Quarterly report");
                REQUIRE(loaded.has_matching_result());
                REQUIRE(loaded.matching_result() == session.matching_result());
                REQUIRE(loaded.matching_result().match_for_left(1)->is_manual == true);
                REQUIRE(loaded.exclusion_zones().size() == 1);
                REQUIRE(loaded.exclusion_zones().at(0).target() == dcx_exclusion_zone::right);
            }
        }

        std::filesystem::remove_all(session_dir());
    }

    GIVEN("A session without a matching result") {
        dcx_session session;

        WHEN("It goes through its structured form") {
            dcxv_map data = session.to_session_map();

            THEN("The matching result is null and zones are an empty list") {
                REQUIRE(data["matching_result"].is_null());
                REQUIRE(data["exclusion_zones"].map_value().at("zones").vector_value().empty());
                REQUIRE_FALSE(dcx_session::from_session_map(data).has_matching_result());
            }
        }
    }
}

SCENARIO("Session files are validated", "[unit][session]") {
    GIVEN("A minimal structured form") {
        dcxv_map data;
        data["left_document_path"] = "a.pdf";

        THEN("Missing keys take defaults") {
            dcx_session session = dcx_session::from_session_map(data);
            REQUIRE(session.left_document_path == "a.pdf");
            REQUIRE(session.right_document_path.is_null());
            REQUIRE(session.version == "1.0");
            REQUIRE(dcx_is_iso_timestamp(*session.created_at));
        }
    }

    GIVEN("Wrongly typed or inconsistent values") {
        dcxv_map bad_path;
        bad_path["left_document_path"] = 5;

        dcxv_map bad_time;
        bad_time["created_at"] = "yesterday";

        dcxv_map bad_matching;
        bad_matching["matching_result"] = "none";

        dcxv_map bad_zone_entry;
        bad_zone_entry["x"] = 2.0;
        bad_zone_entry["y"] = 0.0;
        bad_zone_entry["width"] = 0.1;
        bad_zone_entry["height"] = 0.1;
        dcxv_vector zone_list;
        zone_list.push_back(bad_zone_entry);
        dcxv_map zone_set;
        zone_set["zones"] = zone_list;
        dcxv_map bad_zone;
        bad_zone["exclusion_zones"] = zone_set;

        THEN("Reading them throws a session error") {
            REQUIRE_THROWS_AS(dcx_session::from_session_map(bad_path), dcx_invalid_session_error);
            REQUIRE_THROWS_AS(dcx_session::from_session_map(bad_time), dcx_invalid_session_error);
            REQUIRE_THROWS_AS(dcx_session::from_session_map(bad_matching), dcx_invalid_session_error);
            REQUIRE_THROWS_AS(dcx_session::from_session_map(bad_zone), dcx_invalid_session_error);
        }
    }

    GIVEN("Files that are missing or not JSON") {
        std::filesystem::create_directories(session_dir());
        std::filesystem::path broken = session_dir() / "broken.json";
        std::ofstream(broken.string()) << "{not json";

        THEN("Loading throws a session error") {
            REQUIRE_THROWS_AS(dcx_session::load((session_dir() / "missing.json").string()),
                              dcx_invalid_session_error);
            REQUIRE_THROWS_AS(dcx_session::load(broken.string()), dcx_invalid_session_error);
        }

        std::filesystem::remove_all(session_dir());
    }
}
