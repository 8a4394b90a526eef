/**
 * doccomp - compare two documents page by page
 *
 * Usage:
 *   ./doccomp <left> <right> [options]
 *
 * <left> and <right> are PDF files or folders of page images.
 * Exit code: 0 no differences, 1 differences found, 2 usage or load error.
 *
 * Examples:
 *   ./doccomp old.pdf new.pdf
 *   ./doccomp old.pdf new.pdf --preset=footer --html=report.html
 *   ./doccomp slides_v1/ slides_v2/ --zone=0.9,0.93,0.1,0.07,right --session=review.json
 */

#include "comparison/dcx_compare_config.h"
#include "comparison/dcx_compare_exceptions.h"
#include "comparison/dcx_session.h"
#include "comparison/diff/dcx_image_diff.h"
#include "comparison/match/dcx_page_matcher.h"
#include "documents/dcx_document.h"
#include "documents/dcx_report_to_html.h"
#include "documents/dcx_thumbnail_cache.h"
#include "utils/dcx_env.h"
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

void print_usage(const char* program_name) {
    std::cout << "Document Comparison - doccomp\n" << std::endl;
    std::cout << "Usage:" << std::endl;
    std::cout << "  " << program_name << " <left> <right> [options]\n" << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  --session=<file>          Write the comparison session as JSON" << std::endl;
    std::cout << "  --html=<file>             Write an HTML report" << std::endl;
    std::cout << "  --zone=x,y,w,h[,side]     Exclusion zone in page fractions, side left|right|both (repeatable)" << std::endl;
    std::cout << "  --preset=<name>           Stock exclusion zone (repeatable)" << std::endl;
    std::cout << "  --threshold=<n>           Max pHash distance for a match (default: 20)" << std::endl;
    std::cout << "  --pixel-threshold=<n>     Pixel difference cutoff 0-255 (default: 30)" << std::endl;
    std::cout << "  --min-area=<n>            Smallest reported region in pixels (default: 100)" << std::endl;
    std::cout << "  --position-weight=<f>     Page position penalty weight (default: 0.1)" << std::endl;
    std::cout << "  --workers=<n>             Worker threads (default: 4)" << std::endl;
    std::cout << "  --ssim                    Refine matched pair similarity with SSIM" << std::endl;
    std::cout << "  --cache=<dir>             Thumbnail cache directory" << std::endl;
    std::cout << "  --config=<file>           JSON file with settings" << std::endl;
    std::cout << "  --quiet                   Only print the summary\n" << std::endl;
    std::cout << "Presets:";
    for (const dcx_string& name : dcx_exclusion_zone_set::preset_names()) {
        std::cout << " " << name.c_str();
    }
    std::cout << "\n" << std::endl;
    std::cout << "Examples:" << std::endl;
    std::cout << "  " << program_name << " old.pdf new.pdf" << std::endl;
    std::cout << "  " << program_name << " old.pdf new.pdf --preset=footer --html=report.html" << std::endl;
    std::cout << "  " << program_name << " v1/ v2/ --zone=0.9,0.93,0.1,0.07,right --session=review.json" << std::endl;
}

std::string get_option_value(const std::string& arg, const std::string& prefix) {
    if (arg.find(prefix) == 0) {
        return arg.substr(prefix.length());
    }
    return "";
}

bool parse_int_option(const std::string& arg, const std::string& prefix, dcx_property<long long>& target) {
    dcx_string value = get_option_value(arg, prefix);
    if (!value.is_integer()) {
        std::cerr << "Invalid value for " << prefix << " '" << value.c_str() << "'" << std::endl;
        return false;
    }
    target = value.to_int();
    return true;
}

dcx_exclusion_zone parse_zone(const dcx_string& text, size_t number) {
    std::vector<dcx_string> parts = text.split(",");
    if (parts.size() != 4 && parts.size() != 5) {
        throw std::invalid_argument(("Zone needs x,y,w,h[,side]: " + text).c_str());
    }
    double values[4];
    for (size_t i = 0; i < 4; ++i) {
        dcx_string part = parts[i].trim();
        if (!part.is_double() && !part.is_integer()) {
            throw std::invalid_argument(("Zone value is not a number: " + part).c_str());
        }
        values[i] = part.to_double();
    }
    dcx_exclusion_zone::side side = dcx_exclusion_zone::both;
    if (parts.size() == 5) {
        side = dcx_exclusion_zone::side_from_string(parts[4].trim());
    }
    return dcx_exclusion_zone(values[0], values[1], values[2], values[3],
                              "Zone " + dcx_string(static_cast<long long>(number)), side);
}

int main(int argc, char* argv[]) {
    if (argc < 3) {
        print_usage(argv[0]);
        return 2;
    }

    std::string left_path = argv[1];
    std::string right_path = argv[2];
    std::string session_path = "";
    std::string html_path = "";
    std::string cache_dir = "";
    std::string config_path = "";
    std::vector<std::string> zone_specs;
    std::vector<std::string> presets;
    std::vector<std::string> overrides;
    bool quiet = false;
    bool use_ssim = false;

    for (int i = 3; i < argc; i++) {
        std::string arg = argv[i];

        if (arg.find("--session=") == 0) {
            session_path = get_option_value(arg, "--session=");
        } else if (arg.find("--html=") == 0) {
            html_path = get_option_value(arg, "--html=");
        } else if (arg.find("--zone=") == 0) {
            zone_specs.push_back(get_option_value(arg, "--zone="));
        } else if (arg.find("--preset=") == 0) {
            presets.push_back(get_option_value(arg, "--preset="));
        } else if (arg.find("--cache=") == 0) {
            cache_dir = get_option_value(arg, "--cache=");
        } else if (arg.find("--config=") == 0) {
            config_path = get_option_value(arg, "--config=");
        } else if (arg == "--quiet") {
            quiet = true;
        } else if (arg == "--ssim") {
            use_ssim = true;
        } else if (arg.find("--threshold=") == 0 || arg.find("--pixel-threshold=") == 0 ||
                   arg.find("--min-area=") == 0 || arg.find("--position-weight=") == 0 ||
                   arg.find("--workers=") == 0) {
            overrides.push_back(arg);
        } else {
            std::cerr << "Unknown option: " << arg << "\n" << std::endl;
            print_usage(argv[0]);
            return 2;
        }
    }

    // defaults < .env / environment < --config < command line
    auto config = dcx_compare_config::defaults();
    load_env_file(".env");
    config.apply_env();
    if (!config_path.empty() && !config.load_json(config_path)) {
        std::cerr << "Cannot use config file " << config_path << std::endl;
        return 2;
    }
    for (const std::string& arg : overrides) {
        bool ok = true;
        if (arg.find("--threshold=") == 0) {
            ok = parse_int_option(arg, "--threshold=", config.phash_threshold);
        } else if (arg.find("--pixel-threshold=") == 0) {
            ok = parse_int_option(arg, "--pixel-threshold=", config.pixel_threshold);
        } else if (arg.find("--min-area=") == 0) {
            ok = parse_int_option(arg, "--min-area=", config.min_region_area);
        } else if (arg.find("--workers=") == 0) {
            ok = parse_int_option(arg, "--workers=", config.max_workers);
        } else {
            dcx_string value = get_option_value(arg, "--position-weight=");
            ok = value.is_double() || value.is_integer();
            if (ok) {
                config.position_weight = value.to_double();
            } else {
                std::cerr << "Invalid value for --position-weight= '" << value.c_str() << "'" << std::endl;
            }
        }
        if (!ok) {
            return 2;
        }
    }

    if (use_ssim) {
        config.use_ssim = true;
    }

    try {
        config.validate();
    } catch (const std::invalid_argument& e) {
        std::cerr << "Invalid configuration: " << e.what() << std::endl;
        return 2;
    }

    dcx_exclusion_zone_set zones;
    try {
        for (const std::string& name : presets) {
            zones.add(dcx_exclusion_zone_set::preset(name));
        }
        for (size_t i = 0; i < zone_specs.size(); ++i) {
            zones.add(parse_zone(zone_specs[i], i + 1));
        }
    } catch (const dcx_compare_exception& e) {
        std::cerr << e.what() << std::endl;
        return 2;
    } catch (const std::invalid_argument& e) {
        std::cerr << e.what() << std::endl;
        return 2;
    }

    dcx_thumbnail_cache cache;
    if (!cache_dir.empty() && !cache.open(cache_dir)) {
        std::cerr << "Continuing without thumbnail cache" << std::endl;
    }

    try {
        std::cout << "Loading documents..." << std::endl;
        dcx_document left = dcx_document::from_file(left_path, config, &cache);
        dcx_document right = dcx_document::from_file(right_path, config, &cache);
        std::cout << "  Left:  " << left.name().c_str() << " (" << left.page_count() << " pages)" << std::endl;
        std::cout << "  Right: " << right.name().c_str() << " (" << right.page_count() << " pages)" << std::endl;

        int workers = static_cast<int>(*config.max_workers);
        dcx_phash_provider provider(static_cast<int>(*config.hash_size));
        left.ensure_fingerprints(provider, workers);
        right.ensure_fingerprints(provider, workers);

        auto matcher = dcx_page_matcher::from_config(config);
        dcx_matching_result result = matcher.match(left, right,
            [quiet](size_t current, size_t total, const dcx_string& message) {
                if (!quiet && (current == 0 || current == total)) {
                    std::cout << "[match] " << message.c_str() << " (" << current << "/" << total << ")" << std::endl;
                }
            });

        if (*config.use_ssim) {
            matcher.refine_with_ssim(result, left.pages(), right.pages(),
                [quiet](size_t current, size_t total, const dcx_string& message) {
                    if (!quiet && current == total) {
                        std::cout << "[match] " << message.c_str() << " (" << current << "/" << total << ")" << std::endl;
                    }
                });
        }

        auto diff = dcx_image_diff::from_config(config);
        std::vector<dcx_pair_diff> diffs = matcher.diff_matched_pairs(result, left.pages(), right.pages(), diff, zones);

        size_t differing_pairs = 0;
        for (const dcx_pair_diff& d : diffs) {
            if (d.left_result.has_differences()) {
                differing_pairs++;
            }
        }

        if (!quiet) {
            std::cout << std::endl;
            for (const dcx_match_result& match : result.matches()) {
                switch (match.get_status()) {
                    case dcx_match_result::matched: {
                        const dcx_pair_diff* pair = nullptr;
                        for (const dcx_pair_diff& d : diffs) {
                            if (d.left_index == match.left() && d.right_index == match.right()) {
                                pair = &d;
                            }
                        }
                        std::cout << "  L" << std::setw(4) << std::left << (match.left() + 1)
                                  << " <-> R" << std::setw(4) << (match.right() + 1) << std::right
                                  << " distance " << std::setw(3) << *match.phash_distance
                                  << "  similarity " << std::fixed << std::setprecision(3) << *match.similarity;
                        if (pair != nullptr && pair->left_result.has_differences()) {
                            std::cout << "  DIFF (" << pair->left_result.diff_count() << " regions)";
                        }
                        if (*match.is_manual) {
                            std::cout << "  manual";
                        }
                        std::cout << std::endl;
                        break;
                    }
                    case dcx_match_result::unmatched_left:
                        std::cout << "  L" << std::setw(4) << std::left << (match.left() + 1) << std::right
                                  << "  only in left document" << std::endl;
                        break;
                    case dcx_match_result::unmatched_right:
                        std::cout << "  R" << std::setw(4) << std::left << (match.right() + 1) << std::right
                                  << "  only in right document" << std::endl;
                        break;
                }
            }
        }

        std::cout << std::endl;
        std::cout << "Summary:" << std::endl;
        std::cout << "  Matched pairs:        " << result.matched_count() << std::endl;
        std::cout << "  Pairs with changes:   " << differing_pairs << std::endl;
        std::cout << "  Unmatched left:       " << result.left_unmatched().size() << std::endl;
        std::cout << "  Unmatched right:      " << result.right_unmatched().size() << std::endl;

        bool output_ok = true;
        if (!session_path.empty()) {
            dcx_session session;
            session.left_document_path = dcx_string(left_path);
            session.right_document_path = dcx_string(right_path);
            session.set_matching_result(result);
            session.exclusion_zones() = zones;
            output_ok = session.save(session_path) && output_ok;
        }
        if (!html_path.empty()) {
            dcx_report_to_html report;
            output_ok = report.write(html_path, left, right, result, diffs, zones) && output_ok;
        }
        if (!output_ok) {
            return 2;
        }

        bool has_differences = differing_pairs > 0 ||
                               !result.left_unmatched().empty() ||
                               !result.right_unmatched().empty();
        return has_differences ? 1 : 0;

    } catch (const dcx_compare_exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "Unexpected error: " << e.what() << std::endl;
        return 2;
    }
}
