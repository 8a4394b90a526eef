#ifndef DCX_PAGE_MATCHER_H
#define DCX_PAGE_MATCHER_H

#include "dcx_assignment_solver.h"
#include "dcx_candidate_builder.h"
#include "dcx_match_result.h"
#include "../diff/dcx_image_diff.h"
#include "../dcx_compare_config.h"
#include "../../documents/dcx_document.h"
#include <vector>

// Diff of one matched pair, highlighted on each side's own pixels
struct dcx_pair_diff {
    int left_index;
    int right_index;
    dcx_diff_result left_result;    // left against right, left zones
    dcx_diff_result right_result;   // right against left, right zones
};

/**
 * Page matching pipeline: candidate builder, then assignment solver.
 *
 * Fingerprints are a precondition. Run dcx_ensure_fingerprints() (or
 * dcx_document::ensure_fingerprints()) on both sides first; match() refuses
 * pages that were never fingerprinted instead of hashing them on the fly.
 * Pages whose fingerprint failed are allowed and end up unmatched.
 */
class dcx_page_matcher {
private:
    int phash_threshold;
    double position_weight;
    int max_workers;

public:
    dcx_page_matcher(int phash_threshold = 20, double position_weight = 0.1, int max_workers = 4);

    static dcx_page_matcher from_config(const dcx_compare_config& config);

    /**
     * @throws dcx_fingerprint_missing_error if a page with a thumbnail has
     *         not been through ensure_fingerprints
     */
    dcx_matching_result match(const std::vector<dcx_page>& left,
                              const std::vector<dcx_page>& right,
                              const dcx_progress_callback& progress = nullptr) const;

    dcx_matching_result match(const dcx_document& left, const dcx_document& right,
                              const dcx_progress_callback& progress = nullptr) const;

    // Same pipeline on bare fingerprints; empty entries count as missing
    dcx_matching_result match_fingerprints(const std::vector<dcx_fingerprint>& left,
                                           const std::vector<dcx_fingerprint>& right,
                                           const dcx_progress_callback& progress = nullptr) const;

    /**
     * Diffs every MATCHED pair in both directions. Similarities are left alone.
     * @return one entry per matched pair, in result order
     */
    std::vector<dcx_pair_diff> diff_matched_pairs(const dcx_matching_result& result,
                                                  const std::vector<dcx_page>& left,
                                                  const std::vector<dcx_page>& right,
                                                  const dcx_image_diff& diff,
                                                  const dcx_exclusion_zone_set& zones) const;

    /**
     * Replaces the similarity of every MATCHED pair with the SSIM of its two
     * thumbnails. Pairs with a missing thumbnail keep their pHash similarity.
     * @return number of pairs refined
     */
    size_t refine_with_ssim(dcx_matching_result& result,
                            const std::vector<dcx_page>& left,
                            const std::vector<dcx_page>& right,
                            const dcx_progress_callback& progress = nullptr) const;

    // Mean SSIM of two images, both scaled down to the smaller width and height, clamped to [0, 1]
    static double ssim(const cv::Mat& a, const cv::Mat& b);

    static void check_fingerprints(const std::vector<dcx_page>& pages, const dcx_string& side);
};

#endif // DCX_PAGE_MATCHER_H
