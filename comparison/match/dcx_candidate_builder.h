#ifndef DCX_CANDIDATE_BUILDER_H
#define DCX_CANDIDATE_BUILDER_H

#include "../fingerprint/dcx_fingerprint.h"
#include "../../documents/dcx_page.h"
#include <functional>
#include <map>
#include <utility>
#include <vector>

// Page pair that is close enough to be considered by the solver
struct dcx_match_candidate {
    int left_index;
    int right_index;
    int hash_distance;
    double similarity;   // 1 - distance / bit length, clamped to [0, 1]
};

typedef std::map<std::pair<int, int>, dcx_match_candidate> dcx_candidate_map;

// Coarse progress feedback; may be called from any worker thread
typedef std::function<void(size_t current, size_t total, const dcx_string& message)> dcx_progress_callback;

/**
 * Pairwise Hamming distances between two page sequences, keeping only pairs
 * within the threshold. Missing fingerprints (empty) and pairs of unequal
 * bit length are skipped.
 */
class dcx_candidate_builder {
private:
    int phash_threshold;
    int max_workers;

public:
    static const size_t progress_interval = 100;

    explicit dcx_candidate_builder(int phash_threshold = 20, int max_workers = 1);

    int threshold() const { return phash_threshold; }

    dcx_candidate_map build(const std::vector<dcx_fingerprint>& left,
                            const std::vector<dcx_fingerprint>& right,
                            const dcx_progress_callback& progress = nullptr) const;

    dcx_candidate_map build(const std::vector<dcx_page>& left,
                            const std::vector<dcx_page>& right,
                            const dcx_progress_callback& progress = nullptr) const;

    static double similarity_for(int distance, size_t bit_length);
};

#endif // DCX_CANDIDATE_BUILDER_H
