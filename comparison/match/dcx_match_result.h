#ifndef DCX_MATCH_RESULT_H
#define DCX_MATCH_RESULT_H

#include "../../utils/dcx_model.h"
#include <set>
#include <vector>

// Index value meaning "no page on this side"
const int dcx_no_page = -1;

/**
 * Outcome for one page pair or one unpaired page.
 * MATCHED has both indices, UNMATCHED_LEFT only left_index,
 * UNMATCHED_RIGHT only right_index; the absent index is null.
 */
class dcx_match_result : public dcx_model {
public:
    enum status_type { matched, unmatched_left, unmatched_right };

    dcxp_int(left_index);
    dcxp_int(right_index);
    dcxp_string(status);        // "matched", "unmatched_left", "unmatched_right"
    dcxp_double(similarity);    // 0.0-1.0
    dcxp_int(phash_distance);
    dcxp_bool(is_manual);

    static dcx_match_result make_matched(int left, int right, double similarity,
                                         int distance, bool manual = false);
    static dcx_match_result make_unmatched_left(int left, bool manual = false);
    static dcx_match_result make_unmatched_right(int right, bool manual = false);

    status_type get_status() const;
    bool is_matched() const { return get_status() == matched; }

    // dcx_no_page when absent
    int left() const;
    int right() const;

    // Unmatched pages always count as a difference, pairs below 0.99 similarity too
    bool has_difference() const;

    /**
     * @throws dcx_invalid_session_error when status and indices disagree
     */
    void validate() const;

    /**
     * Reads the structured form; similarity, phash_distance and is_manual
     * default to 0.0, 0 and false.
     * @throws dcx_invalid_session_error
     */
    static dcx_match_result from_map(const dcxv_map& values);

    static dcx_string status_to_string(status_type s);
    static status_type status_from_string(const dcx_string& text);

private:
    dcx_match_result() = default;
};

// (left, right, similarity) of a MATCHED result
struct dcx_matched_pair {
    int left_index;
    int right_index;
    double similarity;
};

/**
 * Complete output of one matching run.
 * Every left index appears in exactly one result, as the left side of a
 * MATCHED result or as UNMATCHED_LEFT; the same holds for right indices.
 * The unmatched index sets always mirror the result list.
 */
class dcx_matching_result {
private:
    std::vector<dcx_match_result> results;
    std::set<int> left_unmatched_set;
    std::set<int> right_unmatched_set;

    void index_result(const dcx_match_result& result);
    void unindex_result(const dcx_match_result& result);

public:
    void add(const dcx_match_result& result);

    // Left-indexed results by left index, then unmatched right pages by right index
    void sort_matches();

    const std::vector<dcx_match_result>& matches() const { return results; }
    size_t size() const { return results.size(); }
    bool empty() const { return results.empty(); }

    const std::set<int>& left_unmatched() const { return left_unmatched_set; }
    const std::set<int>& right_unmatched() const { return right_unmatched_set; }

    // First result referencing the index, nullptr if none
    const dcx_match_result* match_for_left(int left) const;
    const dcx_match_result* match_for_right(int right) const;

    std::vector<dcx_matched_pair> matched_pairs() const;
    size_t matched_count() const;
    size_t difference_count() const;

    /**
     * Manual override. Removes every result touching either index and
     * inserts one manual result: MATCHED with similarity 1.0 when both are
     * given, otherwise UNMATCHED for the one given index (pass dcx_no_page
     * for the other). Pages that lose their partner come back as automatic
     * unmatched entries.
     * @throws std::invalid_argument if both indices are dcx_no_page
     */
    void set_manual_match(int left, int right);

    /**
     * Removes the manual result with exactly these indices. Automatic
     * results are left alone. Freed pages come back as unmatched entries.
     * @return false if no such manual result exists
     */
    bool remove_manual_match(int left, int right);

    // Replaces the similarity of a MATCHED pair, e.g. with 1 - diff score
    bool update_similarity(int left, int right, double similarity);

    dcxv_map to_map() const;

    /**
     * Rebuilds a result from its structured form. The unmatched sets are
     * derived from the match list.
     * @throws dcx_invalid_session_error for inconsistent or duplicate entries
     */
    static dcx_matching_result from_map(const dcxv_map& values);

    bool operator==(const dcx_matching_result& other) const;
    bool operator!=(const dcx_matching_result& other) const { return !(*this == other); }
};

#endif // DCX_MATCH_RESULT_H
