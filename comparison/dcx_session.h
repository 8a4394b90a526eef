#ifndef DCX_SESSION_H
#define DCX_SESSION_H

#include "../utils/dcx_model.h"
#include "match/dcx_match_result.h"
#include "zones/dcx_exclusion_zone.h"

/**
 * Saved state of one comparison: which documents, the (possibly manually
 * edited) matching and the exclusion zones.
 *
 * File layout:
 *   {version, left_document_path, right_document_path,
 *    matching_result | null, exclusion_zones: {zones: [...]},
 *    created_at, modified_at, notes}
 */
class dcx_session : public dcx_model {
public:
    dcxp_string(version);
    dcxp_string(left_document_path);    // null when unset
    dcxp_string(right_document_path);
    dcxp_string(created_at);            // ISO 8601 local time
    dcxp_string(modified_at);
    dcxp_string(notes);

    static const char* const current_version;

    dcx_session();

    bool has_documents() const;

    bool has_matching_result() const { return has_matching; }
    const dcx_matching_result& matching_result() const { return matching; }
    dcx_matching_result& matching_result() { return matching; }
    void set_matching_result(const dcx_matching_result& result);
    void clear_matching_result();

    dcx_exclusion_zone_set& exclusion_zones() { return zones; }
    const dcx_exclusion_zone_set& exclusion_zones() const { return zones; }

    // Drops documents, matching, zones and notes
    void clear_session();

    // modified_at = now
    void touch();

    dcxv_map to_session_map() const;

    /**
     * Missing keys take defaults; timestamps default to now.
     * @throws dcx_invalid_session_error for wrong types or broken invariants
     */
    static dcx_session from_session_map(const dcxv_map& values);

    /**
     * Creates parent directories and refreshes modified_at.
     * @return false if the file cannot be written
     */
    bool save(const dcx_string& path);

    /**
     * @throws dcx_invalid_session_error if the file is missing, not JSON,
     *         or not a valid session
     */
    static dcx_session load(const dcx_string& path);

private:
    dcx_matching_result matching;
    bool has_matching;
    dcx_exclusion_zone_set zones;
};

#endif // DCX_SESSION_H
