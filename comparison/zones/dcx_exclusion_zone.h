#ifndef DCX_EXCLUSION_ZONE_H
#define DCX_EXCLUSION_ZONE_H

#include "../../utils/dcx_model.h"
#include <opencv2/core.hpp>
#include <vector>

/**
 * Rectangle in normalized page coordinates (0.0-1.0) that the diff engine
 * ignores. Coordinates are validated on construction.
 */
class dcx_exclusion_zone : public dcx_model {
public:
    enum side { left, right, both };

    dcxp_double(x);
    dcxp_double(y);
    dcxp_double(width);
    dcxp_double(height);
    dcxp_string(name);
    dcxp_string(applies_to);   // "left", "right" or "both"
    dcxp_bool(enabled);

    /**
     * @throws dcx_invalid_zone_error if a coordinate is outside [0, 1]
     */
    dcx_exclusion_zone(double x, double y, double width, double height,
                       const dcx_string& name = "", side applies = both, bool enabled = true);

    /**
     * Normalizes a pixel rectangle against the page size.
     * @throws dcx_invalid_zone_error if the result leaves the page
     */
    static dcx_exclusion_zone from_pixels(int px, int py, int pw, int ph,
                                          int page_width, int page_height,
                                          const dcx_string& name = "", side applies = both);

    side target() const;
    void set_target(side applies);

    // Enabled and meant for this side (or both)
    bool applies_to_side(side s) const;

    // Pixel rectangle, each value truncated toward zero
    cv::Rect to_pixel_rect(int page_width, int page_height) const;

    // (x1, y1, x2, y2) in pixels
    cv::Vec4i to_rect(int page_width, int page_height) const;

    // Properties are public; anything that stores or applies a zone calls this first
    void validate() const;

    /**
     * Builds a zone from its structured form; missing name, applies_to and
     * enabled take their defaults.
     * @throws dcx_invalid_zone_error for bad coordinates or applies_to
     */
    static dcx_exclusion_zone from_map(const dcxv_map& values);

    static dcx_string side_to_string(side s);
    static side side_from_string(const dcx_string& text);
};

/**
 * Ordered collection of exclusion zones with the stock presets.
 */
class dcx_exclusion_zone_set {
private:
    std::vector<dcx_exclusion_zone> zones;

public:
    /**
     * @throws dcx_invalid_zone_error if the zone was edited out of range
     */
    void add(const dcx_exclusion_zone& zone);
    bool remove(size_t index);
    void clear() { zones.clear(); }

    size_t size() const { return zones.size(); }
    bool empty() const { return zones.empty(); }
    const dcx_exclusion_zone& at(size_t index) const { return zones.at(index); }
    const std::vector<dcx_exclusion_zone>& all() const { return zones; }

    // Enabled zones whose applies_to is the side or both
    std::vector<dcx_exclusion_zone> zones_for(dcx_exclusion_zone::side s) const;

    // {zones: [...]}
    dcxv_map to_map() const;
    static dcx_exclusion_zone_set from_map(const dcxv_map& values);

    /**
     * Stock zones: "page_number_bottom", "page_number_bottom_right",
     * "header", "footer", "slide_number".
     * @throws std::invalid_argument for unknown names
     */
    static dcx_exclusion_zone preset(const dcx_string& preset_name);
    static std::vector<dcx_string> preset_names();
};

#endif // DCX_EXCLUSION_ZONE_H
