#ifndef DCX_IMAGE_DIFF_H
#define DCX_IMAGE_DIFF_H

#include "../zones/dcx_exclusion_zone.h"
#include "../dcx_compare_config.h"
#include <opencv2/core.hpp>
#include <vector>

// Bounding box of one connected difference blob, in pixels of the compared size
struct dcx_diff_region {
    int x;
    int y;
    int width;
    int height;
    double area;        // contour area
    double intensity;   // mean difference inside the box, 0.0-1.0

    cv::Rect rect() const { return cv::Rect(x, y, width, height); }
    // (x1, y1, x2, y2)
    cv::Vec4i bounds() const { return cv::Vec4i(x, y, x + width, y + height); }
};

struct dcx_diff_result {
    double diff_score = 0.0;                 // fraction of pixels above threshold
    std::vector<dcx_diff_region> regions;
    cv::Mat diff_image;                      // 8UC1 absolute difference, zones zeroed
    cv::Mat highlight_image;                 // 8UC3 first image with regions marked

    // Either condition is enough on its own
    bool has_differences() const { return diff_score > 0.01 || !regions.empty(); }
    size_t diff_count() const { return regions.size(); }
};

/**
 * Region based visual diff of two page images.
 *
 * Both images are scaled up to the larger of the two sizes, converted to
 * grayscale and subtracted. Exclusion zones are zeroed in the difference
 * map before thresholding, so they never reach the score or the regions.
 */
class dcx_image_diff {
private:
    int pixel_threshold;
    int min_region_area;
    cv::Scalar highlight_bgr;
    double highlight_alpha;
    int border_thickness;

public:
    dcx_image_diff(int pixel_threshold = 30, int min_region_area = 100,
                   const cv::Scalar& highlight_rgb = cv::Scalar(255, 0, 0),
                   double highlight_alpha = 0.5, int border_thickness = 2);

    static dcx_image_diff from_config(const dcx_compare_config& config);

    int threshold() const { return pixel_threshold; }
    int min_area() const { return min_region_area; }

    /**
     * Compares first against second; the highlight is drawn on first.
     * Disabled zones are ignored.
     * @throws dcx_invalid_image_error for empty or unsupported images
     * @throws dcx_invalid_zone_error for an enabled zone outside the page
     */
    dcx_diff_result compare(const cv::Mat& first, const cv::Mat& second,
                            const std::vector<dcx_exclusion_zone>& zones = std::vector<dcx_exclusion_zone>()) const;

    // Uses the zones of the set that apply to the given side
    dcx_diff_result compare(const cv::Mat& first, const cv::Mat& second,
                            const dcx_exclusion_zone_set& zones, dcx_exclusion_zone::side s) const;

    /**
     * Both pages scaled to the taller height, placed on a white canvas with
     * gap pixels between them. With a diff result, its highlight image takes
     * the right slot.
     */
    static cv::Mat create_side_by_side(const cv::Mat& left, const cv::Mat& right,
                                       const dcx_diff_result* diff = nullptr, int gap = 10);

    // 8UC3 BGR copy of an 8UC1/8UC3/8UC4 image
    static cv::Mat to_bgr(const cv::Mat& image, const dcx_string& argument);
};

#endif // DCX_IMAGE_DIFF_H
