#ifndef DCX_PAGE_H
#define DCX_PAGE_H

#include "../comparison/fingerprint/dcx_fingerprint.h"
#include <opencv2/core.hpp>
#include <vector>

/**
 * One rendered page. Owns its thumbnail; the fingerprint is computed once by
 * dcx_ensure_fingerprints() and kept until invalidate_fingerprint().
 */
class dcx_page {
private:
    int page_index;
    cv::Mat thumbnail_image;
    dcx_fingerprint page_fingerprint;
    bool attempted;

public:
    dcx_page(int index, const cv::Mat& thumbnail);

    int index() const { return page_index; }
    const cv::Mat& thumbnail() const { return thumbnail_image; }
    bool has_thumbnail() const { return !thumbnail_image.empty(); }

    bool has_fingerprint() const { return !page_fingerprint.empty(); }
    const dcx_fingerprint& fingerprint() const { return page_fingerprint; }

    // True once a computation ran, whether it succeeded or not
    bool fingerprint_attempted() const { return attempted; }

    /**
     * Computes the fingerprint unless an attempt was already made.
     * A failing page is logged and keeps an empty fingerprint.
     * @return true if the page has a fingerprint afterwards
     */
    bool compute_fingerprint(const dcx_fingerprint_provider& provider);

    void set_fingerprint(const dcx_fingerprint& fingerprint);
    void invalidate_fingerprint();
};

/**
 * Fingerprints every page that has not been attempted yet, one task per page
 * on up to max_workers threads. Returns the number of pages without a
 * fingerprint afterwards.
 */
size_t dcx_ensure_fingerprints(std::vector<dcx_page>& pages,
                               const dcx_fingerprint_provider& provider,
                               int max_workers = 4);

// Shrinks an image into max_width x max_height keeping the aspect ratio; never upscales
cv::Mat dcx_make_thumbnail(const cv::Mat& image, int max_width, int max_height);

// Flat grey (200, 200, 200) page standing in for one that could not be rendered
cv::Mat dcx_placeholder_thumbnail(int width, int height);

#endif // DCX_PAGE_H
