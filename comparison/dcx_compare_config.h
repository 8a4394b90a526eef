#ifndef DCX_COMPARE_CONFIG_H
#define DCX_COMPARE_CONFIG_H

#include "../utils/dcx_model.h"

/**
 * Tunables for matching, diffing and page loading.
 * Start from defaults(), then layer apply_env() and load_json() on top.
 */
class dcx_compare_config : public dcx_model {
public:
    // matching
    dcxp_int(phash_threshold);      // max Hamming distance for a candidate pair
    dcxp_double(position_weight);   // weight of the relative position penalty
    dcxp_int(hash_size);            // fingerprint side, bit length = hash_size^2
    dcxp_bool(use_ssim);            // replace pHash similarity of matched pairs with SSIM

    // diff
    dcxp_int(pixel_threshold);      // 0-255, a pixel differs when above
    dcxp_int(min_region_area);      // contour area filter in pixels
    dcxp_int(highlight_r);
    dcxp_int(highlight_g);
    dcxp_int(highlight_b);
    dcxp_double(highlight_alpha);   // 0.0-1.0

    // loading
    dcxp_int(max_workers);
    dcxp_int(thumbnail_width);
    dcxp_int(thumbnail_height);
    dcxp_int(render_dpi);

    static dcx_compare_config defaults() {
        dcx_compare_config config;
        config.phash_threshold = 20;
        config.position_weight = 0.1;
        config.hash_size = 16;
        config.use_ssim = false;
        config.pixel_threshold = 30;
        config.min_region_area = 100;
        config.highlight_r = 255;
        config.highlight_g = 0;
        config.highlight_b = 0;
        config.highlight_alpha = 0.5;
        config.max_workers = 4;
        config.thumbnail_width = 1200;
        config.thumbnail_height = 900;
        config.render_dpi = 216;
        return config;
    }

    /**
     * Overrides values from DCX_PHASH_THRESHOLD, DCX_POSITION_WEIGHT,
     * DCX_HASH_SIZE, DCX_PIXEL_THRESHOLD, DCX_MIN_REGION_AREA,
     * DCX_MAX_WORKERS and DCX_RENDER_DPI. Unparsable values are skipped
     * with a warning.
     * @return number of variables applied
     */
    int apply_env();

    /**
     * Reads any subset of the keys above from a JSON object file.
     * @return false if the file cannot be read or a value has the wrong type
     */
    bool load_json(const dcx_string& path);

    /**
     * @throws std::invalid_argument naming the first offending key
     */
    void validate() const;
};

#endif // DCX_COMPARE_CONFIG_H
