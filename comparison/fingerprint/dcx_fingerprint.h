#ifndef DCX_FINGERPRINT_H
#define DCX_FINGERPRINT_H

#include "../../utils/dcx_string.h"
#include <cstdint>
#include <vector>

namespace cv {
    class Mat;
}

/**
 * Fixed-length bit vector describing the coarse structure of a page.
 * Fingerprints are only ever compared by Hamming distance.
 * A default-constructed fingerprint is empty and means "not computed".
 */
class dcx_fingerprint {
private:
    std::vector<uint64_t> words;
    size_t bits;

public:
    dcx_fingerprint() : bits(0) {}
    explicit dcx_fingerprint(size_t bit_count);

    size_t bit_length() const { return bits; }
    bool empty() const { return bits == 0; }

    bool bit(size_t index) const;
    void set_bit(size_t index, bool on);

    /**
     * Number of differing bits.
     * @throws std::invalid_argument if the bit lengths differ
     */
    int hamming_distance(const dcx_fingerprint& other) const;

    bool operator==(const dcx_fingerprint& other) const {
        return bits == other.bits && words == other.words;
    }
    bool operator!=(const dcx_fingerprint& other) const { return !(*this == other); }
};

/**
 * Turns a rasterized page into a fingerprint.
 * Implementations must be safe to call from several threads at once.
 */
class dcx_fingerprint_provider {
public:
    virtual ~dcx_fingerprint_provider() = default;

    /**
     * @throws dcx_invalid_image_error for empty or unsupported images
     */
    virtual dcx_fingerprint hash(const cv::Mat& image) const = 0;

    virtual size_t bit_length() const = 0;
};

/**
 * DCT perceptual hash.
 * The grayscale page is shrunk to (hash_size * highfreq_factor)^2, transformed
 * with a 2D DCT, and each coefficient of the top-left hash_size x hash_size
 * block becomes one bit: set when above the block median.
 */
class dcx_phash_provider : public dcx_fingerprint_provider {
private:
    int hash_size;
    int highfreq_factor;

public:
    explicit dcx_phash_provider(int hash_size = 16, int highfreq_factor = 4);

    dcx_fingerprint hash(const cv::Mat& image) const override;
    size_t bit_length() const override { return static_cast<size_t>(hash_size * hash_size); }
};

#endif // DCX_FINGERPRINT_H
