//
// image_hasher.hpp
// Perceptual hashing primitive: decoded pixels -> 64-bit DCT fingerprint
//

#pragma once

#include "fingerprint.hpp"

#include <filesystem>
#include <opencv2/core.hpp>

namespace doppel {

class ImageHasher {
public:
    virtual ~ImageHasher() = default;

    /**
     * Decode and fingerprint one file
     * @throws DecodeError (or any std::exception) when the file cannot be processed
     */
    virtual Fingerprint hashFile(const std::filesystem::path& path) const = 0;
};

class PerceptualHasher : public ImageHasher {
public:
    static constexpr int HASH_SIZE = 8;
    static constexpr int DEFAULT_FREQ_FACTOR = 4;

    /**
     * @param freqFactor Oversampling before the DCT: images are reduced to
     *                   (8 * freqFactor) x (8 * freqFactor) pixels
     */
    explicit PerceptualHasher(int freqFactor = DEFAULT_FREQ_FACTOR);

    Fingerprint hashFile(const std::filesystem::path& path) const override;

    // Fingerprint of an already decoded image (any depth, 1 to 4 channels)
    Fingerprint hashImage(const cv::Mat& image) const;

    int freqFactor() const { return m_freqFactor; }

private:
    int m_freqFactor;
};

} // namespace doppel
