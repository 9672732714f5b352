#include "image_hasher.hpp"
#include "errors.hpp"
#include "image_decoder.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <format>
#include <stdexcept>

#include <opencv2/imgproc.hpp>

namespace doppel {

namespace {

constexpr int HASH_SIZE = PerceptualHasher::HASH_SIZE;
constexpr int COEFFS = HASH_SIZE * HASH_SIZE;

cv::Mat toGray(const cv::Mat& image)
{
    cv::Mat gray;
    switch (image.channels()) {
        case 1: gray = image; break;
        case 3: cv::cvtColor(image, gray, cv::COLOR_BGR2GRAY); break;
        case 4: cv::cvtColor(image, gray, cv::COLOR_BGRA2GRAY); break;
        default:
            throw DecodeError(std::format("unsupported channel count {}", image.channels()));
    }
    return gray;
}

} // namespace

PerceptualHasher::PerceptualHasher(int freqFactor)
    : m_freqFactor(freqFactor)
{
    if (freqFactor < 1) {
        throw std::invalid_argument(std::format("freqFactor must be positive (received {})", freqFactor));
    }
}

Fingerprint PerceptualHasher::hashFile(const std::filesystem::path& path) const
{
    return hashImage(decodeImage(path));
}

Fingerprint PerceptualHasher::hashImage(const cv::Mat& image) const
{
    if (image.empty()) throw DecodeError("empty image");

    const int side = HASH_SIZE * m_freqFactor;

    cv::Mat small;
    cv::resize(toGray(image), small, cv::Size(side, side), 0, 0, cv::INTER_LANCZOS4);

    cv::Mat pixels;
    small.convertTo(pixels, CV_64F);

    cv::Mat coeffs;
    cv::dct(pixels, coeffs);

    // cv::dct is orthonormal; rescale the low-frequency block to the unnormalized
    // DCT-II (2 * sum) so the DC row and column weigh in like the common pHash tools
    const double dcScale = 2.0 * std::sqrt(static_cast<double>(side));
    const double acScale = std::sqrt(2.0 * side);

    std::array<double, COEFFS> low{};
    for (int r = 0; r < HASH_SIZE; ++r) {
        for (int c = 0; c < HASH_SIZE; ++c) {
            const double scale = (r == 0 ? dcScale : acScale) * (c == 0 ? dcScale : acScale);
            low[r * HASH_SIZE + c] = coeffs.at<double>(r, c) * scale;
        }
    }

    auto sorted = low;
    std::ranges::nth_element(sorted, sorted.begin() + COEFFS / 2);
    const double upper = sorted[COEFFS / 2];
    const double lower = *std::ranges::max_element(sorted.begin(), sorted.begin() + COEFFS / 2);
    const double median = (lower + upper) / 2.0;

    std::uint64_t bits = 0;
    for (double v : low) {
        bits = (bits << 1) | (v > median ? 1u : 0u);
    }
    return Fingerprint(bits);
}

} // namespace doppel
