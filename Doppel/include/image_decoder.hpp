//
// image_decoder.hpp
// Decoding of standard (OpenCV) and camera raw (LibRaw) images to 8-bit grayscale
//

#pragma once

#include <filesystem>
#include <opencv2/core.hpp>

namespace doppel {

/**
 * Decode any supported image, choosing the codec from the file extension
 * @return Single-channel 8-bit image
 * @throws DecodeError if the file cannot be read or decoded
 */
cv::Mat decodeImage(const std::filesystem::path& path);

// General codecs through cv::imread. Pixels are taken as stored (EXIF orientation ignored).
cv::Mat decodeStandardImage(const std::filesystem::path& path);

// Camera raw through LibRaw with camera white balance at half resolution
cv::Mat decodeRawImage(const std::filesystem::path& path);

} // namespace doppel
