//
// input_discovery.hpp
// Expansion of input roots into persisted index files and candidate images
//

#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace doppel {

enum class InputKind {
    Index,          // persisted JSON index
    StandardImage,  // decodable by the general image codec
    RawImage        // camera raw, needs demosaicing
};

// Camera raw formats handled through LibRaw
inline constexpr std::string_view RAW_EXTENSIONS[] = { "nef", "cr2", "arw", "dng", "orf", "rw2" };

// Lower-cased extension without the leading dot ("" when there is none)
std::string normalizedExtension(const std::filesystem::path& path);

bool isRawExtension(std::string_view extension);

InputKind classifyInput(const std::filesystem::path& path);

struct DiscoveredInputs {
    std::vector<std::filesystem::path> indexFiles;
    std::vector<std::filesystem::path> images;

    size_t rawCount() const;
    bool empty() const { return indexFiles.empty() && images.empty(); }
};

/**
 * Walk every root recursively and classify the regular files found
 * @param roots Files or directories
 * @return Index files and images, each sorted
 * @throws std::runtime_error if a root does not exist or a directory cannot be scanned
 */
DiscoveredInputs collectInputs(const std::vector<std::filesystem::path>& roots);

} // namespace doppel
