#include "input_discovery.hpp"
#include "logger.hpp"

#include <algorithm>
#include <cctype>
#include <format>
#include <iterator>
#include <stdexcept>

namespace doppel {

namespace fs = std::filesystem;

std::string normalizedExtension(const fs::path& path)
{
    std::string ext = path.extension().string();
    if (ext.starts_with('.')) ext.erase(0, 1);
    std::ranges::transform(ext, ext.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext;
}

bool isRawExtension(std::string_view extension)
{
    return std::ranges::find(RAW_EXTENSIONS, extension) != std::end(RAW_EXTENSIONS);
}

InputKind classifyInput(const fs::path& path)
{
    const auto ext = normalizedExtension(path);
    if (ext == "json") return InputKind::Index;
    if (isRawExtension(ext)) return InputKind::RawImage;
    return InputKind::StandardImage;
}

size_t DiscoveredInputs::rawCount() const
{
    return static_cast<size_t>(std::ranges::count_if(images, [](const fs::path& p) {
        return classifyInput(p) == InputKind::RawImage;
    }));
}

DiscoveredInputs collectInputs(const std::vector<fs::path>& roots)
{
    DiscoveredInputs inputs;

    auto addFile = [&inputs](const fs::path& file) {
        if (classifyInput(file) == InputKind::Index) inputs.indexFiles.push_back(file);
        else inputs.images.push_back(file);
    };

    constexpr auto opts = fs::directory_options::skip_permission_denied;

    for (const auto& root : roots) {
        std::error_code ec;
        const auto status = fs::status(root, ec);
        if (ec || !fs::exists(status)) {
            throw std::runtime_error(std::format("Input '{}' does not exist", root.string()));
        }

        if (fs::is_regular_file(status)) {
            addFile(root);
            continue;
        }

        if (!fs::is_directory(status)) {
            DOPPEL_WARN("discovery", "Skipping unsupported input: ", root.string());
            continue;
        }

        try {
            for (const auto& entry : fs::recursive_directory_iterator(root, opts)) {
                if (entry.is_regular_file()) addFile(entry.path());
            }
        }
        catch (const fs::filesystem_error& e) {
            throw std::runtime_error(std::format("Error scanning directory '{}': {}", root.string(), e.what()));
        }
    }

    std::ranges::sort(inputs.indexFiles);
    std::ranges::sort(inputs.images);

    // The same file reachable from two roots is hashed once
    inputs.indexFiles.erase(std::unique(inputs.indexFiles.begin(), inputs.indexFiles.end()), inputs.indexFiles.end());
    inputs.images.erase(std::unique(inputs.images.begin(), inputs.images.end()), inputs.images.end());

    DOPPEL_DEBUG("discovery", "Found ", inputs.images.size(), " image(s) and ",
                 inputs.indexFiles.size(), " index file(s) under ", roots.size(), " root(s)");

    return inputs;
}

} // namespace doppel
