#include "index_io.hpp"
#include "errors.hpp"
#include "logger.hpp"

#include <format>
#include <fstream>
#include <ostream>
#include <set>
#include <string>
#include <vector>

namespace doppel {

using nlohmann::json;

json indexToJson(const HashIndex& index)
{
    json out = json::object();
    for (const auto& [fp, paths] : index) {
        out[fp.toHex()] = paths;
    }
    return out;
}

HashIndex indexFromJson(const json& in, std::string_view source)
{
    if (!in.is_object()) {
        throw IndexFormatError(std::format("{}: top level must be a JSON object", source));
    }

    HashIndex index;
    size_t legacyEntries = 0;

    for (const auto& [key, value] : in.items()) {
        try {
            if (value.is_array()) {
                const auto fp = Fingerprint::fromHex(key);
                for (const auto& path : value) {
                    if (!path.is_string()) {
                        throw IndexFormatError(std::format("paths under '{}' must be strings", key));
                    }
                    index.insert(fp, path.get<std::string>());
                }
            }
            else if (value.is_string()) {
                index.insert(Fingerprint::fromHex(value.get<std::string>()), key);
                ++legacyEntries;
            }
            else {
                throw IndexFormatError(std::format("entry '{}' must map to a list of paths", key));
            }
        }
        catch (const IndexFormatError& e) {
            throw IndexFormatError(std::format("{}: {}", source, e.what()));
        }
    }

    if (legacyEntries > 0) {
        DOPPEL_INFO("index", std::string(source), ": read ", legacyEntries, " legacy path->fingerprint entries");
    }
    return index;
}

HashIndex loadIndex(const std::filesystem::path& path)
{
    std::ifstream in(path);
    if (!in) {
        throw IndexFormatError(std::format("Cannot open index file '{}'", path.string()));
    }

    // Keys seen per open object; a repeated key would silently replace earlier paths
    std::vector<std::set<std::string>> openObjects;
    const json::parser_callback_t rejectDuplicateKeys = [&](int, json::parse_event_t event, json& parsed) {
        switch (event) {
        case json::parse_event_t::object_start:
            openObjects.emplace_back();
            break;
        case json::parse_event_t::object_end:
            openObjects.pop_back();
            break;
        case json::parse_event_t::key:
            if (!openObjects.back().insert(parsed.get<std::string>()).second) {
                throw IndexFormatError(
                    std::format("{}: duplicate key '{}'", path.string(), parsed.get<std::string>()));
            }
            break;
        default:
            break;
        }
        return true;
    };

    json parsed;
    try {
        parsed = json::parse(in, rejectDuplicateKeys);
    }
    catch (const json::parse_error& e) {
        throw IndexFormatError(std::format("{}: invalid JSON ({})", path.string(), e.what()));
    }

    auto index = indexFromJson(parsed, path.string());
    DOPPEL_DEBUG("index", "Loaded ", index.size(), " fingerprint(s) from ", path.string());
    return index;
}

void saveIndex(const HashIndex& index, std::ostream& out)
{
    out << dumpJson(indexToJson(index), "index") << '\n';
    if (!out) {
        throw std::runtime_error("Failed to write index");
    }
}

std::string dumpJson(const json& value, std::string_view what)
{
    try {
        return value.dump();
    }
    catch (const json::type_error& e) {
        if (e.id != 316) throw; // 316: invalid UTF-8
        DOPPEL_WARN("index", what, " holds paths that are not valid UTF-8; invalid bytes written as U+FFFD");
        return value.dump(-1, ' ', false, json::error_handler_t::replace);
    }
}

} // namespace doppel
