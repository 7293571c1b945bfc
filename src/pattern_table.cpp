/**
 * @file pattern_table.cpp
 * @brief Built-in HEC-RAS pattern table and matching.
 */

#include <rasx/pattern_table.h>

#include <algorithm>
#include <cctype>

namespace rasx {

const char* DataBucketName(DataBucket bucket) noexcept {
    return bucket == DataBucket::Geometry ? "geometry" : "results";
}

std::string ToLower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

std::string PatternTable::Label() const { return name + " v" + std::to_string(version); }

const PatternEntry* PatternTable::Match(const std::string& dataset_path) const {
    const std::string lower_path = ToLower(dataset_path);
    for (const auto& entry : entries) {
        for (const auto& substring : entry.substrings) {
            if (!substring.empty() && lower_path.find(ToLower(substring)) != std::string::npos) {
                return &entry;
            }
        }
    }
    return nullptr;
}

PatternTable DefaultHecRasPatterns() {
    PatternTable table;
    table.name = "hecras";
    table.version = 1;
    table.entries = {
        {DataBucket::Geometry, "mesh_nodes", {"cells center coordinate", "2dmesh/nodes"}},
        {DataBucket::Geometry, "mesh_elements", {"cells facepoint indexes", "2dmesh/elements"}},
        {DataBucket::Geometry, "terrain", {"terrain", "2dterrain/elevation"}},
        {DataBucket::Results, "max_wse", {"maxwse", "max wse", "maximum water surface"}},
        {DataBucket::Results, "max_velocity", {"max velocity", "maxvel"}},
        {DataBucket::Results, "max_depth", {"maxdepth", "max depth"}},
    };
    return table;
}

} // namespace rasx
