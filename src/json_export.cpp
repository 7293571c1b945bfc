/**
 * @file json_export.cpp
 * @brief nlohmann/json conversions for the analyzer model types.
 */

#include <rasx/json_export.h>

namespace rasx {

void to_json(json& j, const TraversalError& error) {
    j = json{{"path", error.path}, {"message", error.message}};
}

void to_json(json& j, const TreeNode& node) {
    j = json{{"name", node.name}, {"path", node.path}, {"type", NodeKindName(node.kind)},
             {"attributes", node.attributes}};
    if (node.IsGroup()) {
        j["children"] = node.children;
    } else {
        j["shape"] = node.shape ? json(*node.shape) : json(nullptr);
        j["dtype"] = node.dtype ? json(*node.dtype) : json(nullptr);
    }
    if (node.error) {
        j["error"] = *node.error;
    }
    if (!node.skipped.empty()) {
        j["skipped"] = node.skipped;
    }
}

void to_json(json& j, const FileInfo& info) {
    j = json{{"name", info.name},
             {"path", info.path},
             {"size_mb", info.size_mb},
             {"modified", info.modified},
             {"accessible", info.accessible},
             {"groups_count", info.groups_count},
             {"datasets_count", info.datasets_count}};
    if (info.error) {
        j["error"] = *info.error;
    }
}

void to_json(json& j, const FileStructure& structure) {
    j = json{{"file", structure.file_path},
             {"root", structure.root},
             {"total_groups", structure.total_groups},
             {"total_datasets", structure.total_datasets},
             {"errors", structure.errors}};
}

void to_json(json& j, const ExtractionResult& result) {
    j = json{{"file", result.file},
             {"geometry_data", result.geometry_data},
             {"results_data", result.results_data},
             {"metadata", result.metadata},
             {"extraction_summary", result.extraction_summary},
             {"extraction_status", result.extraction_status},
             {"pattern_table", result.pattern_table}};
}

void to_json(json& j, const DatasetDescription& description) {
    j = json{{"path", description.path},
             {"name", description.name},
             {"shape", description.shape},
             {"dtype", description.dtype},
             {"size", description.size},
             {"size_mb", description.size_mb},
             {"attributes", description.attributes}};
}

void to_json(json& j, const PatternTable& table) {
    json entries = json::array();
    for (const auto& entry : table.entries) {
        entries.push_back(
            json{{"bucket", DataBucketName(entry.bucket)}, {"key", entry.key}, {"substrings", entry.substrings}});
    }
    j = json{{"name", table.name}, {"version", table.version}, {"entries", std::move(entries)}};
}

json ToJson(const FileInfo& info) {
    json j = info;
    j["success"] = info.accessible;
    return j;
}

} // namespace rasx
