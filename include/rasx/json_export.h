#ifndef RASX_JSON_EXPORT_H
#define RASX_JSON_EXPORT_H

/**
 * @file json_export.h
 * @brief JSON rendering of analyzer results (nlohmann/json).
 *
 * Facade results render as tagged records: {"success": true, ...payload}
 * for object payloads, {"success": true, "<key>": [...]} for sequences, and
 * {"success": false, "error": "..."} on failure.
 */

#include <rasx/analyzer.h>
#include <rasx/pattern_table.h>
#include <rasx/tree_node.h>

#include <nlohmann/json.hpp>

namespace rasx {

using json = nlohmann::json;

// ADL hooks picked up by nlohmann::json conversions.
void to_json(json& j, const TraversalError& error);
void to_json(json& j, const TreeNode& node);
void to_json(json& j, const FileInfo& info);
void to_json(json& j, const FileStructure& structure);
void to_json(json& j, const ExtractionResult& result);
void to_json(json& j, const DatasetDescription& description);
void to_json(json& j, const PatternTable& table);

/**
 * @brief Render a facade result as a tagged record.
 * @param payload_key Key holding non-object payloads (lists of paths, values, files).
 */
template <class T>
json ToJson(const Result<T>& result, const char* payload_key = "data") {
    if (!result.success || !result.value) {
        return json{{"success", false}, {"error", result.error}};
    }
    json payload = *result.value;
    if (payload.is_object()) {
        payload["success"] = true;
        return payload;
    }
    return json{{"success", true}, {payload_key, std::move(payload)}};
}

/// Info never fails outright; success mirrors FileInfo::accessible.
json ToJson(const FileInfo& info);

} // namespace rasx

#endif // RASX_JSON_EXPORT_H
