#ifndef RASX_TREE_NODE_H
#define RASX_TREE_NODE_H

/**
 * @file tree_node.h
 * @brief Read-only snapshots produced by the analyzer.
 *
 * @note Paths: POSIX-style with '/' separators; the root is "/".
 * @note Every structure here is built per request and never shared or cached.
 */

#include <rasx/errors.h>

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace rasx {

enum class NodeKind { Group, Dataset };

/** @return "group" or "dataset". */
const char* NodeKindName(NodeKind kind) noexcept;

//-----------------------------------------------------------------------------
// TreeNode
//-----------------------------------------------------------------------------
struct TreeNode {
    std::string name;
    std::string path;                              ///< Ancestor names joined by '/'
    NodeKind kind = NodeKind::Group;
    std::vector<TreeNode> children;                ///< Groups only, in file link order
    std::map<std::string, std::string> attributes; ///< Stringified attribute values
    std::optional<std::vector<uint64_t>> shape;    ///< Datasets only; empty for scalars
    std::optional<std::string> dtype;              ///< Datasets only
    std::optional<std::string> error;              ///< Partial failure on this node
    std::vector<TraversalError> skipped;           ///< Child entries that could not be visited

    [[nodiscard]] bool IsGroup() const noexcept { return kind == NodeKind::Group; }
    [[nodiscard]] bool IsDataset() const noexcept { return kind == NodeKind::Dataset; }
};

/**
 * @brief Join a parent path and a child link name ("/" + "A" -> "/A").
 */
std::string JoinPath(const std::string& parent, const std::string& name);

/**
 * @brief Count the nodes below (not including) @p root.
 * @param[out] groups Number of group nodes.
 * @param[out] datasets Number of dataset nodes.
 */
void CountTreeNodes(const TreeNode& root, size_t& groups, size_t& datasets);

/**
 * @brief Dataset paths in depth-first pre-order.
 */
std::vector<std::string> CollectDatasetPaths(const TreeNode& root);

//-----------------------------------------------------------------------------
// FileInfo
//-----------------------------------------------------------------------------
struct FileInfo {
    std::string name;
    std::string path;                 ///< Absolute, lexically normalized
    double size_mb = 0.0;
    std::string modified;             ///< ISO-8601 UTC, e.g. "2024-05-01T12:00:00Z"
    bool accessible = false;
    size_t groups_count = 0;          ///< Root group excluded
    size_t datasets_count = 0;
    std::optional<std::string> error;
};

//-----------------------------------------------------------------------------
// FileStructure
//-----------------------------------------------------------------------------
struct FileStructure {
    std::string file_path;
    TreeNode root;
    size_t total_groups = 0;          ///< Root group excluded
    size_t total_datasets = 0;
    std::vector<TraversalError> errors;
};

//-----------------------------------------------------------------------------
// ExtractionResult
//-----------------------------------------------------------------------------
struct ExtractionResult {
    std::string file;
    std::map<std::string, std::vector<double>> geometry_data;
    std::map<std::string, std::vector<double>> results_data;
    std::map<std::string, std::string> metadata;
    std::map<std::string, size_t> extraction_summary;
    std::map<std::string, std::string> extraction_status;  ///< "Found" / "Not Found" per pattern key
    std::string pattern_table;        ///< "<name> v<version>"
};

/**
 * @brief Render an extraction summary count as the checklist label.
 * @return "Found" if @p key is present with a non-zero count, otherwise "Not Found".
 */
std::string SummaryStatus(const ExtractionResult& result, const std::string& key);

//-----------------------------------------------------------------------------
// DatasetDescription
//-----------------------------------------------------------------------------
struct DatasetDescription {
    std::string path;
    std::string name;
    std::vector<uint64_t> shape;
    std::string dtype;
    uint64_t size = 0;                ///< Element count
    double size_mb = 0.0;             ///< size * element byte width
    std::map<std::string, std::string> attributes;
};

} // namespace rasx

#endif // RASX_TREE_NODE_H
