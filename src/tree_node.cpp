/**
 * @file tree_node.cpp
 * @brief Helpers over the TreeNode snapshot.
 */

#include <rasx/tree_node.h>

namespace rasx {

const char* NodeKindName(NodeKind kind) noexcept {
    return kind == NodeKind::Group ? "group" : "dataset";
}

std::string JoinPath(const std::string& parent, const std::string& name) {
    if (parent.empty() || parent == "/") {
        return "/" + name;
    }
    return parent + "/" + name;
}

static void CountBelow(const TreeNode& node, size_t& groups, size_t& datasets) {
    for (const auto& child : node.children) {
        if (child.IsGroup()) {
            ++groups;
        } else {
            ++datasets;
        }
        CountBelow(child, groups, datasets);
    }
}

void CountTreeNodes(const TreeNode& root, size_t& groups, size_t& datasets) {
    groups = 0;
    datasets = 0;
    CountBelow(root, groups, datasets);
}

static void CollectPreOrder(const TreeNode& node, std::vector<std::string>& paths) {
    for (const auto& child : node.children) {
        if (child.IsDataset()) {
            paths.push_back(child.path);
        } else {
            CollectPreOrder(child, paths);
        }
    }
}

std::vector<std::string> CollectDatasetPaths(const TreeNode& root) {
    std::vector<std::string> paths;
    CollectPreOrder(root, paths);
    return paths;
}

std::string SummaryStatus(const ExtractionResult& result, const std::string& key) {
    const auto it = result.extraction_summary.find(key);
    return (it != result.extraction_summary.end() && it->second > 0) ? "Found" : "Not Found";
}

} // namespace rasx
