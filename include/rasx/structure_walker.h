#ifndef RASX_STRUCTURE_WALKER_H
#define RASX_STRUCTURE_WALKER_H

/**
 * @file structure_walker.h
 * @brief Best-effort recursive traversal of an HDF5 file into a TreeNode tree.
 *
 * The walk never aborts on a single bad entry: a child that cannot be opened
 * is skipped and recorded on its parent; a node whose attributes or type
 * cannot be read is kept with an error annotation.
 */

#include <rasx/h5_reader.h>
#include <rasx/tree_node.h>

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace rasx {

struct WalkOptions {
    /// Deepest group level whose children are listed (root = 0). Unbounded when empty.
    std::optional<int> max_depth;
    /// Copy attributes into TreeNode::attributes.
    bool include_attributes = true;
};

struct WalkResult {
    TreeNode root;
    size_t total_groups = 0;    ///< Root excluded
    size_t total_datasets = 0;
    std::vector<TraversalError> errors;
};

class StructureWalker {
  public:
    explicit StructureWalker(WalkOptions options = WalkOptions{});

    /**
     * @brief Walk the whole file starting at the root group.
     * @throws H5::Exception only if the root group itself cannot be opened.
     */
    [[nodiscard]] WalkResult Walk(const H5Reader& reader) const;

    [[nodiscard]] const WalkOptions& GetOptions() const noexcept { return options_; }

  private:
    /// Ok(node) or Skipped(error) for one child link; both empty for ignored entries.
    struct ChildOutcome {
        std::optional<TreeNode> node;
        std::optional<TraversalError> error;
    };

    void VisitGroup(const H5::Group& group, TreeNode& node, int depth,
                    std::vector<std::string>& ancestors, WalkResult& result) const;
    ChildOutcome VisitChild(const H5::Group& parent, const std::string& parent_path,
                            const std::string& name, int depth,
                            std::vector<std::string>& ancestors, WalkResult& result) const;
    void DescribeDataset(const H5::DataSet& dataset, TreeNode& node, WalkResult& result) const;
    void CollectAttributes(const H5::H5Object& object, TreeNode& node, WalkResult& result) const;

    WalkOptions options_;
};

/**
 * @brief Stringify every attribute of an object.
 *
 * Attributes that fail to read are described in @p failures and left out of
 * the returned map.
 */
std::map<std::string, std::string> ReadAttributes(const H5::H5Object& object,
                                                  std::vector<std::string>& failures);

/**
 * @brief Stringify one attribute value.
 *
 * Strings are returned as-is with trailing NUL/space padding removed, numbers
 * in decimal form, multi-element values as "[a, b, c]", enums by member name,
 * other classes as "<class>".
 * @throws H5::Exception on read failures.
 */
std::string AttributeToString(const H5::Attribute& attribute);

} // namespace rasx

#endif // RASX_STRUCTURE_WALKER_H
