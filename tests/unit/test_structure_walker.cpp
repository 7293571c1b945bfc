/*********************************************************************
 * @file  test_structure_walker.cpp
 *
 * @brief Unit tests for H5Reader and StructureWalker.
 *********************************************************************/

#include <rasx/errors.h>
#include <rasx/h5_reader.h>
#include <rasx/structure_walker.h>

#include "h5_fixture.h"
#include "test_assert.h"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iostream>

using namespace rasx;
using rasx::testing::FixtureWriter;
using rasx::testing::TempFixturePath;

namespace {

const TreeNode* FindChild(const TreeNode& node, const std::string& name) {
    for (const auto& child : node.children) {
        if (child.name == name) return &child;
    }
    return nullptr;
}

size_t CountNonRoot(const TreeNode& node) {
    size_t n = 0;
    for (const auto& child : node.children) {
        n += 1 + CountNonRoot(child);
    }
    return n;
}

} // namespace

/**
 * @brief /Geometry and /Results with one dataset each.
 */
int TestScenarioCounts() {
    std::cout << "Running TestScenarioCounts..." << std::endl;

    const std::string path = TempFixturePath("walker_scenario.hdf");
    rasx::testing::WriteGeometryResultsFile(path);

    H5Reader reader(path);
    WalkResult result = StructureWalker().Walk(reader);

    ASSERT_EQ(result.total_groups, 2u);
    ASSERT_EQ(result.total_datasets, 2u);
    ASSERT_EQ(result.total_groups + result.total_datasets, CountNonRoot(result.root));
    ASSERT_TRUE(result.errors.empty());

    ASSERT_EQ(result.root.name, "/");
    ASSERT_EQ(result.root.path, "/");
    ASSERT_EQ(result.root.children.size(), 2u);
    ASSERT_EQ(result.root.children[0].name, "Geometry");
    ASSERT_EQ(result.root.children[1].name, "Results");

    const TreeNode* geometry = FindChild(result.root, "Geometry");
    ASSERT_TRUE(geometry != nullptr);
    ASSERT_TRUE(geometry->IsGroup());
    ASSERT_EQ(geometry->children.size(), 1u);

    const TreeNode& cells = geometry->children[0];
    ASSERT_TRUE(cells.IsDataset());
    ASSERT_EQ(cells.path, "/Geometry/Cells Center Coordinate");
    ASSERT_TRUE(cells.children.empty());
    ASSERT_TRUE(cells.shape.has_value());
    ASSERT_EQ(cells.shape->size(), 2u);
    ASSERT_EQ((*cells.shape)[0], 5u);
    ASSERT_EQ((*cells.shape)[1], 2u);
    ASSERT_EQ(*cells.dtype, "float64");

    ASSERT_EQ(result.root.attributes.at("File Type"), "HEC-RAS Results");

    size_t groups = 0;
    size_t datasets = 0;
    CountTreeNodes(result.root, groups, datasets);
    ASSERT_EQ(groups, result.total_groups);
    ASSERT_EQ(datasets, result.total_datasets);

    std::cout << "TestScenarioCounts passed!" << std::endl;
    return 0;
}

/**
 * @brief max_depth bounds which groups receive children.
 */
int TestMaxDepth() {
    std::cout << "Running TestMaxDepth..." << std::endl;

    const std::string path = TempFixturePath("walker_depth.hdf");
    {
        FixtureWriter writer(path);
        auto deep = writer.RequireGroup("/A/B/C");
        deep.WriteDataset("values", {1.0, 2.0}, {2});
    }

    H5Reader reader(path);

    WalkOptions zero;
    zero.max_depth = 0;
    WalkResult at_zero = StructureWalker(zero).Walk(reader);
    ASSERT_TRUE(at_zero.root.children.empty());
    ASSERT_EQ(at_zero.total_groups, 0u);
    ASSERT_EQ(at_zero.total_datasets, 0u);
    ASSERT_TRUE(at_zero.errors.empty());

    WalkOptions two;
    two.max_depth = 2;
    WalkResult at_two = StructureWalker(two).Walk(reader);
    ASSERT_EQ(at_two.total_groups, 2u);  // A, A/B
    ASSERT_EQ(at_two.total_datasets, 0u);
    const TreeNode* b = FindChild(at_two.root.children[0], "B");
    ASSERT_TRUE(b != nullptr);
    ASSERT_TRUE(b->children.empty());

    WalkResult unbounded = StructureWalker().Walk(reader);
    ASSERT_EQ(unbounded.total_groups, 3u);
    ASSERT_EQ(unbounded.total_datasets, 1u);

    std::cout << "TestMaxDepth passed!" << std::endl;
    return 0;
}

/**
 * @brief Children follow creation order when tracked, name order otherwise.
 */
int TestLinkOrder() {
    std::cout << "Running TestLinkOrder..." << std::endl;

    const std::string path = TempFixturePath("walker_order.hdf");
    {
        FixtureWriter writer(path);
        auto root = writer.Root();
        auto tracked = root.CreateGroup("tracked", true);
        tracked.WriteDataset("zeta", {1.0}, {1});
        tracked.WriteDataset("alpha", {1.0}, {1});
        tracked.WriteDataset("mid", {1.0}, {1});
        auto plain = root.CreateGroup("plain");
        plain.WriteDataset("zeta", {1.0}, {1});
        plain.WriteDataset("alpha", {1.0}, {1});
        plain.WriteDataset("mid", {1.0}, {1});
    }

    H5Reader reader(path);
    WalkResult result = StructureWalker().Walk(reader);

    const TreeNode* tracked = FindChild(result.root, "tracked");
    ASSERT_TRUE(tracked != nullptr);
    ASSERT_EQ(tracked->children.size(), 3u);
    ASSERT_EQ(tracked->children[0].name, "zeta");
    ASSERT_EQ(tracked->children[1].name, "alpha");
    ASSERT_EQ(tracked->children[2].name, "mid");

    const TreeNode* plain = FindChild(result.root, "plain");
    ASSERT_TRUE(plain != nullptr);
    ASSERT_EQ(plain->children[0].name, "alpha");
    ASSERT_EQ(plain->children[1].name, "mid");
    ASSERT_EQ(plain->children[2].name, "zeta");

    std::cout << "TestLinkOrder passed!" << std::endl;
    return 0;
}

/**
 * @brief Non-string attributes are stringified consistently.
 */
int TestAttributeStringification() {
    std::cout << "Running TestAttributeStringification..." << std::endl;

    const std::string path = TempFixturePath("walker_attrs.hdf");
    {
        FixtureWriter writer(path);
        auto root = writer.Root();
        root.WriteAttribute("Program Version", std::string("HEC-RAS 6.4"));
        root.WriteAttribute("Time Step", 2.5);
        root.WriteAttribute("Cell Count", 42LL);
        root.WriteAttribute("Extents", std::vector<double>{1.0, 2.5, -3.0});
        root.WriteFixedStringAttribute("Projection", "UTM", 8);
        root.WriteFloatAttribute("Tolerance", 0.1f);
    }

    H5Reader reader(path);
    WalkResult result = StructureWalker().Walk(reader);
    const auto& attrs = result.root.attributes;

    ASSERT_EQ(attrs.size(), 6u);
    ASSERT_EQ(attrs.at("Program Version"), "HEC-RAS 6.4");
    ASSERT_EQ(attrs.at("Time Step"), "2.5");
    ASSERT_EQ(attrs.at("Cell Count"), "42");
    ASSERT_EQ(attrs.at("Extents"), "[1, 2.5, -3]");
    ASSERT_EQ(attrs.at("Projection"), "UTM");
    ASSERT_EQ(attrs.at("Tolerance"), "0.1");
    ASSERT_FALSE(result.root.error.has_value());

    WalkOptions no_attrs;
    no_attrs.include_attributes = false;
    WalkResult bare = StructureWalker(no_attrs).Walk(reader);
    ASSERT_TRUE(bare.root.attributes.empty());

    std::cout << "TestAttributeStringification passed!" << std::endl;
    return 0;
}

/**
 * @brief Dangling soft links and ancestor cycles are skipped, not fatal.
 */
int TestBrokenLinksAreSkipped() {
    std::cout << "Running TestBrokenLinksAreSkipped..." << std::endl;

    const std::string path = TempFixturePath("walker_links.hdf");
    {
        FixtureWriter writer(path);
        auto root = writer.Root();
        root.LinkSoft("broken", "/does/not/exist");
        auto a = root.CreateGroup("A");
        a.WriteDataset("data", {1.0, 2.0, 3.0}, {3});
        auto b = a.CreateGroup("B");
        b.LinkHard("back", "/A");
        root.LinkSoft("alias", "/A/data");
    }

    H5Reader reader(path);
    WalkResult result = StructureWalker().Walk(reader);

    // A, A/B; the cycle back to /A is not counted
    ASSERT_EQ(result.total_groups, 2u);
    // A/data and the /alias soft link
    ASSERT_EQ(result.total_datasets, 2u);
    ASSERT_EQ(result.total_groups + result.total_datasets, CountNonRoot(result.root));
    ASSERT_EQ(result.errors.size(), 2u);

    ASSERT_EQ(result.root.skipped.size(), 1u);
    ASSERT_EQ(result.root.skipped[0].path, "/broken");
    ASSERT_TRUE(FindChild(result.root, "broken") == nullptr);

    const TreeNode* alias = FindChild(result.root, "alias");
    ASSERT_TRUE(alias != nullptr);
    ASSERT_TRUE(alias->IsDataset());
    ASSERT_EQ((*alias->shape)[0], 3u);

    const TreeNode* b = FindChild(*FindChild(result.root, "A"), "B");
    ASSERT_TRUE(b != nullptr);
    ASSERT_TRUE(b->children.empty());
    ASSERT_EQ(b->skipped.size(), 1u);
    ASSERT_EQ(b->skipped[0].path, "/A/B/back");
    ASSERT_CONTAINS(b->skipped[0].message, "cycle");

    std::cout << "TestBrokenLinksAreSkipped passed!" << std::endl;
    return 0;
}

/**
 * @brief A group hard-linked from two unrelated places is listed at both.
 */
int TestSharedHardLink() {
    std::cout << "Running TestSharedHardLink..." << std::endl;

    const std::string path = TempFixturePath("walker_shared.hdf");
    {
        FixtureWriter writer(path);
        auto root = writer.Root();
        auto a = root.CreateGroup("A");
        a.WriteDataset("data", {1.0}, {1});
        auto b = root.CreateGroup("B");
        b.LinkHard("shared", "/A");
        root.CommitDatatype("Row Type");
    }

    H5Reader reader(path);
    WalkResult result = StructureWalker().Walk(reader);

    ASSERT_EQ(result.total_groups, 3u);
    ASSERT_EQ(result.total_datasets, 2u);
    ASSERT_TRUE(result.errors.empty());
    // Named datatypes are neither listed nor reported
    ASSERT_EQ(result.root.children.size(), 2u);

    const TreeNode* shared = FindChild(*FindChild(result.root, "B"), "shared");
    ASSERT_TRUE(shared != nullptr);
    ASSERT_EQ(shared->children.size(), 1u);
    ASSERT_EQ(shared->children[0].path, "/B/shared/data");

    std::cout << "TestSharedHardLink passed!" << std::endl;
    return 0;
}

/**
 * @brief Element type descriptions and shapes for the supported classes.
 */
int TestDatasetDescriptions() {
    std::cout << "Running TestDatasetDescriptions..." << std::endl;

    const std::string path = TempFixturePath("walker_types.hdf");
    {
        FixtureWriter writer(path);
        auto root = writer.Root();
        root.WriteIntDataset("ints", {1, 2, 3, 4, 5, 6}, {2, 3});
        root.WriteStringArray("names", {"a", "bb"});
        root.WriteCompoundDataset("rows", 3);
        root.WriteScalarDataset("scalar", 7.0);
        root.WriteEmptyDataset("empty");
    }

    H5Reader reader(path);
    WalkResult result = StructureWalker().Walk(reader);
    ASSERT_EQ(result.total_datasets, 5u);

    const TreeNode* ints = FindChild(result.root, "ints");
    ASSERT_EQ(*ints->dtype, "int32");
    ASSERT_EQ(ints->shape->size(), 2u);

    ASSERT_EQ(*FindChild(result.root, "names")->dtype, "str");
    ASSERT_EQ(*FindChild(result.root, "rows")->dtype, "compound{x:float64, id:int32}");

    const TreeNode* scalar = FindChild(result.root, "scalar");
    ASSERT_TRUE(scalar->shape.has_value());
    ASSERT_TRUE(scalar->shape->empty());

    const TreeNode* empty = FindChild(result.root, "empty");
    ASSERT_TRUE(empty->shape->empty());
    ASSERT_EQ(*empty->dtype, "float64");

    const std::vector<std::string> paths = CollectDatasetPaths(result.root);
    ASSERT_EQ(paths.size(), 5u);
    ASSERT_EQ(paths[0], "/empty");

    std::cout << "TestDatasetDescriptions passed!" << std::endl;
    return 0;
}

/**
 * @brief Missing, directory and non-HDF5 paths raise OpenError.
 */
int TestOpenErrors() {
    std::cout << "Running TestOpenErrors..." << std::endl;

    const std::string missing = TempFixturePath("missing.hdf");
    try {
        H5Reader reader(missing);
        std::cerr << "Expected OpenError for missing file, but none was thrown" << std::endl;
        return 1;
    } catch (const OpenError& e) {
        ASSERT_CONTAINS(e.what(), "does not exist");
    }

    const std::string directory = std::filesystem::path(missing).parent_path().string();
    try {
        H5Reader reader(directory);
        std::cerr << "Expected OpenError for a directory, but none was thrown" << std::endl;
        return 1;
    } catch (const OpenError& e) {
        ASSERT_CONTAINS(e.what(), "directory");
    }

    const std::string text = TempFixturePath("plain.hdf");
    {
        std::ofstream out(text);
        out << "not an hdf5 container\n";
    }
    try {
        H5Reader reader(text);
        std::cerr << "Expected OpenError for a text file, but none was thrown" << std::endl;
        return 1;
    } catch (const OpenError& e) {
        ASSERT_CONTAINS(e.what(), "plain.hdf");
    }

    std::cout << "TestOpenErrors passed!" << std::endl;
    return 0;
}

/**
 * @brief Path resolution through H5Reader.
 */
int TestReaderPaths() {
    std::cout << "Running TestReaderPaths..." << std::endl;

    ASSERT_EQ(H5Reader::NormalizePath(""), "/");
    ASSERT_EQ(H5Reader::NormalizePath("Results//MaxWSE/"), "/Results/MaxWSE");
    ASSERT_EQ(JoinPath("/", "A"), "/A");
    ASSERT_EQ(JoinPath("/A", "B"), "/A/B");

    const std::string path = TempFixturePath("reader_paths.hdf");
    rasx::testing::WriteGeometryResultsFile(path);
    H5Reader reader(path);

    ASSERT_TRUE(reader.ObjectType("/Results") == H5O_TYPE_GROUP);
    ASSERT_TRUE(reader.ObjectType("Results/MaxWSE") == H5O_TYPE_DATASET);
    ASSERT_TRUE(reader.ObjectType("/Results/Missing/Deeper") == H5O_TYPE_UNKNOWN);

    try {
        (void)reader.OpenDataSet("/Results");
        std::cerr << "Expected DatasetNotFoundError for a group, but none was thrown" << std::endl;
        return 1;
    } catch (const DatasetNotFoundError& e) {
        ASSERT_CONTAINS(e.what(), "is a group");
    }

    std::cout << "TestReaderPaths passed!" << std::endl;
    return 0;
}

/**
 * @brief Identities differ for distinct objects and match across hard links.
 */
int TestObjectIdentity() {
    std::cout << "Running TestObjectIdentity..." << std::endl;

    // Little-endian addresses 0x0123 and 0x3102 must not format alike.
    unsigned char first[16] = {0x23, 0x01};
    unsigned char second[16] = {0x02, 0x31};
    const std::string a = FormatObjectToken(1, first, sizeof(first));
    const std::string b = FormatObjectToken(1, second, sizeof(second));
    ASSERT_TRUE(a != b);
    ASSERT_EQ(a, "1:2301" + std::string(28, '0'));
    ASSERT_EQ(b.size(), a.size());

    const std::string path = TempFixturePath("walker_identity.hdf");
    {
        FixtureWriter writer(path);
        auto root = writer.Root();
        for (int i = 0; i < 40; ++i) {
            (void)root.CreateGroup("G" + std::to_string(i));
        }
        root.LinkHard("G0_alias", "/G0");
    }

    H5Reader reader(path);
    std::vector<std::string> identities;
    for (int i = 0; i < 40; ++i) {
        identities.push_back(ObjectIdentity(reader.OpenGroup("/G" + std::to_string(i))));
    }
    std::sort(identities.begin(), identities.end());
    ASSERT_TRUE(std::adjacent_find(identities.begin(), identities.end()) == identities.end());
    ASSERT_EQ(ObjectIdentity(reader.OpenGroup("/G0_alias")), ObjectIdentity(reader.OpenGroup("/G0")));

    WalkResult walk = StructureWalker().Walk(reader);
    ASSERT_EQ(walk.total_groups, 41u);
    ASSERT_TRUE(walk.errors.empty());

    std::cout << "TestObjectIdentity passed!" << std::endl;
    return 0;
}

int main() {
    std::cout << "Starting structure walker unit tests..." << std::endl;

    int result = 0;

    result |= TestScenarioCounts();
    result |= TestMaxDepth();
    result |= TestLinkOrder();
    result |= TestAttributeStringification();
    result |= TestBrokenLinksAreSkipped();
    result |= TestSharedHardLink();
    result |= TestObjectIdentity();
    result |= TestDatasetDescriptions();
    result |= TestOpenErrors();
    result |= TestReaderPaths();

    if (result == 0) {
        std::cout << "\nAll tests passed!" << std::endl;
    } else {
        std::cout << "\nSome tests failed!" << std::endl;
    }

    return result;
}
