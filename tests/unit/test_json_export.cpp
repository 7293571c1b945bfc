/*********************************************************************
 * @file  test_json_export.cpp
 *
 * @brief Unit tests for the tagged JSON records returned to callers.
 *********************************************************************/

#include <rasx/analyzer.h>
#include <rasx/json_export.h>

#include "h5_fixture.h"
#include "test_assert.h"

#include <iostream>

using namespace rasx;
using rasx::testing::TempFixturePath;

/**
 * @brief Failures carry only success=false and the error text.
 */
int TestFailureRecord() {
    std::cout << "Running TestFailureRecord..." << std::endl;

    const Result<std::vector<std::string>> failed = Result<std::vector<std::string>>::Fail("File does not exist: x.hdf");
    const json j = ToJson(failed, "datasets");
    ASSERT_EQ(j.size(), 2u);
    ASSERT_FALSE(j.at("success").get<bool>());
    ASSERT_EQ(j.at("error").get<std::string>(), "File does not exist: x.hdf");
    ASSERT_FALSE(j.contains("datasets"));

    std::cout << "TestFailureRecord passed!" << std::endl;
    return 0;
}

/**
 * @brief Structure records merge the payload with success=true.
 */
int TestStructureRecord() {
    std::cout << "Running TestStructureRecord..." << std::endl;

    const std::string path = TempFixturePath("json_structure.hdf");
    rasx::testing::WriteGeometryResultsFile(path);

    const Analyzer analyzer;
    const json j = ToJson(analyzer.Structure(path));
    ASSERT_TRUE(j.at("success").get<bool>());
    ASSERT_EQ(j.at("file").get<std::string>(), path);
    ASSERT_EQ(j.at("total_groups").get<size_t>(), 2u);
    ASSERT_EQ(j.at("total_datasets").get<size_t>(), 2u);
    ASSERT_TRUE(j.at("errors").is_array());

    const json& root = j.at("root");
    ASSERT_EQ(root.at("type").get<std::string>(), "group");
    ASSERT_EQ(root.at("path").get<std::string>(), "/");
    ASSERT_EQ(root.at("attributes").at("File Type").get<std::string>(), "HEC-RAS Results");
    ASSERT_FALSE(root.contains("shape"));
    ASSERT_FALSE(root.contains("error"));

    const json& geometry = root.at("children").at(0);
    ASSERT_EQ(geometry.at("name").get<std::string>(), "Geometry");
    const json& cells = geometry.at("children").at(0);
    ASSERT_EQ(cells.at("type").get<std::string>(), "dataset");
    ASSERT_EQ(cells.at("dtype").get<std::string>(), "float64");
    ASSERT_EQ(cells.at("shape").size(), 2u);
    ASSERT_EQ(cells.at("shape").at(0).get<uint64_t>(), 5u);
    ASSERT_FALSE(cells.contains("children"));

    std::cout << "TestStructureRecord passed!" << std::endl;
    return 0;
}

/**
 * @brief Sequence payloads go under the named key.
 */
int TestSequencePayloads() {
    std::cout << "Running TestSequencePayloads..." << std::endl;

    const std::string path = TempFixturePath("json_sample.hdf");
    rasx::testing::WriteGeometryResultsFile(path);

    const Analyzer analyzer;
    const json sample = ToJson(analyzer.Sample(path, "/Results/MaxWSE", 2), "values");
    ASSERT_TRUE(sample.at("success").get<bool>());
    ASSERT_EQ(sample.at("values").size(), 2u);
    ASSERT_DOUBLE_EQ(sample.at("values").at(0).get<double>(), 101.5);

    const json datasets = ToJson(analyzer.Datasets(path), "datasets");
    ASSERT_EQ(datasets.at("datasets").at(1).get<std::string>(), "/Results/MaxWSE");

    const json described = ToJson(analyzer.DescribeDatasets(path));
    ASSERT_EQ(described.at("data").at(0).at("size").get<uint64_t>(), 10u);

    std::cout << "TestSequencePayloads passed!" << std::endl;
    return 0;
}

/**
 * @brief Info records mirror accessible into success and keep the error text.
 */
int TestFileInfoRecord() {
    std::cout << "Running TestFileInfoRecord..." << std::endl;

    const Analyzer analyzer;
    const json missing = ToJson(analyzer.Info(TempFixturePath("json_missing.hdf")));
    ASSERT_FALSE(missing.at("success").get<bool>());
    ASSERT_FALSE(missing.at("accessible").get<bool>());
    ASSERT_TRUE(missing.contains("error"));

    const std::string path = TempFixturePath("json_info.hdf");
    rasx::testing::WriteGeometryResultsFile(path);
    const json present = ToJson(analyzer.Info(path));
    ASSERT_TRUE(present.at("success").get<bool>());
    ASSERT_EQ(present.at("groups_count").get<size_t>(), 2u);
    ASSERT_FALSE(present.contains("error"));

    std::cout << "TestFileInfoRecord passed!" << std::endl;
    return 0;
}

/**
 * @brief Extraction and pattern tables serialize with their labels.
 */
int TestExtractionRecord() {
    std::cout << "Running TestExtractionRecord..." << std::endl;

    const std::string path = TempFixturePath("json_extract.hdf");
    rasx::testing::WriteGeometryResultsFile(path);

    const Analyzer analyzer;
    const json j = ToJson(analyzer.Extract(path));
    ASSERT_TRUE(j.at("success").get<bool>());
    ASSERT_EQ(j.at("pattern_table").get<std::string>(), "hecras v1");
    ASSERT_EQ(j.at("results_data").at("/Results/MaxWSE").size(), 4u);
    ASSERT_EQ(j.at("metadata").at("Version").get<std::string>(), "Unknown");
    ASSERT_EQ(j.at("extraction_summary").at("results_max_wse").get<size_t>(), 1u);
    ASSERT_EQ(j.at("extraction_status").at("results_max_wse").get<std::string>(), "Found");
    ASSERT_EQ(j.at("extraction_status").at("results_max_velocity").get<std::string>(), "Not Found");

    const json table = DefaultHecRasPatterns();
    ASSERT_EQ(table.at("name").get<std::string>(), "hecras");
    ASSERT_EQ(table.at("version").get<int>(), 1);
    ASSERT_EQ(table.at("entries").at(0).at("bucket").get<std::string>(), "geometry");
    ASSERT_EQ(table.at("entries").at(0).at("key").get<std::string>(), "mesh_nodes");

    std::cout << "TestExtractionRecord passed!" << std::endl;
    return 0;
}

int main() {
    std::cout << "Starting JSON export unit tests..." << std::endl;

    int result = 0;

    result |= TestFailureRecord();
    result |= TestStructureRecord();
    result |= TestSequencePayloads();
    result |= TestFileInfoRecord();
    result |= TestExtractionRecord();

    if (result == 0) {
        std::cout << "\nAll tests passed!" << std::endl;
    } else {
        std::cout << "\nSome tests failed!" << std::endl;
    }

    return result;
}
