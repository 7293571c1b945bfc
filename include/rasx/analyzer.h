#ifndef RASX_ANALYZER_H
#define RASX_ANALYZER_H

/**
 * @file analyzer.h
 * @brief Request/response facade over the walker, extractor and sampler.
 *
 * Every operation opens its file, does bounded work and closes the file
 * before returning. Nothing here throws: failures are reported through
 * Result::error (or FileInfo::error for Info).
 *
 * @note All operations are read-only; source files are never modified.
 * @note Warnings collected while an operation runs are displayed and cleared
 *       before it returns.
 */

#include <rasx/h5_reader.h>
#include <rasx/pattern_table.h>
#include <rasx/summary_extractor.h>
#include <rasx/tree_node.h>

#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace rasx {

/// Tagged success/error outcome of a facade operation.
template <class T>
struct Result {
    bool success = false;
    std::optional<T> value;
    std::string error;

    static Result Ok(T v) {
        Result r;
        r.success = true;
        r.value = std::move(v);
        return r;
    }

    static Result Fail(std::string message) {
        Result r;
        r.error = std::move(message);
        return r;
    }
};

struct AnalyzerOptions {
    std::optional<int> max_depth;     ///< Default for Structure(); unbounded when empty
    bool include_attributes = true;   ///< Default for Structure()
    size_t extraction_sample_size = kDefaultExtractionSampleSize;
    PatternTable patterns = DefaultHecRasPatterns();
};

/**
 * @brief DatasetDescription for one walked dataset node.
 *
 * Size and size_mb stay 0 when the dataset cannot be reopened or sized; the
 * failure becomes a collected warning.
 */
DatasetDescription DescribeDatasetNode(const H5Reader& reader, const TreeNode& node);

//-----------------------------------------------------------------------------
// Analyzer
//-----------------------------------------------------------------------------
class Analyzer {
  public:
    explicit Analyzer(AnalyzerOptions options = AnalyzerOptions{});

    /**
     * @brief Basic file facts plus group/dataset counts.
     *
     * Always returns a FileInfo. When the file cannot be opened, accessible is
     * false and error holds the reason.
     */
    [[nodiscard]] FileInfo Info(const std::string& file_path) const;

    /**
     * @brief Full structural tree.
     * @param max_depth Overrides AnalyzerOptions::max_depth; must be >= 0.
     * @param include_attributes Overrides AnalyzerOptions::include_attributes.
     */
    [[nodiscard]] Result<FileStructure> Structure(const std::string& file_path,
                                                  std::optional<int> max_depth = std::nullopt,
                                                  std::optional<bool> include_attributes = std::nullopt) const;

    /// Every dataset path, depth-first pre-order.
    [[nodiscard]] Result<std::vector<std::string>> Datasets(const std::string& file_path) const;

    /// Pattern-based geometry/results extraction with metadata.
    [[nodiscard]] Result<ExtractionResult> Extract(const std::string& file_path) const;

    /// First min(max_elements, length) elements of one dataset.
    [[nodiscard]] Result<std::vector<double>> Sample(const std::string& file_path, const std::string& dataset_path,
                                                     size_t max_elements) const;

    /**
     * @brief FileInfo for every .hdf, .h5 and .hdf5 file below a folder.
     *
     * Extensions match case-insensitively; results are sorted by file name,
     * then by path.
     */
    [[nodiscard]] Result<std::vector<FileInfo>> FindHdfFiles(const std::string& folder) const;

    /**
     * @brief Per-dataset details sorted by element count, largest first.
     * @param limit Keep only the first @p limit entries when set.
     */
    [[nodiscard]] Result<std::vector<DatasetDescription>> DescribeDatasets(
        const std::string& file_path, std::optional<size_t> limit = std::nullopt) const;

    /**
     * @brief Replace the pattern table with one read from a *.patterns.yaml file.
     * @param path Pattern file, or a directory searched for one.
     * @return The loaded table; the current table is kept on failure.
     */
    Result<PatternTable> LoadPatterns(const std::string& path);

    [[nodiscard]] const AnalyzerOptions& GetOptions() const noexcept { return options_; }

  private:
    AnalyzerOptions options_;
};

} // namespace rasx

#endif // RASX_ANALYZER_H
