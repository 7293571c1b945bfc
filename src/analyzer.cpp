/**
 * @file analyzer.cpp
 * @brief Implementation of the Analyzer facade.
 *
 * @note Every operation converts exceptions into Result::error; nothing
 *       escapes to the caller.
 */

#include <rasx/analyzer.h>
#include <rasx/errors.h>
#include <rasx/h5_reader.h>
#include <rasx/logging.h>
#include <rasx/sampling_reader.h>
#include <rasx/structure_walker.h>

#include "utils/pattern_parser.h"

#include <algorithm>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <sstream>
#include <stdexcept>

#include <sys/stat.h>

namespace rasx {

namespace {

constexpr double kBytesPerMB = 1024.0 * 1024.0;

// Warnings collected during the request are shown, and dropped, when it ends.
template <class T, class Fn>
Result<T> Guarded(const char* operation, const std::string& target, Fn&& fn) {
    LOG_DEBUG(operation << " request for '" << target << "'");
    Result<T> result;
    try {
        result = Result<T>::Ok(fn());
    } catch (const OpenError& e) {
        LOG_ERROR(operation << " failed for '" << target << "': " << e.what());
        result = Result<T>::Fail(e.what());
    } catch (const H5::Exception& e) {
        const std::string error = H5Reader::DescribeException(e);
        LOG_WARNING(operation << " failed for '" << target << "': " << error);
        result = Result<T>::Fail(error);
    } catch (const std::exception& e) {
        LOG_WARNING(operation << " failed for '" << target << "': " << e.what());
        result = Result<T>::Fail(e.what());
    }
    cli::DisplayWarnings();
    return result;
}

std::string FormatUtc(std::time_t seconds) {
    std::tm tm_buf{};
#if defined(_WIN32)
    gmtime_s(&tm_buf, &seconds);
#else
    gmtime_r(&seconds, &tm_buf);
#endif
    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

bool IsHdfExtension(const std::filesystem::path& path) {
    const std::string ext = ToLower(path.extension().string());
    return ext == ".hdf" || ext == ".h5" || ext == ".hdf5";
}

WalkResult WalkFile(const H5Reader& reader, std::optional<int> max_depth, bool include_attributes) {
    WalkOptions options;
    options.max_depth = max_depth;
    options.include_attributes = include_attributes;
    return StructureWalker(options).Walk(reader);
}

} // namespace

DatasetDescription DescribeDatasetNode(const H5Reader& reader, const TreeNode& node) {
    DatasetDescription description;
    description.path = node.path;
    description.name = node.name;
    description.shape = node.shape.value_or(std::vector<uint64_t>{});
    description.dtype = node.dtype.value_or("unknown");
    description.attributes = node.attributes;

    try {
        const H5::DataSet dataset = reader.OpenDataSet(node.path);
        description.size = DataSpaceElementCount(dataset.getSpace());
        description.size_mb = static_cast<double>(description.size * dataset.getDataType().getSize()) / kBytesPerMB;
    } catch (const H5::Exception& e) {
        cli::CollectWarning("Cannot size dataset " + node.path + ": " + H5Reader::DescribeException(e));
    } catch (const std::exception& e) {
        cli::CollectWarning("Cannot size dataset " + node.path + ": " + e.what());
    }
    return description;
}

Analyzer::Analyzer(AnalyzerOptions options) : options_(std::move(options)) {}

FileInfo Analyzer::Info(const std::string& file_path) const {
    FileInfo info;
    const std::filesystem::path path(file_path);
    std::error_code ec;
    info.name = path.filename().string();
    const std::filesystem::path absolute = std::filesystem::absolute(path, ec);
    info.path = (ec ? path : absolute).lexically_normal().string();

    struct stat st {};
    if (::stat(file_path.c_str(), &st) != 0) {
        info.error = "File does not exist: " + file_path;
        LOG_ERROR("Info failed for '" << file_path << "': " << *info.error);
        return info;
    }
    info.size_mb = static_cast<double>(st.st_size) / kBytesPerMB;
    info.modified = FormatUtc(st.st_mtime);

    try {
        const H5Reader reader(file_path);
        const WalkResult walk = WalkFile(reader, std::nullopt, false);
        info.groups_count = walk.total_groups;
        info.datasets_count = walk.total_datasets;
        info.accessible = true;
    } catch (const OpenError& e) {
        info.error = e.what();
        LOG_ERROR("Info failed for '" << file_path << "': " << *info.error);
    } catch (const H5::Exception& e) {
        info.error = H5Reader::DescribeException(e);
        LOG_WARNING("Info failed for '" << file_path << "': " << *info.error);
    } catch (const std::exception& e) {
        info.error = e.what();
        LOG_WARNING("Info failed for '" << file_path << "': " << *info.error);
    }
    cli::DisplayWarnings();
    return info;
}

Result<FileStructure> Analyzer::Structure(const std::string& file_path, std::optional<int> max_depth,
                                          std::optional<bool> include_attributes) const {
    return Guarded<FileStructure>("Structure", file_path, [&] {
        const std::optional<int> depth = max_depth ? max_depth : options_.max_depth;
        if (depth && *depth < 0) {
            throw std::invalid_argument("max_depth must be non-negative, got " + std::to_string(*depth));
        }
        const H5Reader reader(file_path);
        WalkResult walk = WalkFile(reader, depth, include_attributes.value_or(options_.include_attributes));

        FileStructure structure;
        structure.file_path = file_path;
        structure.root = std::move(walk.root);
        structure.total_groups = walk.total_groups;
        structure.total_datasets = walk.total_datasets;
        structure.errors = std::move(walk.errors);
        return structure;
    });
}

Result<std::vector<std::string>> Analyzer::Datasets(const std::string& file_path) const {
    return Guarded<std::vector<std::string>>("Datasets", file_path, [&] {
        const H5Reader reader(file_path);
        return CollectDatasetPaths(WalkFile(reader, std::nullopt, false).root);
    });
}

Result<ExtractionResult> Analyzer::Extract(const std::string& file_path) const {
    return Guarded<ExtractionResult>("Extract", file_path, [&] {
        const H5Reader reader(file_path);
        const WalkResult walk = WalkFile(reader, std::nullopt, true);
        return ExtractSummary(reader, walk.root, options_.patterns, options_.extraction_sample_size);
    });
}

Result<std::vector<double>> Analyzer::Sample(const std::string& file_path, const std::string& dataset_path,
                                             size_t max_elements) const {
    return Guarded<std::vector<double>>("Sample", file_path + ":" + dataset_path, [&] {
        return ReadDatasetSample(file_path, dataset_path, max_elements);
    });
}

Result<std::vector<FileInfo>> Analyzer::FindHdfFiles(const std::string& folder) const {
    return Guarded<std::vector<FileInfo>>("FindHdfFiles", folder, [&] {
        std::error_code ec;
        if (!std::filesystem::is_directory(folder, ec)) {
            throw OpenError("Folder does not exist or is not a directory: " + folder);
        }

        std::vector<std::filesystem::path> files;
        const auto dir_options = std::filesystem::directory_options::skip_permission_denied;
        for (std::filesystem::recursive_directory_iterator it(folder, dir_options, ec), end; !ec && it != end;
             it.increment(ec)) {
            if (it->is_regular_file(ec) && IsHdfExtension(it->path())) {
                files.push_back(it->path());
            }
        }
        if (ec) {
            throw std::runtime_error("Failed to scan folder '" + folder + "': " + ec.message());
        }

        std::sort(files.begin(), files.end(), [](const auto& a, const auto& b) {
            const std::string name_a = a.filename().string();
            const std::string name_b = b.filename().string();
            return name_a != name_b ? name_a < name_b : a < b;
        });

        std::vector<FileInfo> infos;
        infos.reserve(files.size());
        for (const auto& file : files) {
            infos.push_back(Info(file.string()));
        }
        LOG_DEBUG("Found " << infos.size() << " HDF files below '" << folder << "'");
        return infos;
    });
}

Result<std::vector<DatasetDescription>> Analyzer::DescribeDatasets(const std::string& file_path,
                                                                   std::optional<size_t> limit) const {
    return Guarded<std::vector<DatasetDescription>>("DescribeDatasets", file_path, [&] {
        const H5Reader reader(file_path);
        const WalkResult walk = WalkFile(reader, std::nullopt, true);

        std::vector<DatasetDescription> descriptions;
        std::vector<const TreeNode*> pending{&walk.root};
        // Explicit stack, children pushed in reverse to keep pre-order.
        while (!pending.empty()) {
            const TreeNode* node = pending.back();
            pending.pop_back();
            if (node->IsGroup()) {
                for (auto it = node->children.rbegin(); it != node->children.rend(); ++it) {
                    pending.push_back(&*it);
                }
                continue;
            }
            descriptions.push_back(DescribeDatasetNode(reader, *node));
        }

        std::stable_sort(descriptions.begin(), descriptions.end(),
                         [](const DatasetDescription& a, const DatasetDescription& b) { return a.size > b.size; });
        if (limit && descriptions.size() > *limit) {
            descriptions.resize(*limit);
        }
        return descriptions;
    });
}

Result<PatternTable> Analyzer::LoadPatterns(const std::string& path) {
    Result<PatternTable> loaded = Guarded<PatternTable>("LoadPatterns", path, [&] {
        std::filesystem::path pattern_file(path);
        if (std::filesystem::is_directory(pattern_file)) {
            pattern_file = FindPatternFile(pattern_file);
            if (pattern_file.empty()) {
                throw std::runtime_error("No *.patterns.yaml file found in " + path);
            }
        }
        return ReadPatternTable(pattern_file);
    });
    if (loaded.success) {
        options_.patterns = *loaded.value;
        LOG_SUCCESS("Using pattern table " << options_.patterns.Label());
    }
    return loaded;
}

} // namespace rasx
