/**
 * @file summary_extractor.cpp
 * @brief Implementation of ExtractSummary.
 */

#include <rasx/summary_extractor.h>
#include <rasx/errors.h>
#include <rasx/logging.h>
#include <rasx/sampling_reader.h>

namespace rasx {

namespace {

const char* const kDefaultedMetadataKeys[] = {"File Type", "Version", "Created"};

std::string SummaryKey(const PatternEntry& entry) {
    return std::string(DataBucketName(entry.bucket)) + "_" + entry.key;
}

} // namespace

ExtractionResult ExtractSummary(const H5Reader& reader, const TreeNode& root, const PatternTable& patterns,
                                size_t max_elements) {
    ExtractionResult result;
    result.file = reader.GetPath();
    result.pattern_table = patterns.Label();

    for (const auto& entry : patterns.entries) {
        result.extraction_summary[SummaryKey(entry)] = 0;
    }
    size_t unreadable = 0;

    for (const auto& path : CollectDatasetPaths(root)) {
        const PatternEntry* entry = patterns.Match(path);
        if (entry == nullptr) {
            continue;
        }
        try {
            std::vector<double> values = ReadDatasetSample(reader, path, max_elements);
            auto& bucket = entry->bucket == DataBucket::Geometry ? result.geometry_data : result.results_data;
            bucket[path] = std::move(values);
            result.extraction_summary[SummaryKey(*entry)]++;
            LOG_DEBUG("Extracted '" << path << "' as " << SummaryKey(*entry));
        } catch (const ReadError& e) {
            ++unreadable;
            cli::CollectWarning("Skipped matched dataset " + path + ": " + e.what());
        } catch (const DatasetNotFoundError& e) {
            ++unreadable;
            cli::CollectWarning("Skipped matched dataset " + path + ": " + e.what());
        }
    }

    for (const auto& entry : patterns.entries) {
        const std::string key = SummaryKey(entry);
        result.extraction_status[key] = SummaryStatus(result, key);
    }

    result.metadata = root.attributes;
    for (const char* key : kDefaultedMetadataKeys) {
        result.metadata.emplace(key, "Unknown");
    }

    result.extraction_summary["geometry_datasets"] = result.geometry_data.size();
    result.extraction_summary["results_datasets"] = result.results_data.size();
    result.extraction_summary["metadata_items"] = result.metadata.size();
    result.extraction_summary["unreadable_datasets"] = unreadable;
    return result;
}

} // namespace rasx
