#ifndef RASX_PATTERN_TABLE_H
#define RASX_PATTERN_TABLE_H

/**
 * @file pattern_table.h
 * @brief Versioned table of dataset path substrings used by the summary extractor.
 *
 * Each entry claims datasets whose full path contains any of its substrings
 * (case-insensitive). Entries are tried in table order; the first match wins.
 */

#include <optional>
#include <string>
#include <vector>

namespace rasx {

enum class DataBucket { Geometry, Results };

/** @return "geometry" or "results". */
const char* DataBucketName(DataBucket bucket) noexcept;

struct PatternEntry {
    DataBucket bucket = DataBucket::Geometry;
    std::string key;                     ///< e.g. "mesh_nodes", "max_wse"
    std::vector<std::string> substrings; ///< Matched case-insensitively
};

struct PatternTable {
    std::string name;
    int version = 1;
    std::vector<PatternEntry> entries;

    /// "<name> v<version>"
    [[nodiscard]] std::string Label() const;

    /// First entry whose substrings occur in @p dataset_path, if any.
    [[nodiscard]] const PatternEntry* Match(const std::string& dataset_path) const;
};

/**
 * @brief Built-in table for HEC-RAS plan and geometry files ("hecras" v1).
 */
PatternTable DefaultHecRasPatterns();

/// Lower-cased ASCII copy.
std::string ToLower(std::string text);

} // namespace rasx

#endif // RASX_PATTERN_TABLE_H
