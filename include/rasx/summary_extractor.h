#ifndef RASX_SUMMARY_EXTRACTOR_H
#define RASX_SUMMARY_EXTRACTOR_H

/**
 * @file summary_extractor.h
 * @brief Heuristic extraction of known geometry and result datasets.
 *
 * Dataset paths are matched against a PatternTable in depth-first pre-order.
 * Each claimed dataset contributes a bounded numeric sample to its bucket.
 */

#include <rasx/h5_reader.h>
#include <rasx/pattern_table.h>
#include <rasx/tree_node.h>

#include <cstddef>

namespace rasx {

/// Element cap applied to each matched dataset unless configured otherwise.
constexpr size_t kDefaultExtractionSampleSize = 1000;

/**
 * @brief Match, sample and summarize the datasets of an already walked file.
 *
 * Metadata holds every root attribute plus "File Type", "Version" and
 * "Created", which default to "Unknown" when the root does not carry them.
 * Matched datasets that are not numeric are counted in
 * extraction_summary["unreadable_datasets"] and otherwise skipped.
 *
 * @param reader Open file the tree was built from.
 * @param root Root of the walked tree (attributes included).
 * @param patterns Table deciding which datasets are extracted.
 * @param max_elements Per-dataset element cap.
 */
ExtractionResult ExtractSummary(const H5Reader& reader, const TreeNode& root, const PatternTable& patterns,
                                size_t max_elements = kDefaultExtractionSampleSize);

} // namespace rasx

#endif // RASX_SUMMARY_EXTRACTOR_H
