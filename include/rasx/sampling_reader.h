#ifndef RASX_SAMPLING_READER_H
#define RASX_SAMPLING_READER_H

/**
 * @file sampling_reader.h
 * @brief Bounded numeric preview of a single dataset.
 *
 * @note At most N elements are transferred: the file selection covers exactly
 *       the row-major prefix of the dataset, never the whole extent.
 */

#include <rasx/h5_reader.h>

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

namespace rasx {

/**
 * @brief Read the first min(N, element_count) elements of a dataset as doubles.
 *
 * Elements are taken from the flattened row-major representation. Scalar
 * datasets have one element; null dataspaces have none.
 *
 * @param reader Open file.
 * @param dataset_path Absolute path of the dataset.
 * @param max_elements Upper bound N on the number of elements returned.
 * @throws DatasetNotFoundError if the path is absent or names a group.
 * @throws ReadError if the element type is not integer or floating point, or the read fails.
 */
std::vector<double> ReadDatasetSample(const H5Reader& reader, const std::string& dataset_path,
                                      size_t max_elements);

/// Same as above, opening and closing @p file_path for the call.
std::vector<double> ReadDatasetSample(const std::string& file_path, const std::string& dataset_path,
                                      size_t max_elements);

/**
 * @brief Hyperslabs (start, count) whose union is the first @p n elements of
 * a row-major array with extents @p dims.
 *
 * Returns at most dims.size() blocks; empty when n is 0 or any extent is 0.
 * An @p n past the element count covers the whole array.
 */
std::vector<std::pair<std::vector<hsize_t>, std::vector<hsize_t>>> RowMajorPrefixBlocks(
    const std::vector<hsize_t>& dims, hsize_t n);

} // namespace rasx

#endif // RASX_SAMPLING_READER_H
