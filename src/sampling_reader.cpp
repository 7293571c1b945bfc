/**
 * @file sampling_reader.cpp
 * @brief Implementation of bounded dataset sampling.
 *
 * @note The row-major prefix of n elements over extents (d0, ..., dr-1) is the
 *       union of at most r boxes: writing n in the mixed radix of the extents
 *       as (q0, ..., qr-1), box k starts at (q0, ..., qk-1, 0, ...) and spans
 *       (1, ..., 1, qk, dk+1, ..., dr-1).
 */

#include <rasx/sampling_reader.h>
#include <rasx/errors.h>
#include <rasx/logging.h>

#include <algorithm>
#include <sstream>

namespace rasx {

std::vector<std::pair<std::vector<hsize_t>, std::vector<hsize_t>>> RowMajorPrefixBlocks(
    const std::vector<hsize_t>& dims, hsize_t n) {
    std::vector<std::pair<std::vector<hsize_t>, std::vector<hsize_t>>> blocks;
    const size_t rank = dims.size();
    if (rank == 0 || n == 0 || std::find(dims.begin(), dims.end(), 0) != dims.end()) {
        return blocks;
    }

    std::vector<hsize_t> strides(rank, 1);
    for (size_t k = rank - 1; k > 0; --k) {
        strides[k - 1] = strides[k] * dims[k];
    }

    std::vector<hsize_t> prefix(rank, 0);
    hsize_t remaining = std::min(n, strides[0] * dims[0]);
    for (size_t k = 0; k < rank && remaining > 0; ++k) {
        const hsize_t q = remaining / strides[k];
        remaining -= q * strides[k];
        if (q > 0) {
            std::vector<hsize_t> start(rank, 0);
            std::vector<hsize_t> count(rank, 1);
            for (size_t j = 0; j < k; ++j) {
                start[j] = prefix[j];
            }
            count[k] = q;
            for (size_t j = k + 1; j < rank; ++j) {
                count[j] = dims[j];
            }
            blocks.emplace_back(std::move(start), std::move(count));
        }
        prefix[k] = q;
    }
    return blocks;
}

std::vector<double> ReadDatasetSample(const H5Reader& reader, const std::string& dataset_path,
                                      size_t max_elements) {
    const H5::DataSet dataset = reader.OpenDataSet(dataset_path);
    const std::string path = H5Reader::NormalizePath(dataset_path);

    try {
        const H5::DataType type = dataset.getDataType();
        const H5T_class_t type_class = type.getClass();
        if (type_class != H5T_INTEGER && type_class != H5T_FLOAT) {
            std::ostringstream oss;
            oss << "Dataset '" << path << "' has non-numeric element type " << DescribeDataType(type);
            throw ReadError(oss.str());
        }

        H5::DataSpace file_space = dataset.getSpace();
        const hsize_t total = DataSpaceElementCount(file_space);
        const hsize_t n = std::min<hsize_t>(total, static_cast<hsize_t>(max_elements));
        std::vector<double> values(static_cast<size_t>(n));
        if (n == 0) {
            return values;
        }

        if (file_space.getSimpleExtentType() == H5S_SCALAR) {
            H5::DataSpace mem_space(H5S_SCALAR);
            dataset.read(values.data(), H5::PredType::NATIVE_DOUBLE, mem_space, file_space);
            return values;
        }

        const auto blocks = RowMajorPrefixBlocks(DataSpaceDims(file_space), n);
        for (size_t i = 0; i < blocks.size(); ++i) {
            file_space.selectHyperslab(i == 0 ? H5S_SELECT_SET : H5S_SELECT_OR, blocks[i].second.data(),
                                       blocks[i].first.data());
        }
        const hsize_t mem_dims[1] = {n};
        H5::DataSpace mem_space(1, mem_dims);
        dataset.read(values.data(), H5::PredType::NATIVE_DOUBLE, mem_space, file_space);

        LOG_TRACE("Sampled " << n << " of " << total << " elements from '" << path << "' in " << blocks.size()
                             << " hyperslab(s)");
        return values;
    } catch (const H5::Exception& e) {
        throw ReadError("Failed to read dataset '" + path + "': " + H5Reader::DescribeException(e));
    }
}

std::vector<double> ReadDatasetSample(const std::string& file_path, const std::string& dataset_path,
                                      size_t max_elements) {
    const H5Reader reader(file_path);
    return ReadDatasetSample(reader, dataset_path, max_elements);
}

} // namespace rasx
