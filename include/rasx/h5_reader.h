#ifndef RASX_H5_READER_H
#define RASX_H5_READER_H

/**
 * @file h5_reader.h
 * @brief Read-only RAII handle over the HDF5 C++ API (H5Cpp.h).
 *
 * Opens an HDF5 file for the duration of one request and resolves absolute
 * slash paths to groups and datasets.
 *
 * @note Access: the file is always opened H5F_ACC_RDONLY; nothing is ever written.
 * @note Paths: POSIX-style with '/' separators; root is "/". A missing leading
 *       '/' is tolerated and treated as relative to the root.
 * @note Errors: global HDF5 error printing is disabled; open failures raise
 *       OpenError, path lookups raise DatasetNotFoundError.
 * @note Thread-safety: not thread-safe; use one reader per request.
 */

#include <H5Cpp.h>

#include <string>
#include <vector>

namespace rasx {

//-----------------------------------------------------------------------------
// H5Reader
//-----------------------------------------------------------------------------
class H5Reader {
  public:
    /**
     * @brief Open an existing HDF5 file read-only.
     * @param filepath Path of the HDF5 file.
     * @throws OpenError if the path does not exist, is not an HDF5 file, or
     *         cannot be opened for reading.
     */
    explicit H5Reader(const std::string& filepath);
    ~H5Reader() noexcept;

    H5Reader(const H5Reader&) = delete;
    H5Reader& operator=(const H5Reader&) = delete;

    /** @return Original file path passed to the constructor. */
    [[nodiscard]] const std::string& GetPath() const noexcept { return file_path_; }

    /** @brief Return the root group ('/'). */
    [[nodiscard]] H5::Group Root() const;

    /**
     * @brief Kind of object a path resolves to, following soft links.
     * @return H5O_TYPE_GROUP, H5O_TYPE_DATASET, H5O_TYPE_NAMED_DATATYPE, or
     *         H5O_TYPE_UNKNOWN when any segment of the path does not exist.
     */
    [[nodiscard]] H5O_type_t ObjectType(const std::string& path) const;

    /**
     * @brief Open the dataset at an absolute path.
     * @throws DatasetNotFoundError if the path is absent or is not a dataset.
     */
    [[nodiscard]] H5::DataSet OpenDataSet(const std::string& path) const;

    /**
     * @brief Open the group at an absolute path.
     * @throws DatasetNotFoundError if the path is absent or is not a group.
     */
    [[nodiscard]] H5::Group OpenGroup(const std::string& path) const;

    /**
     * @brief Normalize a user-supplied path: leading '/', no empty or trailing segments.
     */
    static std::string NormalizePath(const std::string& path);

    /**
     * @brief Extract the most specific message from an HDF5 exception.
     */
    static std::string DescribeException(const H5::Exception& e);

  private:
    H5::H5File file_;
    std::string file_path_;
};

/**
 * @brief Link names of a group in the file's own order.
 *
 * Uses link creation order when the group tracks it, otherwise the name
 * index in increasing order. Names are never re-sorted here.
 * @throws H5::GroupIException if the links cannot be iterated.
 */
std::vector<std::string> ListLinkNames(const H5::Group& group);

/**
 * @brief Stable identity of an opened object (file number + object address).
 *
 * Used to detect hard-link cycles during traversal.
 */
std::string ObjectIdentity(const H5::H5Object& object);

/**
 * @brief "<fileno>:<hex>" with two hex digits per token byte.
 */
std::string FormatObjectToken(unsigned long fileno, const unsigned char* bytes, size_t size);

/**
 * @brief numpy-style element type description ("float32", "int64", "|S16", ...).
 */
std::string DescribeDataType(const H5::DataType& type);

/**
 * @brief Per-dimension extents; empty for scalar and null dataspaces.
 */
std::vector<hsize_t> DataSpaceDims(const H5::DataSpace& space);

/**
 * @brief Number of elements in a dataspace (1 for scalar, 0 for null).
 */
hsize_t DataSpaceElementCount(const H5::DataSpace& space);

} // namespace rasx

#endif // RASX_H5_READER_H
