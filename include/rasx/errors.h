#ifndef RASX_ERRORS_H
#define RASX_ERRORS_H

/**
 * @file errors.h
 * @brief Error taxonomy for HDF5 inspection.
 *
 * OpenError, DatasetNotFoundError and ReadError are exceptions raised inside
 * the library and converted to error strings by the analyzer facade.
 * TraversalError is a plain record: the walker stores it and moves on.
 */

#include <stdexcept>
#include <string>

namespace rasx {

/// The file is missing, is not an HDF5 container, or cannot be read.
class OpenError : public std::runtime_error {
  public:
    explicit OpenError(const std::string& message) : std::runtime_error(message) {}
};

/// The requested path is absent or names a group instead of a dataset.
class DatasetNotFoundError : public std::runtime_error {
  public:
    explicit DatasetNotFoundError(const std::string& message) : std::runtime_error(message) {}
};

/// Dataset elements could not be decoded (unsupported element type, I/O failure).
class ReadError : public std::runtime_error {
  public:
    explicit ReadError(const std::string& message) : std::runtime_error(message) {}
};

/// A non-fatal failure recorded while walking one entry of the file.
struct TraversalError {
    std::string path;     ///< Absolute path of the entry that failed
    std::string message;  ///< Human-readable cause
};

} // namespace rasx

#endif // RASX_ERRORS_H
