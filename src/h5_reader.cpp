/**
 * @file h5_reader.cpp
 * @brief Implementation of H5Reader and HDF5 type/dataspace helpers.
 *
 * @note Thread-safety: not thread-safe; one reader per request.
 * @note The file handle is closed when the reader goes out of scope.
 */

#include <rasx/h5_reader.h>
#include <rasx/errors.h>
#include <rasx/logging.h>

#include <filesystem>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace rasx {

namespace {

// Closes a raw HDF5 datatype id obtained from the C API.
struct TypeHandle {
    explicit TypeHandle(hid_t type_id) : id(type_id) {}
    ~TypeHandle() {
        if (id >= 0) H5Tclose(id);
    }
    TypeHandle(const TypeHandle&) = delete;
    TypeHandle& operator=(const TypeHandle&) = delete;
    hid_t id;
};

std::vector<std::string> Split(const std::string& s, char delim) {
    std::vector<std::string> parts;
    std::stringstream ss(s);
    std::string item;
    while (std::getline(ss, item, delim)) {
        if (!item.empty()) parts.push_back(item);
    }
    return parts;
}

std::string DescribeTypeId(hid_t type_id) {
    const H5T_class_t type_class = H5Tget_class(type_id);
    const size_t size = H5Tget_size(type_id);
    std::ostringstream oss;
    switch (type_class) {
    case H5T_INTEGER:
        oss << (H5Tget_sign(type_id) == H5T_SGN_NONE ? "uint" : "int") << size * 8;
        break;
    case H5T_FLOAT:
        oss << "float" << size * 8;
        break;
    case H5T_STRING:
        if (H5Tis_variable_str(type_id) > 0) {
            oss << "str";
        } else {
            oss << "|S" << size;
        }
        break;
    case H5T_COMPOUND: {
        const int nmembers = H5Tget_nmembers(type_id);
        oss << "compound{";
        for (int i = 0; i < nmembers; ++i) {
            char* member_name = H5Tget_member_name(type_id, static_cast<unsigned>(i));
            TypeHandle member_type(H5Tget_member_type(type_id, static_cast<unsigned>(i)));
            if (i > 0) oss << ", ";
            oss << (member_name ? member_name : "?") << ":"
                << (member_type.id >= 0 ? DescribeTypeId(member_type.id) : "?");
            if (member_name) H5free_memory(member_name);
        }
        oss << "}";
        break;
    }
    case H5T_ENUM: {
        TypeHandle base(H5Tget_super(type_id));
        oss << "enum(" << (base.id >= 0 ? DescribeTypeId(base.id) : "?") << ")";
        break;
    }
    case H5T_ARRAY: {
        TypeHandle base(H5Tget_super(type_id));
        const int ndims = H5Tget_array_ndims(type_id);
        std::vector<hsize_t> dims(ndims > 0 ? static_cast<size_t>(ndims) : 0);
        if (ndims > 0) H5Tget_array_dims2(type_id, dims.data());
        oss << (base.id >= 0 ? DescribeTypeId(base.id) : "?") << "[";
        for (size_t i = 0; i < dims.size(); ++i) {
            if (i > 0) oss << ",";
            oss << dims[i];
        }
        oss << "]";
        break;
    }
    case H5T_VLEN: {
        TypeHandle base(H5Tget_super(type_id));
        oss << "vlen(" << (base.id >= 0 ? DescribeTypeId(base.id) : "?") << ")";
        break;
    }
    case H5T_OPAQUE:
        oss << "|V" << size;
        break;
    case H5T_BITFIELD:
        oss << "bitfield" << size * 8;
        break;
    case H5T_REFERENCE:
        oss << "reference";
        break;
    case H5T_TIME:
        oss << "time";
        break;
    default:
        oss << "unknown";
        break;
    }
    return oss.str();
}

herr_t CollectLinkName(hid_t /*group_id*/, const char* name, const H5L_info_t* /*info*/, void* op_data) {
    auto* names = static_cast<std::vector<std::string>*>(op_data);
    names->emplace_back(name);
    return 0;
}

H5::H5File OpenFile(const std::string& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        throw OpenError("File does not exist: " + path);
    }
    if (std::filesystem::is_directory(path, ec)) {
        throw OpenError("Path is a directory, not an HDF5 file: " + path);
    }
    try {
        if (!H5::H5File::isHdf5(path)) {
            throw OpenError("Not an HDF5 file: " + path);
        }
        return H5::H5File(path, H5F_ACC_RDONLY);
    } catch (const H5::Exception& e) {
        std::ostringstream oss;
        oss << "Failed to open HDF5 file '" << path << "' read-only: " << H5Reader::DescribeException(e);
        throw OpenError(oss.str());
    }
}

} // namespace

H5Reader::H5Reader(const std::string& filepath) : file_path_(filepath) {
    // Suppress global HDF5 error printing; failures surface as exceptions
    H5::Exception::dontPrint();
    file_ = OpenFile(filepath);
    LOG_TRACE("Opened HDF5 file '" << filepath << "'");
}

H5Reader::~H5Reader() noexcept {
    try {
        file_.close();
    } catch (const H5::Exception& e) {
        LOG_DEBUG("Closing '" << file_path_ << "' failed: " << DescribeException(e));
    }
}

H5::Group H5Reader::Root() const { return file_.openGroup("/"); }

std::string H5Reader::NormalizePath(const std::string& path) {
    std::string normalized;
    for (const auto& part : Split(path, '/')) {
        normalized += "/" + part;
    }
    return normalized.empty() ? std::string("/") : normalized;
}

H5O_type_t H5Reader::ObjectType(const std::string& path) const {
    const std::string normalized = NormalizePath(path);
    if (normalized == "/") {
        return H5O_TYPE_GROUP;
    }
    try {
        // H5Lexists requires every intermediate link to exist; check each prefix.
        std::string prefix;
        for (const auto& part : Split(normalized, '/')) {
            prefix += "/" + part;
            if (!file_.nameExists(prefix)) {
                return H5O_TYPE_UNKNOWN;
            }
        }
        return file_.childObjType(normalized);
    } catch (const H5::Exception& e) {
        // Dangling soft links and paths through datasets land here.
        LOG_TRACE("Cannot resolve '" << normalized << "': " << DescribeException(e));
        return H5O_TYPE_UNKNOWN;
    }
}

H5::DataSet H5Reader::OpenDataSet(const std::string& path) const {
    const std::string normalized = NormalizePath(path);
    const H5O_type_t type = ObjectType(normalized);
    if (type == H5O_TYPE_GROUP) {
        throw DatasetNotFoundError("Path '" + normalized + "' is a group, not a dataset");
    }
    if (type != H5O_TYPE_DATASET) {
        throw DatasetNotFoundError("Dataset '" + normalized + "' not found in " + file_path_);
    }
    return file_.openDataSet(normalized);
}

H5::Group H5Reader::OpenGroup(const std::string& path) const {
    const std::string normalized = NormalizePath(path);
    if (ObjectType(normalized) != H5O_TYPE_GROUP) {
        throw DatasetNotFoundError("Group '" + normalized + "' not found in " + file_path_);
    }
    return file_.openGroup(normalized);
}

std::string H5Reader::DescribeException(const H5::Exception& e) {
    const std::string detail = e.getDetailMsg();
    if (!detail.empty()) {
        return detail;
    }
    return "HDF5 error in " + e.getFuncName();
}

std::vector<std::string> ListLinkNames(const H5::Group& group) {
    H5_index_t index_type = H5_INDEX_NAME;
    const hid_t gcpl = H5Gget_create_plist(group.getId());
    if (gcpl >= 0) {
        unsigned crt_order_flags = 0;
        if (H5Pget_link_creation_order(gcpl, &crt_order_flags) >= 0 &&
            (crt_order_flags & H5P_CRT_ORDER_TRACKED) != 0) {
            index_type = H5_INDEX_CRT_ORDER;
        }
        H5Pclose(gcpl);
    }

    std::vector<std::string> names;
    hsize_t idx = 0;
    if (H5Literate(group.getId(), index_type, H5_ITER_INC, &idx, CollectLinkName, &names) >= 0) {
        return names;
    }
    // Dense groups that track creation order without indexing it only iterate by name.
    if (index_type == H5_INDEX_CRT_ORDER) {
        names.clear();
        idx = 0;
        if (H5Literate(group.getId(), H5_INDEX_NAME, H5_ITER_INC, &idx, CollectLinkName, &names) >= 0) {
            return names;
        }
    }
    throw H5::GroupIException("ListLinkNames", "H5Literate failed");
}

std::string FormatObjectToken(unsigned long fileno, const unsigned char* bytes, size_t size) {
    std::ostringstream oss;
    oss << fileno << ":" << std::hex << std::setfill('0');
    for (size_t i = 0; i < size; ++i) {
        oss << std::setw(2) << static_cast<unsigned>(bytes[i]);
    }
    return oss.str();
}

std::string ObjectIdentity(const H5::H5Object& object) {
#if H5_VERSION_GE(1, 12, 0)
    H5O_info2_t info;
    if (H5Oget_info3(object.getId(), &info, H5O_INFO_BASIC) < 0) {
        throw H5::Exception("ObjectIdentity", "H5Oget_info3 failed");
    }
    return FormatObjectToken(info.fileno, reinterpret_cast<const unsigned char*>(&info.token), sizeof(info.token));
#else
    H5O_info_t info;
    if (H5Oget_info2(object.getId(), &info, H5O_INFO_BASIC) < 0) {
        throw H5::Exception("ObjectIdentity", "H5Oget_info2 failed");
    }
    std::ostringstream oss;
    oss << info.fileno << ":" << info.addr;
    return oss.str();
#endif
}

std::string DescribeDataType(const H5::DataType& type) { return DescribeTypeId(type.getId()); }

std::vector<hsize_t> DataSpaceDims(const H5::DataSpace& space) {
    if (space.getSimpleExtentType() != H5S_SIMPLE) {
        return {};
    }
    const int rank = space.getSimpleExtentNdims();
    std::vector<hsize_t> dims(rank > 0 ? static_cast<size_t>(rank) : 0);
    if (rank > 0) {
        space.getSimpleExtentDims(dims.data());
    }
    return dims;
}

hsize_t DataSpaceElementCount(const H5::DataSpace& space) {
    switch (space.getSimpleExtentType()) {
    case H5S_SCALAR:
        return 1;
    case H5S_SIMPLE:
        return static_cast<hsize_t>(space.getSimpleExtentNpoints());
    default:
        return 0;
    }
}

} // namespace rasx
