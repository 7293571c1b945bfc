/**
 * @file structure_walker.cpp
 * @brief Implementation of StructureWalker and attribute stringification.
 *
 * @note Children are listed in the file's own link order (see ListLinkNames).
 * @note Hard-link cycles are detected against the chain of open ancestors; a
 *       group linked from two unrelated places is listed at both places.
 */

#include <rasx/structure_walker.h>
#include <rasx/logging.h>

#include <algorithm>
#include <iomanip>
#include <sstream>

namespace rasx {

namespace {

herr_t CollectAttributeName(hid_t /*location_id*/, const char* name, const H5A_info_t* /*info*/, void* op_data) {
    auto* names = static_cast<std::vector<std::string>*>(op_data);
    names->emplace_back(name);
    return 0;
}

std::string TrimFixedString(const std::string& raw) {
    std::string value = raw.substr(0, raw.find('\0'));
    value.erase(value.find_last_not_of(' ') + 1);
    return value;
}

std::string JoinValues(const std::vector<std::string>& values, bool scalar) {
    if (scalar && values.size() == 1) {
        return values.front();
    }
    std::ostringstream oss;
    oss << "[";
    for (size_t i = 0; i < values.size(); ++i) {
        if (i > 0) oss << ", ";
        oss << values[i];
    }
    oss << "]";
    return oss.str();
}

std::vector<std::string> ReadStringValues(const H5::Attribute& attribute, const H5::DataType& type,
                                          const H5::DataSpace& space, hsize_t count) {
    std::vector<std::string> values;
    if (space.getSimpleExtentType() == H5S_SCALAR) {
        std::string value;
        attribute.read(attribute.getStrType(), value);
        values.push_back(TrimFixedString(value));
        return values;
    }
    if (type.isVariableStr()) {
        H5::StrType mem_type(H5::PredType::C_S1, H5T_VARIABLE);
        std::vector<char*> buffer(count, nullptr);
        attribute.read(mem_type, buffer.data());
        for (char* item : buffer) {
            values.emplace_back(item ? item : "");
        }
        H5::DataSet::vlenReclaim(buffer.data(), mem_type, space);
        return values;
    }
    const size_t width = type.getSize();
    std::vector<char> buffer(count * width, '\0');
    attribute.read(type, buffer.data());
    for (hsize_t i = 0; i < count; ++i) {
        values.push_back(TrimFixedString(std::string(buffer.data() + i * width, width)));
    }
    return values;
}

std::string TypeClassName(H5T_class_t type_class) {
    switch (type_class) {
    case H5T_COMPOUND: return "compound";
    case H5T_OPAQUE: return "opaque";
    case H5T_REFERENCE: return "reference";
    case H5T_ARRAY: return "array";
    case H5T_VLEN: return "vlen";
    case H5T_BITFIELD: return "bitfield";
    case H5T_TIME: return "time";
    default: return "unknown";
    }
}

void Annotate(TreeNode& node, WalkResult& result, const std::string& message) {
    node.error = node.error ? *node.error + "; " + message : message;
    result.errors.push_back(TraversalError{node.path, message});
    cli::CollectWarning(node.path + ": " + message);
}

} // namespace

std::string AttributeToString(const H5::Attribute& attribute) {
    const H5::DataType type = attribute.getDataType();
    const H5::DataSpace space = attribute.getSpace();
    const hsize_t count = DataSpaceElementCount(space);
    const bool scalar = space.getSimpleExtentType() == H5S_SCALAR;
    if (count == 0) {
        return scalar ? std::string() : std::string("[]");
    }

    std::vector<std::string> values;
    switch (type.getClass()) {
    case H5T_STRING:
        values = ReadStringValues(attribute, type, space, count);
        break;
    case H5T_INTEGER:
        if (H5Tget_sign(type.getId()) == H5T_SGN_NONE) {
            std::vector<unsigned long long> buffer(count);
            attribute.read(H5::PredType::NATIVE_ULLONG, buffer.data());
            for (auto v : buffer) values.push_back(std::to_string(v));
        } else {
            std::vector<long long> buffer(count);
            attribute.read(H5::PredType::NATIVE_LLONG, buffer.data());
            for (auto v : buffer) values.push_back(std::to_string(v));
        }
        break;
    case H5T_FLOAT: {
        // Single precision values print with 7 significant digits so 0.1f reads "0.1".
        const int precision = type.getSize() <= 4 ? 7 : 15;
        std::vector<double> buffer(count);
        attribute.read(H5::PredType::NATIVE_DOUBLE, buffer.data());
        for (double v : buffer) {
            std::ostringstream oss;
            oss << std::setprecision(precision) << v;
            values.push_back(oss.str());
        }
        break;
    }
    case H5T_ENUM: {
        const H5::EnumType enum_type = attribute.getEnumType();
        const size_t width = enum_type.getSize();
        std::vector<unsigned char> buffer(count * width);
        attribute.read(enum_type, buffer.data());
        for (hsize_t i = 0; i < count; ++i) {
            values.push_back(enum_type.nameOf(buffer.data() + i * width, 256));
        }
        break;
    }
    default:
        return "<" + TypeClassName(type.getClass()) + ">";
    }
    return JoinValues(values, scalar);
}

std::map<std::string, std::string> ReadAttributes(const H5::H5Object& object,
                                                  std::vector<std::string>& failures) {
    std::map<std::string, std::string> attributes;
    std::vector<std::string> names;
    hsize_t idx = 0;
    if (H5Aiterate2(object.getId(), H5_INDEX_NAME, H5_ITER_INC, &idx, CollectAttributeName, &names) < 0) {
        failures.push_back("cannot list attributes");
        return attributes;
    }
    for (const auto& name : names) {
        try {
            const H5::Attribute attribute = object.openAttribute(name);
            attributes[name] = AttributeToString(attribute);
        } catch (const H5::Exception& e) {
            failures.push_back("unreadable attribute '" + name + "': " + H5Reader::DescribeException(e));
        }
    }
    return attributes;
}

//-----------------------------------------------------------------------------
// StructureWalker
//-----------------------------------------------------------------------------

StructureWalker::StructureWalker(WalkOptions options) : options_(std::move(options)) {}

WalkResult StructureWalker::Walk(const H5Reader& reader) const {
    WalkResult result;
    result.root.name = "/";
    result.root.path = "/";
    result.root.kind = NodeKind::Group;

    const H5::Group root = reader.Root();
    if (options_.include_attributes) {
        CollectAttributes(root, result.root, result);
    }
    std::vector<std::string> ancestors{ObjectIdentity(root)};
    VisitGroup(root, result.root, 0, ancestors, result);

    LOG_DEBUG("Walked '" << reader.GetPath() << "': " << result.total_groups << " groups, "
              << result.total_datasets << " datasets, " << result.errors.size() << " traversal errors");
    return result;
}

void StructureWalker::VisitGroup(const H5::Group& group, TreeNode& node, int depth,
                                 std::vector<std::string>& ancestors, WalkResult& result) const {
    if (options_.max_depth && depth >= *options_.max_depth) {
        return;
    }

    std::vector<std::string> names;
    try {
        names = ListLinkNames(group);
    } catch (const H5::Exception& e) {
        Annotate(node, result, "cannot list links: " + H5Reader::DescribeException(e));
        return;
    }

    for (const auto& name : names) {
        ChildOutcome outcome = VisitChild(group, node.path, name, depth + 1, ancestors, result);
        if (outcome.node) {
            node.children.push_back(std::move(*outcome.node));
        } else if (outcome.error) {
            cli::CollectWarning("Skipped " + outcome.error->path + ": " + outcome.error->message);
            node.skipped.push_back(*outcome.error);
            result.errors.push_back(*outcome.error);
        }
    }
}

StructureWalker::ChildOutcome StructureWalker::VisitChild(const H5::Group& parent, const std::string& parent_path,
                                                          const std::string& name, int depth,
                                                          std::vector<std::string>& ancestors,
                                                          WalkResult& result) const {
    const std::string path = JoinPath(parent_path, name);
    ChildOutcome outcome;
    try {
        // Follows soft and external links; dangling links throw here.
        const H5O_type_t type = parent.childObjType(name);

        if (type == H5O_TYPE_GROUP) {
            const H5::Group group = parent.openGroup(name);
            const std::string identity = ObjectIdentity(group);
            if (std::find(ancestors.begin(), ancestors.end(), identity) != ancestors.end()) {
                outcome.error = TraversalError{path, "link cycle: group is already open as an ancestor"};
                return outcome;
            }
            TreeNode node;
            node.name = name;
            node.path = path;
            node.kind = NodeKind::Group;
            result.total_groups++;
            if (options_.include_attributes) {
                CollectAttributes(group, node, result);
            }
            ancestors.push_back(identity);
            VisitGroup(group, node, depth, ancestors, result);
            ancestors.pop_back();
            outcome.node = std::move(node);
            return outcome;
        }

        if (type == H5O_TYPE_DATASET) {
            const H5::DataSet dataset = parent.openDataSet(name);
            TreeNode node;
            node.name = name;
            node.path = path;
            node.kind = NodeKind::Dataset;
            result.total_datasets++;
            DescribeDataset(dataset, node, result);
            if (options_.include_attributes) {
                CollectAttributes(dataset, node, result);
            }
            outcome.node = std::move(node);
            return outcome;
        }

        // Committed datatypes are neither groups nor datasets.
        LOG_TRACE("Ignoring non-group, non-dataset entry '" << path << "'");
        return outcome;
    } catch (const H5::Exception& e) {
        outcome.error = TraversalError{path, H5Reader::DescribeException(e)};
    } catch (const std::exception& e) {
        outcome.error = TraversalError{path, e.what()};
    }
    return outcome;
}

void StructureWalker::DescribeDataset(const H5::DataSet& dataset, TreeNode& node, WalkResult& result) const {
    try {
        const std::vector<hsize_t> dims = DataSpaceDims(dataset.getSpace());
        node.shape = std::vector<uint64_t>(dims.begin(), dims.end());
    } catch (const H5::Exception& e) {
        Annotate(node, result, "unreadable shape: " + H5Reader::DescribeException(e));
    }
    try {
        node.dtype = DescribeDataType(dataset.getDataType());
    } catch (const H5::Exception& e) {
        Annotate(node, result, "unreadable type: " + H5Reader::DescribeException(e));
    }
}

void StructureWalker::CollectAttributes(const H5::H5Object& object, TreeNode& node, WalkResult& result) const {
    std::vector<std::string> failures;
    node.attributes = ReadAttributes(object, failures);
    for (const auto& failure : failures) {
        Annotate(node, result, failure);
    }
}

} // namespace rasx
