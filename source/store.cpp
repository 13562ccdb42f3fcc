// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file store.cpp
/// @brief HDF5 store: graph <-> group/attribute/leaf mapping and Session

#include "h5_file.h"

#include <objgraph/builders.h>
#include <objgraph/classifier.h>
#include <objgraph/datasets.h>
#include <objgraph/graph.h>
#include <objgraph/log.h>
#include <objgraph/serialization.h>
#include <objgraph/type_registry.h>

#include <algorithm>
#include <array>
#include <charconv>
#include <cstddef>
#include <map>
#include <system_error>
#include <vector>

namespace objgraph {

// ============================================================
// detail: shared HDF5 helpers
// ============================================================

namespace detail {

void require_open(const FileState& state, std::string_view operation)
{
    if (!state.open) {
        throw StorageError(std::string(operation) + ": session for '" + state.path.string() + "' is closed");
    }
}

void require_writable(const FileState& state, std::string_view operation)
{
    require_open(state, operation);
    if (state.mode == FileMode::read_only) {
        throw ReadOnlyError(std::string(operation));
    }
}

const H5::PredType& h5_type_of(DType dtype)
{
    switch (dtype) {
        case DType::int8:    return H5::PredType::NATIVE_INT8;
        case DType::int16:   return H5::PredType::NATIVE_INT16;
        case DType::int32:   return H5::PredType::NATIVE_INT32;
        case DType::int64:   return H5::PredType::NATIVE_INT64;
        case DType::uint8:   return H5::PredType::NATIVE_UINT8;
        case DType::uint16:  return H5::PredType::NATIVE_UINT16;
        case DType::uint32:  return H5::PredType::NATIVE_UINT32;
        case DType::uint64:  return H5::PredType::NATIVE_UINT64;
        case DType::float32: return H5::PredType::NATIVE_FLOAT;
        case DType::float64: return H5::PredType::NATIVE_DOUBLE;
    }
    throw StorageError("no HDF5 type for dtype " + std::to_string(static_cast<int>(dtype)));
}

DType dtype_of_leaf(const H5::DataSet& leaf)
{
    switch (leaf.getTypeClass()) {
        case H5T_INTEGER: {
            H5::IntType type = leaf.getIntType();
            const bool is_signed = type.getSign() != H5T_SGN_NONE;
            switch (type.getSize()) {
                case 1: return is_signed ? DType::int8 : DType::uint8;
                case 2: return is_signed ? DType::int16 : DType::uint16;
                case 4: return is_signed ? DType::int32 : DType::uint32;
                case 8: return is_signed ? DType::int64 : DType::uint64;
                default: break;
            }
            break;
        }
        case H5T_FLOAT: {
            H5::FloatType type = leaf.getFloatType();
            if (type.getSize() == 4) return DType::float32;
            if (type.getSize() == 8) return DType::float64;
            break;
        }
        default:
            break;
    }
    throw StorageError("leaf '" + leaf.getObjName() + "' does not hold numeric elements");
}

Shape shape_of_leaf(const H5::DataSet& leaf)
{
    H5::DataSpace space = leaf.getSpace();
    const int rank = space.getSimpleExtentNdims();
    std::vector<hsize_t> dims(static_cast<std::size_t>(rank));
    if (rank > 0) {
        space.getSimpleExtentDims(dims.data());
    }
    return Shape(dims.begin(), dims.end());
}

// ------------------------------------------------------------
// Attribute codec
//
// int and float are stored natively. Every other scalar is a string:
//   null          "NoneType:None"
//   bool          "bool:True" / "bool:False"
//   Path          "Path:<absolute path>"
//   user type     "<registered name>:<compact JSON of the encoded value>"
//   str           verbatim, or "str:<text>" when the text starts with
//                 a registered primitive name followed by ':'
// ------------------------------------------------------------

namespace {

constexpr std::string_view str_prefix = "str:";
constexpr std::string_view none_text = "NoneType:None";
constexpr std::string_view true_text = "bool:True";
constexpr std::string_view false_text = "bool:False";
constexpr std::string_view path_prefix = "Path:";

bool has_primitive_prefix(std::string_view text)
{
    const auto colon = text.find(':');
    if (colon == std::string_view::npos) return false;
    return TypeRegistry::instance().find_primitive(text.substr(0, colon)) != nullptr;
}

std::string encode_attribute_text(const std::string& name, const Value& value)
{
    if (value.is_null()) return std::string(none_text);
    if (auto* b = value.get_if<bool>()) return std::string(*b ? true_text : false_text);
    if (auto* p = value.get_if<std::filesystem::path>()) {
        return std::string(path_prefix) + std::filesystem::absolute(*p).generic_string();
    }
    if (auto* s = value.get_if<std::string>()) {
        return has_primitive_prefix(*s) ? std::string(str_prefix) + *s : *s;
    }
    if (value.is_map() && value.contains(keys::primitive)) {
        return value.at(keys::primitive).as_string() + ":" + to_json(value.at(keys::value), true);
    }
    throw StorageError("attribute '" + name + "' cannot hold " + value_to_string(value));
}

Value decode_attribute_text(const std::string& text)
{
    const auto colon = text.find(':');
    if (colon == std::string::npos) return Value{text};

    const std::string prefix = text.substr(0, colon);
    std::string rest = text.substr(colon + 1);

    if (prefix == "str") return Value{std::move(rest)};
    if (text == none_text) return Value{};
    if (text == true_text) return Value{true};
    if (text == false_text) return Value{false};
    if (prefix == "Path") return Value{std::filesystem::path(rest)};

    const PrimitiveCodec* codec = TypeRegistry::instance().find_primitive(prefix);
    if (codec == nullptr || codec->builtin) return Value{text};

    std::string error;
    Value payload = from_json(rest, &error);
    if (!error.empty()) {
        throw StorageError("attribute payload of primitive '" + prefix + "' is not valid JSON: " + error);
    }
    return MapBuilder()
        .set(keys::primitive, prefix)
        .set(keys::value, std::move(payload))
        .finish();
}

} // anonymous namespace

void write_attribute(H5::H5Object& target, const std::string& name, const Value& value)
{
    if (target.attrExists(name)) {
        target.removeAttr(name);
    }

    H5::DataSpace scalar(H5S_SCALAR);
    if (auto* i = value.get_if<int64_t>()) {
        H5::Attribute attr = target.createAttribute(name, H5::PredType::NATIVE_INT64, scalar);
        attr.write(H5::PredType::NATIVE_INT64, i);
        return;
    }
    if (auto* d = value.get_if<double>()) {
        H5::Attribute attr = target.createAttribute(name, H5::PredType::NATIVE_DOUBLE, scalar);
        attr.write(H5::PredType::NATIVE_DOUBLE, d);
        return;
    }

    const H5std_string text = encode_attribute_text(name, value);
    H5::StrType str_type(H5::PredType::C_S1, H5T_VARIABLE);
    H5::Attribute attr = target.createAttribute(name, str_type, scalar);
    attr.write(str_type, text);
}

Value read_attribute(const H5::Attribute& attr)
{
    switch (attr.getTypeClass()) {
        case H5T_INTEGER: {
            int64_t v = 0;
            attr.read(H5::PredType::NATIVE_INT64, &v);
            return Value{v};
        }
        case H5T_FLOAT: {
            double v = 0.0;
            attr.read(H5::PredType::NATIVE_DOUBLE, &v);
            return Value{v};
        }
        case H5T_STRING: {
            H5std_string text;
            attr.read(attr.getStrType(), text);
            return decode_attribute_text(text);
        }
        default:
            break;
    }
    throw StorageError("attribute '" + attr.getName() + "' has an unsupported element type");
}

} // namespace detail

namespace {

using detail::guard_h5;

// ============================================================
// Helpers
// ============================================================

bool is_tagged(const Value& node, const char* key)
{
    return node.is_map() && node.contains(key);
}

bool is_attribute_node(const Value& node)
{
    return node.is_scalar() || is_tagged(node, keys::primitive);
}

std::string child_path(const std::string& parent, const std::string& name)
{
    return parent == "/" ? "/" + name : parent + "/" + name;
}

void check_node_name(const std::string& name)
{
    if (name.empty() || name.find('/') != std::string::npos || name == "." || name == "..") {
        throw StorageError("'" + name + "' cannot be used as a store node name");
    }
}

/// Remove every child link and attribute of `group`
void clear_group(H5::Group& group)
{
    std::vector<std::string> children;
    for (hsize_t i = 0; i < group.getNumObjs(); ++i) {
        children.push_back(group.getObjnameByIdx(i));
    }
    for (const auto& name : children) {
        group.unlink(name);
    }

    std::vector<std::string> attributes;
    const int count = group.getNumAttrs();
    for (int i = 0; i < count; ++i) {
        attributes.push_back(group.openAttribute(static_cast<unsigned>(i)).getName());
    }
    for (const auto& name : attributes) {
        group.removeAttr(name);
    }
}

std::string tag_string(const Value& node, const char* key)
{
    Value tag = node.at(key);
    if (!tag.is_string()) {
        throw StorageError(std::string("reserved key '") + key + "' must hold a string, got " + value_to_string(tag));
    }
    return tag.as_string();
}

// ============================================================
// GraphWriter: nested Value -> groups, attributes and leaves
// ============================================================

class GraphWriter {
public:
    explicit GraphWriter(const StoreOptions& options) : options_(options) {}

    void write_root(H5::Group& root, const Value& node)
    {
        if (is_group_node(node)) {
            write_group(root, node);
        } else {
            write_node(root, detail::root_key, node);
        }
    }

private:
    static bool is_group_node(const Value& node)
    {
        if (node.is_vector()) return true;
        return node.is_map() && !node.contains(keys::dataset) && !node.contains(keys::primitive);
    }

    void write_node(H5::Group& parent, const std::string& name, const Value& node)
    {
        check_node_name(name);

        if (is_attribute_node(node)) {
            detail::write_attribute(parent, name, node);
        } else if (is_tagged(node, keys::dataset)) {
            write_leaf(parent, name, node);
        } else if (node.is_ndarray()) {
            write_leaf(parent, name, MapBuilder()
                .set(keys::dataset, dataset_kind::ndarray)
                .set(keys::data, node)
                .finish());
        } else {
            H5::Group group = parent.createGroup(name);
            write_group(group, node);
        }
    }

    void write_group(H5::Group& group, const Value& node)
    {
        if (auto* items = node.get_if<ValueVector>()) {
            detail::write_attribute(group, keys::container, Value{"sequence"});
            write_items(group, *items);
            return;
        }

        if (node.contains(keys::class_tag)) {
            detail::write_attribute(group, keys::class_tag, Value{tag_string(node, keys::class_tag)});
            write_members(group, node);
            return;
        }

        if (node.contains(keys::container)) {
            const std::string kind = tag_string(node, keys::container);
            if (kind != "set") {
                throw ResolutionError(kind, "unknown container kind");
            }
            detail::write_attribute(group, keys::container, Value{kind});
            write_items(group, node.at(keys::items).as_vector());
            return;
        }

        detail::write_attribute(group, keys::container, Value{"mapping"});
        write_members(group, node);
    }

    void write_items(H5::Group& group, const ValueVector& items)
    {
        std::size_t index = 0;
        for (const auto& item : items) {
            write_node(group, std::to_string(index++), item.get());
        }
    }

    void write_members(H5::Group& group, const Value& node)
    {
        for (const auto& [key, member] : *node.get_if<ValueMap>()) {
            if (is_reserved_key(key)) continue;
            write_node(group, key, member.get());
        }
    }

    void write_leaf(H5::Group& parent, const std::string& name, const Value& node)
    {
        const std::string kind = tag_string(node, keys::dataset);
        const Value data_node = node.at(keys::data);
        const NdArray* array = data_node.as_ndarray();
        if (!array) {
            throw StorageError("dataset '" + kind + "' at '" + name + "' has no array");
        }

        const H5::PredType& type = detail::h5_type_of(array->dtype());
        H5::DataSet leaf;

        if (array->ndim() == 0) {
            H5::DataSpace space(H5S_SCALAR);
            leaf = parent.createDataSet(name, type, space);
        } else {
            const std::size_t rank = array->ndim();
            std::vector<hsize_t> dims(array->shape().begin(), array->shape().end());
            std::vector<hsize_t> max_dims = dims;
            max_dims[0] = H5S_UNLIMITED;

            std::vector<hsize_t> chunk(rank);
            chunk[0] = std::max<hsize_t>(1, options_.chunk_rows);
            for (std::size_t i = 1; i < rank; ++i) {
                chunk[i] = std::max<hsize_t>(1, dims[i]);
            }

            H5::DSetCreatPropList plist;
            plist.setChunk(static_cast<int>(rank), chunk.data());
            const std::array<std::byte, 8> zero{};
            plist.setFillValue(type, zero.data());
            if (options_.deflate_level > 0) {
                plist.setDeflate(static_cast<int>(options_.deflate_level));
            }

            H5::DataSpace space(static_cast<int>(rank), dims.data(), max_dims.data());
            leaf = parent.createDataSet(name, type, space, plist);
        }

        if (array->size() > 0) {
            leaf.write(array->data(), type);
        }

        detail::write_attribute(leaf, keys::dataset, Value{kind});
        for (const auto& [key, meta] : *node.get_if<ValueMap>()) {
            if (key == keys::dataset || key == keys::data) continue;
            if (!is_attribute_node(meta.get())) {
                throw StorageError("metadata '" + key + "' of dataset '" + name +
                                   "' must be a primitive to be stored as an attribute");
            }
            detail::write_attribute(leaf, key, meta.get());
        }
    }

    const StoreOptions& options_;
};

// ============================================================
// GraphReader: groups, attributes and leaves -> nested Value
// ============================================================

class GraphReader {
public:
    GraphReader(bool lazy, std::string file_name)
        : lazy_(lazy), file_name_(std::move(file_name)) {}

    Value read_root(H5::Group& root)
    {
        if (root.attrExists(keys::class_tag) || root.attrExists(keys::container)) {
            return read_group(root, "/");
        }
        if (root.attrExists(detail::root_key)) {
            return detail::read_attribute(root.openAttribute(detail::root_key));
        }
        if (root.nameExists(detail::root_key)) {
            const std::string path = child_path("/", detail::root_key);
            if (root.childObjType(detail::root_key) == H5O_TYPE_DATASET) {
                H5::DataSet leaf = root.openDataSet(detail::root_key);
                return read_leaf(leaf, path);
            }
            H5::Group group = root.openGroup(detail::root_key);
            return read_group(group, path);
        }
        throw StorageError("'" + file_name_ + "' holds no object graph");
    }

private:
    using Members = std::vector<std::pair<std::string, Value>>;

    Value read_group(H5::Group& group, const std::string& path)
    {
        std::string class_tag;
        std::string container;
        Members members;

        const int attr_count = group.getNumAttrs();
        for (int i = 0; i < attr_count; ++i) {
            H5::Attribute attr = group.openAttribute(static_cast<unsigned>(i));
            const std::string name = attr.getName();
            if (name == keys::class_tag) {
                class_tag = detail::read_attribute(attr).as_string();
            } else if (name == keys::container) {
                container = detail::read_attribute(attr).as_string();
            } else if (!is_reserved_key(name)) {
                members.emplace_back(name, detail::read_attribute(attr));
            }
        }

        for (hsize_t i = 0; i < group.getNumObjs(); ++i) {
            const std::string name = group.getObjnameByIdx(i);
            switch (group.childObjType(name)) {
                case H5O_TYPE_GROUP: {
                    H5::Group child = group.openGroup(name);
                    members.emplace_back(name, read_group(child, child_path(path, name)));
                    break;
                }
                case H5O_TYPE_DATASET: {
                    H5::DataSet leaf = group.openDataSet(name);
                    members.emplace_back(name, read_leaf(leaf, child_path(path, name)));
                    break;
                }
                default:
                    detail::log_name_event("GraphReader::read_group", child_path(path, name),
                                           "is neither group nor leaf, skipped");
                    break;
            }
        }

        if (!class_tag.empty()) {
            MapBuilder builder;
            builder.set(keys::class_tag, class_tag);
            for (auto& [name, member] : members) {
                builder.set(name, std::move(member));
            }
            return builder.finish();
        }

        if (container == "sequence") {
            return indexed_items(members, path);
        }
        if (container == "set") {
            return MapBuilder()
                .set(keys::container, container)
                .set(keys::items, indexed_items(members, path))
                .finish();
        }
        if (!container.empty() && container != "mapping") {
            throw ResolutionError(container, "unknown container kind at '" + path + "'");
        }

        MapBuilder builder;
        for (auto& [name, member] : members) {
            builder.set(name, std::move(member));
        }
        return builder.finish();
    }

    /// Members named "0".."n-1" as a vector in index order
    static Value indexed_items(Members& members, const std::string& path)
    {
        std::map<std::size_t, Value> by_index;
        for (auto& [name, member] : members) {
            std::size_t index = 0;
            auto [ptr, ec] = std::from_chars(name.data(), name.data() + name.size(), index);
            if (ec != std::errc{} || ptr != name.data() + name.size()) {
                throw StorageError("member '" + name + "' of sequence '" + path + "' is not an index");
            }
            by_index.emplace(index, std::move(member));
        }

        VectorBuilder builder;
        std::size_t expected = 0;
        for (auto& [index, item] : by_index) {
            if (index != expected++) {
                throw StorageError("sequence '" + path + "' is missing element " + std::to_string(expected - 1));
            }
            builder.push_back(std::move(item));
        }
        return builder.finish();
    }

    Value read_leaf(H5::DataSet& leaf, const std::string& path)
    {
        std::string kind = dataset_kind::ndarray;
        Members metadata;

        const int attr_count = leaf.getNumAttrs();
        for (int i = 0; i < attr_count; ++i) {
            H5::Attribute attr = leaf.openAttribute(static_cast<unsigned>(i));
            const std::string name = attr.getName();
            if (name == keys::dataset) {
                kind = detail::read_attribute(attr).as_string();
            } else {
                metadata.emplace_back(name, detail::read_attribute(attr));
            }
        }

        MapBuilder builder;
        builder.set(keys::dataset, kind);

        if (lazy_ && (kind == dataset_kind::ndarray || kind == dataset_kind::array_proxy)) {
            builder.set(detail::leaf_key, path);
            return builder.finish();
        }

        const DType dtype = detail::dtype_of_leaf(leaf);
        NdArray array(dtype, detail::shape_of_leaf(leaf));
        if (array.size() > 0) {
            leaf.read(array.data(), detail::h5_type_of(dtype));
        }
        builder.set(keys::data, std::move(array));
        for (auto& [name, meta] : metadata) {
            builder.set(name, std::move(meta));
        }
        return builder.finish();
    }

    bool lazy_;
    std::string file_name_;
};

unsigned open_flags(FileMode mode, const std::filesystem::path& path)
{
    switch (mode) {
        case FileMode::read_only:         return H5F_ACC_RDONLY;
        case FileMode::read_write:        return H5F_ACC_RDWR;
        case FileMode::create_truncate:   return H5F_ACC_TRUNC;
        case FileMode::read_write_create:
            return std::filesystem::exists(path) ? H5F_ACC_RDWR : H5F_ACC_TRUNC;
    }
    return H5F_ACC_RDONLY;
}

std::string normalize_path(const std::string& path)
{
    if (path.empty()) return "/";
    return path.front() == '/' ? path : "/" + path;
}

/// Attribute write queued by Session::set_attribute
struct PendingAttribute {
    std::string node;
    std::string name;
    Value value;
};

} // anonymous namespace

// ============================================================
// Session
// ============================================================

struct Session::Impl {
    std::shared_ptr<detail::FileState> state;
    std::vector<PendingAttribute> pending;

    void apply_pending()
    {
        detail::FileState& st = *state;
        std::size_t applied = 0;
        try {
            for (; applied < pending.size(); ++applied) {
                const PendingAttribute& p = pending[applied];
                guard_h5("cannot write attribute '" + p.name + "' on '" + p.node + "'", [&] {
                    detail::with_node(st.file, p.node, [&](H5::H5Object& target) {
                        detail::write_attribute(target, p.name, p.value);
                    });
                });
            }
        } catch (const Error&) {
            pending.erase(pending.begin(), pending.begin() + static_cast<std::ptrdiff_t>(applied));
            throw;
        }
        pending.clear();
    }
};

Session::Session(std::filesystem::path path, FileMode mode, StoreOptions options)
    : impl_(std::make_unique<Impl>())
{
    H5::Exception::dontPrint();

    const std::string file_name = path.string();
    H5::H5File file = guard_h5("cannot open '" + file_name + "'", [&] {
        return H5::H5File(file_name, open_flags(mode, path));
    });

    impl_->state = std::make_shared<detail::FileState>(
        detail::FileState{std::move(file), std::move(path), mode, options, true});
    detail::log_name_event("Session", file_name, "opened");
}

Session::~Session()
{
    if (!is_open()) return;
    try {
        close();
    } catch (const std::exception& e) {
        detail::log_error("Session::~Session", e.what());
    }
}

Session::Session(Session&&) noexcept = default;

Session& Session::operator=(Session&& other) noexcept
{
    if (this != &other) {
        if (is_open()) {
            try {
                close();
            } catch (const std::exception& e) {
                detail::log_error("Session::operator=", e.what());
            }
        }
        impl_ = std::move(other.impl_);
    }
    return *this;
}

Session::Impl& Session::checked_impl() const
{
    if (!impl_) throw StorageError("session has been moved from");
    return *impl_;
}

void Session::save(const Object& root)
{
    Impl& impl = checked_impl();
    detail::FileState& st = *impl.state;
    detail::require_writable(st, "Session::save");

    // Serialize first: proxies in `root` may point into this file
    const Value node = serialize(root);

    guard_h5("cannot save to '" + st.path.string() + "'", [&] {
        H5::Group group = st.file.openGroup("/");
        clear_group(group);
        GraphWriter(st.options).write_root(group, node);
        st.file.flush(H5F_SCOPE_GLOBAL);
    });
    detail::log_name_event("Session::save", st.path.string(), "graph written");
}

Object Session::load(Materialize materialize)
{
    Impl& impl = checked_impl();
    detail::require_open(*impl.state, "Session::load");
    if (!impl.pending.empty()) {
        impl.apply_pending();
    }

    const bool lazy = materialize == Materialize::lazy;
    detail::FileState& st = *impl.state;
    const Value node = guard_h5("cannot load '" + st.path.string() + "'", [&] {
        H5::Group root = st.file.openGroup("/");
        return GraphReader(lazy, st.path.string()).read_root(root);
    });

    if (!lazy) return deserialize(node);

    std::shared_ptr<detail::FileState> state = impl.state;
    return deserialize(node, [state](const Value& leaf) -> Object {
        if (!leaf.contains(detail::leaf_key)) return Object{};
        return Object::wrap(ArrayProxy(state, leaf.at(detail::leaf_key).as_string()));
    });
}

ArrayProxy Session::array(const std::string& path)
{
    Impl& impl = checked_impl();
    detail::require_open(*impl.state, "Session::array");

    const std::string leaf_path = normalize_path(path);
    guard_h5("no array leaf at '" + leaf_path + "'", [&] {
        H5::DataSet leaf = impl.state->file.openDataSet(leaf_path);
        (void)leaf;
    });
    return ArrayProxy(impl.state, leaf_path);
}

void Session::set_attribute(const std::string& node_path, const std::string& name, Object value)
{
    Impl& impl = checked_impl();
    detail::require_writable(*impl.state, "Session::set_attribute");

    check_node_name(name);
    if (is_reserved_key(name)) {
        throw ValidationError("attribute name '" + name + "' is reserved");
    }

    Value encoded = serialize(value);
    if (!is_attribute_node(encoded)) {
        throw StorageError("attribute '" + name + "' must hold a primitive value, got '" +
                           type_name(value) + "'");
    }
    impl.pending.push_back(PendingAttribute{normalize_path(node_path), name, std::move(encoded)});
}

Object Session::attribute(const std::string& node_path, const std::string& name)
{
    Impl& impl = checked_impl();
    detail::FileState& st = *impl.state;
    detail::require_open(st, "Session::attribute");

    const std::string path = normalize_path(node_path);
    for (auto it = impl.pending.rbegin(); it != impl.pending.rend(); ++it) {
        if (it->node == path && it->name == name) return deserialize(it->value);
    }

    const Value stored = guard_h5("cannot read attribute '" + name + "' of '" + path + "'", [&] {
        Value result;
        detail::with_node(st.file, path, [&](H5::H5Object& target) {
            if (!target.attrExists(name)) {
                throw StorageError("'" + path + "' has no attribute '" + name + "'");
            }
            result = detail::read_attribute(target.openAttribute(name));
        });
        return result;
    });
    return deserialize(stored);
}

void Session::flush()
{
    Impl& impl = checked_impl();
    detail::FileState& st = *impl.state;
    detail::require_open(st, "Session::flush");

    impl.apply_pending();
    if (st.mode != FileMode::read_only) {
        guard_h5("cannot flush '" + st.path.string() + "'", [&] { st.file.flush(H5F_SCOPE_GLOBAL); });
    }
    detail::log_name_event("Session::flush", st.path.string(), "flushed");
}

void Session::close()
{
    Impl& impl = checked_impl();
    detail::FileState& st = *impl.state;
    if (!st.open) return;

    auto release = [&] {
        st.open = false;
        guard_h5("cannot close '" + st.path.string() + "'", [&] { st.file.close(); });
    };

    try {
        flush();
    } catch (const Error&) {
        impl.pending.clear();
        release();
        throw;
    }
    release();
    detail::log_name_event("Session::close", st.path.string(), "closed");
}

bool Session::is_open() const noexcept
{
    return impl_ && impl_->state && impl_->state->open;
}

std::size_t Session::pending() const noexcept
{
    return impl_ ? impl_->pending.size() : 0;
}

FileMode Session::mode() const noexcept
{
    return impl_ ? impl_->state->mode : FileMode::read_only;
}

const std::filesystem::path& Session::path() const noexcept
{
    static const std::filesystem::path empty;
    return impl_ ? impl_->state->path : empty;
}

// ============================================================
// Free functions
// ============================================================

void save(const Object& root, const std::filesystem::path& destination, FileMode mode)
{
    if (mode == FileMode::read_only) {
        throw ReadOnlyError("save");
    }
    Session session(destination, mode);
    session.save(root);
    session.close();
}

Object load(const std::filesystem::path& source)
{
    Session session(source, FileMode::read_only);
    return session.load(Materialize::eager);
}

} // namespace objgraph
