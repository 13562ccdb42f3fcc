// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file store.h
/// @brief Save and load object graphs to a hierarchical HDF5 store.
///
/// Layout of a saved graph:
/// - a composite is a group carrying the attribute `__class__`
/// - a List, Dict or Set is a group carrying `__container__` =
///   "sequence", "mapping" or "set"; children are named by index or key
/// - a primitive is an attribute of its parent group. int and float are
///   stored natively, strings verbatim; the rest as tagged strings:
///   "NoneType:None", "bool:True", "Path:/abs/path", "<name>:<json>"
/// - a dataset is a chunked array leaf whose leading axis is unlimited,
///   carrying `__dataset__` and one attribute per metadata entry
/// - a root that is not a composite or container is stored as `__root__`
///
/// Usage:
/// @code
///   save(experiment, "run.h5");                       // create / truncate
///   Object restored = load("run.h5");                 // eager, read-only
///
///   {
///       Session s("run.h5", FileMode::read_write);
///       Object lazy = s.load(Materialize::lazy);      // arrays become ArrayProxy
///       s.set_attribute("/", "status", "done");      // queued until flush/close
///   }                                                 // closed here
/// @endcode

#pragma once

#include "config.h"
#include "api.h"
#include "array_proxy.h"
#include "object.h"

#include <cstddef>
#include <filesystem>
#include <memory>
#include <string>

namespace objgraph {

enum class FileMode {
    read_only,          ///< existing file, no mutation
    read_write,         ///< existing file
    create_truncate,    ///< new file, replacing any existing one
    read_write_create   ///< existing file, created when missing
};

enum class Materialize {
    eager,  ///< every array is read into memory
    lazy    ///< plain numeric arrays load as ArrayProxy
};

struct StoreOptions {
    /// Chunk length along the leading axis of array leaves
    std::size_t chunk_rows = OBJGRAPH_H5_CHUNK_ROWS;
    /// Deflate level for array leaves (0 = uncompressed)
    unsigned deflate_level = OBJGRAPH_H5_DEFLATE_LEVEL;
};

/// Write `root` to `destination` (opened with `mode`)
/// @throws ReadOnlyError when `mode` is FileMode::read_only
OBJGRAPH_API void save(const Object& root,
                       const std::filesystem::path& destination,
                       FileMode mode = FileMode::create_truncate);

/// Read a whole graph eagerly from `source`
OBJGRAPH_API Object load(const std::filesystem::path& source);

// ============================================================
// Session
// ============================================================

/// Scoped handle on one open store file.
///
/// Attribute mutations are queued and written on flush() or close();
/// the destructor closes the file if it is still open.
class OBJGRAPH_API Session {
public:
    explicit Session(std::filesystem::path path,
                     FileMode mode = FileMode::read_only,
                     StoreOptions options = {});
    ~Session();

    Session(Session&&) noexcept;
    Session& operator=(Session&&) noexcept;

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    /// Replace the file contents with `root`
    void save(const Object& root);

    [[nodiscard]] Object load(Materialize materialize = Materialize::eager);

    /// Proxy on the array leaf at `path` (e.g. "/samples" or "/runs/0/data")
    [[nodiscard]] ArrayProxy array(const std::string& path);

    /// Queue an attribute write on the group or leaf at `node_path`
    void set_attribute(const std::string& node_path, const std::string& name, Object value);

    /// Current attribute value, including queued writes
    [[nodiscard]] Object attribute(const std::string& node_path, const std::string& name);

    /// Write queued attribute mutations and flush HDF5 buffers
    void flush();

    /// flush() and release the file; further calls throw StorageError
    void close();

    [[nodiscard]] bool is_open() const noexcept;
    [[nodiscard]] std::size_t pending() const noexcept;
    [[nodiscard]] FileMode mode() const noexcept;
    [[nodiscard]] const std::filesystem::path& path() const noexcept;

private:
    struct Impl;

    /// @throws StorageError on a moved-from session
    Impl& checked_impl() const;

    std::unique_ptr<Impl> impl_;
};

} // namespace objgraph
