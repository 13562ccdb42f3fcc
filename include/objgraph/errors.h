// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file errors.h
/// @brief Exception types raised by objgraph.
///
/// Every failure is reported synchronously to the caller by throwing one of
/// these types. All of them derive from objgraph::Error, itself a
/// std::runtime_error, so callers that only care about "something failed"
/// can catch a single type.

#pragma once

#include "api.h"

#include <stdexcept>
#include <string>

namespace objgraph {

class OBJGRAPH_API Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// A type tag (composite, dataset or primitive kind) is not registered.
class OBJGRAPH_API ResolutionError : public Error {
public:
    explicit ResolutionError(std::string name)
        : Error("cannot resolve type '" + name + "': not registered")
        , name_(std::move(name)) {}

    ResolutionError(std::string name, const std::string& message)
        : Error("cannot resolve type '" + name + "': " + message)
        , name_(std::move(name)) {}

    [[nodiscard]] const std::string& name() const noexcept { return name_; }

private:
    std::string name_;
};

/// A value is neither primitive, dataset, container nor composite.
class OBJGRAPH_API ClassificationError : public Error {
public:
    explicit ClassificationError(std::string type_name)
        : Error("unsupported type '" + type_name + "': not primitive, dataset, container or composite")
        , type_name_(std::move(type_name)) {}

    [[nodiscard]] const std::string& type_name() const noexcept { return type_name_; }

private:
    std::string type_name_;
};

/// A slot parser rejected the assigned value.
class OBJGRAPH_API ValidationError : public Error {
public:
    using Error::Error;
};

/// A write-once slot was assigned a second time.
class OBJGRAPH_API ImmutabilityError : public Error {
public:
    ImmutabilityError(const std::string& type_name, std::string slot)
        : Error("slot '" + slot + "' of '" + type_name + "' is write-once and already assigned")
        , slot_(std::move(slot)) {}

    [[nodiscard]] const std::string& slot() const noexcept { return slot_; }

private:
    std::string slot_;
};

/// A slot name or slot definition does not belong to the composite type.
class OBJGRAPH_API SlotError : public Error {
public:
    using Error::Error;
};

/// Conflicting registration (a type registered as both primitive and dataset).
class OBJGRAPH_API RegistrationError : public Error {
public:
    using Error::Error;
};

/// Failure reported by the hierarchical store (HDF5, closed session, ...).
class OBJGRAPH_API StorageError : public Error {
public:
    using Error::Error;
};

/// Mutation attempted through a read-only session or proxy.
class OBJGRAPH_API ReadOnlyError : public StorageError {
public:
    explicit ReadOnlyError(const std::string& operation)
        : StorageError(operation + ": store is opened read-only") {}
};

/// Resize along a non-leading axis, resize of a 0-d leaf, or shape mismatch.
class OBJGRAPH_API StorageShapeError : public StorageError {
public:
    using StorageError::StorageError;
};

} // namespace objgraph
