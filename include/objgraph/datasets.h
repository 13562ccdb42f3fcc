// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file datasets.h
/// @brief Built-in dataset types and their codecs.
///
/// Built-in dataset kinds, registered when the TypeRegistry is first used:
///
/// | Type            | Name                      | Array                      | Metadata         |
/// |-----------------|---------------------------|----------------------------|------------------|
/// | NdArray         | objgraph.NdArray          | itself                     | none             |
/// | Timestamp       | objgraph.Timestamp        | int64[1], us since epoch   | tz, unit = "us"  |
/// | TimestampIndex  | objgraph.TimestampIndex   | int64[n], us since epoch   | tz, unit = "us"  |
/// | ArrayProxy      | objgraph.ArrayProxy       | materialized leaf contents | leaf attributes  |
///
/// Times are boost::posix_time::ptime values interpreted in UTC; `tz` is
/// carried as a label and not applied to the stored instants.

#pragma once

#include "config.h"
#include "api.h"
#include "ndarray.h"

#include <boost/date_time/posix_time/posix_time_types.hpp>

#include <cstdint>
#include <string>
#include <vector>

namespace objgraph {

class TypeRegistry;

namespace dataset_kind {

inline constexpr const char* ndarray = "objgraph.NdArray";
inline constexpr const char* timestamp = "objgraph.Timestamp";
inline constexpr const char* timestamp_index = "objgraph.TimestampIndex";
inline constexpr const char* array_proxy = "objgraph.ArrayProxy";

} // namespace dataset_kind

/// A single point in time with a timezone label
struct OBJGRAPH_API Timestamp {
    boost::posix_time::ptime time;
    std::string tz = "UTC";

    bool operator==(const Timestamp& other) const { return time == other.time && tz == other.tz; }
    bool operator!=(const Timestamp& other) const { return !(*this == other); }
};

/// An ordered sequence of points in time sharing one timezone label
struct OBJGRAPH_API TimestampIndex {
    std::vector<boost::posix_time::ptime> times;
    std::string tz = "UTC";

    [[nodiscard]] std::size_t size() const noexcept { return times.size(); }

    bool operator==(const TimestampIndex& other) const { return times == other.times && tz == other.tz; }
    bool operator!=(const TimestampIndex& other) const { return !(*this == other); }
};

/// Microseconds since 1970-01-01T00:00:00
[[nodiscard]] OBJGRAPH_API std::int64_t to_epoch_us(const boost::posix_time::ptime& t);
[[nodiscard]] OBJGRAPH_API boost::posix_time::ptime from_epoch_us(std::int64_t us);

/// Timestamp parsed from "YYYY-MM-DD HH:MM:SS[.fff]"
[[nodiscard]] OBJGRAPH_API Timestamp make_timestamp(const std::string& text, std::string tz = "UTC");

namespace detail {

/// Register the built-in dataset codecs (called by the TypeRegistry constructor)
void install_builtin_datasets(TypeRegistry& registry);

} // namespace detail

} // namespace objgraph
