// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file datasets.cpp
/// @brief Timestamp conversions and the built-in dataset codecs

#include <objgraph/datasets.h>
#include <objgraph/array_proxy.h>
#include <objgraph/type_registry.h>

#include <boost/date_time/posix_time/posix_time.hpp>

namespace objgraph {

namespace pt = boost::posix_time;

namespace {

const pt::ptime& epoch()
{
    static const pt::ptime value(boost::gregorian::date(1970, 1, 1));
    return value;
}

Dict time_metadata(const std::string& tz)
{
    return Dict{{"tz", tz}, {"unit", "us"}};
}

/// Timezone label of a time dataset; rejects units other than microseconds
std::string tz_of(const Dict& metadata, const char* kind)
{
    if (auto it = metadata.find("unit"); it != metadata.end()) {
        const auto* unit = it->second.get_if<std::string>();
        if (!unit || *unit != "us") {
            throw Error(std::string(kind) + ": unsupported time unit");
        }
    }
    auto it = metadata.find("tz");
    if (it == metadata.end()) return "UTC";
    if (const auto* tz = it->second.get_if<std::string>()) return *tz;
    throw Error(std::string(kind) + ": 'tz' metadata must be a string");
}

} // anonymous namespace

std::int64_t to_epoch_us(const pt::ptime& t)
{
    if (t.is_special()) {
        throw Error("cannot convert special time value '" + pt::to_simple_string(t) + "' to epoch microseconds");
    }
    return (t - epoch()).total_microseconds();
}

pt::ptime from_epoch_us(std::int64_t us)
{
    return epoch() + pt::microseconds(us);
}

Timestamp make_timestamp(const std::string& text, std::string tz)
{
    pt::ptime time;
    try {
        time = pt::time_from_string(text);
    } catch (const std::exception& e) {
        throw Error("cannot parse timestamp '" + text + "': " + e.what());
    }
    if (time.is_not_a_date_time()) {
        throw Error("cannot parse timestamp '" + text + "'");
    }
    return Timestamp{time, std::move(tz)};
}

namespace detail {

void install_builtin_datasets(TypeRegistry& registry)
{
    registry.register_dataset<NdArray>(
        dataset_kind::ndarray,
        [](const NdArray& array) { return Disassembled{array, Dict{}}; },
        [](NdArray data, const Dict&) { return data; });

    registry.register_dataset<Timestamp>(
        dataset_kind::timestamp,
        [](const Timestamp& ts) {
            return Disassembled{NdArray::from<std::int64_t>({to_epoch_us(ts.time)}), time_metadata(ts.tz)};
        },
        [](NdArray data, const Dict& metadata) {
            if (data.size() != 1) {
                throw Error("objgraph.Timestamp: expected one element, got shape " + shape_to_string(data.shape()));
            }
            return Timestamp{from_epoch_us(data.at<std::int64_t>(0)), tz_of(metadata, "objgraph.Timestamp")};
        });

    registry.register_dataset<TimestampIndex>(
        dataset_kind::timestamp_index,
        [](const TimestampIndex& index) {
            std::vector<std::int64_t> us;
            us.reserve(index.times.size());
            for (const auto& t : index.times) {
                us.push_back(to_epoch_us(t));
            }
            return Disassembled{NdArray::from(us), time_metadata(index.tz)};
        },
        [](NdArray data, const Dict& metadata) {
            if (data.ndim() != 1) {
                throw Error("objgraph.TimestampIndex: expected a 1-d array, got shape " +
                            shape_to_string(data.shape()));
            }
            TimestampIndex index;
            index.tz = tz_of(metadata, "objgraph.TimestampIndex");
            index.times.reserve(data.size());
            for (std::size_t i = 0; i < data.size(); ++i) {
                index.times.push_back(from_epoch_us(data.at<std::int64_t>(i)));
            }
            return index;
        });

    // A proxy serializes as the leaf it points at and comes back in memory
    DatasetCodec proxy;
    proxy.name = dataset_kind::array_proxy;
    proxy.disassemble = [](const Object& obj) {
        const auto& p = obj.as<ArrayProxy>();
        return Disassembled{p.read(), p.attrs()};
    };
    proxy.assemble = [](NdArray data, const Dict&) { return Object{std::move(data)}; };
    registry.register_dataset(std::type_index(typeid(ArrayProxy)), std::move(proxy));
}

} // namespace detail

} // namespace objgraph
