#include "SketchConfig.hpp"

#include <cstdint>
#include <fstream>
#include <limits>
#include <string>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "BitSet.hpp"
#include "ErrorCode.hpp"
#include "hash/HashFamilyConfig.hpp"

namespace logsketch {
namespace {
auto get_object(nlohmann::json const& parent, char const* key) -> nlohmann::json const* {
    auto const it = parent.find(key);
    if (parent.end() == it) {
        return nullptr;
    }
    if (false == it->is_object()) {
        throw ConfigurationError(
                __FILENAME__,
                __LINE__,
                std::string("config section \"") + key + "\" must be an object"
        );
    }
    return &(*it);
}

auto get_unsigned(nlohmann::json const& section, char const* key, uint64_t default_value)
        -> uint64_t {
    auto const it = section.find(key);
    if (section.end() == it) {
        return default_value;
    }
    if (false == it->is_number_unsigned()) {
        throw ConfigurationError(
                __FILENAME__,
                __LINE__,
                std::string("config field \"") + key + "\" must be a non-negative integer"
        );
    }
    return it->get<uint64_t>();
}

auto get_hash_family(
        nlohmann::json const& section,
        char const* key,
        hash::HashFamilyType default_value
) -> hash::HashFamilyType {
    auto const it = section.find(key);
    if (section.end() == it) {
        return default_value;
    }
    if (false == it->is_string()) {
        throw ConfigurationError(
                __FILENAME__,
                __LINE__,
                std::string("config field \"") + key + "\" must be a string"
        );
    }
    auto const name = it->get<std::string>();
    auto const type = hash::parse_hash_family_type(name);
    if (false == type.has_value()) {
        throw ConfigurationError(__FILENAME__, __LINE__, "unknown hash family \"" + name + "\"");
    }
    return type.value();
}
}  // namespace

auto SketchConfig::from_json(nlohmann::json const& config_json) -> SketchConfig {
    if (false == config_json.is_object()) {
        throw ConfigurationError(__FILENAME__, __LINE__, "config must be a JSON object");
    }

    SketchConfig config;
    if (auto const* filter_json = get_object(config_json, "filter"); nullptr != filter_json) {
        config.filter.capacity = static_cast<size_t>(
                get_unsigned(*filter_json, "capacity", config.filter.capacity)
        );
        auto const hash_count = get_unsigned(*filter_json, "hash_count", config.filter.hash_count);
        if (hash_count > std::numeric_limits<uint32_t>::max()) {
            throw ConfigurationError(__FILENAME__, __LINE__, "hash_count is too large");
        }
        config.filter.hash_count = static_cast<uint32_t>(hash_count);
        config.filter.hash_family
                = get_hash_family(*filter_json, "hash_family", config.filter.hash_family);
    }
    if (auto const* estimator_json = get_object(config_json, "estimator");
        nullptr != estimator_json)
    {
        auto const bucket_bits
                = get_unsigned(*estimator_json, "bucket_bits", config.estimator.bucket_bits);
        if (bucket_bits > std::numeric_limits<uint32_t>::max()) {
            throw ConfigurationError(__FILENAME__, __LINE__, "bucket_bits is too large");
        }
        config.estimator.bucket_bits = static_cast<uint32_t>(bucket_bits);
        config.estimator.hash_family
                = get_hash_family(*estimator_json, "hash_family", config.estimator.hash_family);
    }

    config.validate();
    return config;
}

auto SketchConfig::load_from_file(std::string const& path) -> SketchConfig {
    std::ifstream file(path);
    if (false == file.is_open()) {
        SPDLOG_ERROR("Failed to open config file {}", path);
        throw OperationFailed(ErrorCodeFileNotFound, __FILENAME__, __LINE__);
    }

    nlohmann::json config_json;
    try {
        config_json = nlohmann::json::parse(file);
    } catch (nlohmann::json::parse_error const& e) {
        SPDLOG_ERROR("Failed to parse config file {} - {}", path, e.what());
        throw OperationFailed(ErrorCodeCorrupt, __FILENAME__, __LINE__);
    }

    return from_json(config_json);
}

auto SketchConfig::to_json() const -> nlohmann::json {
    nlohmann::json config_json;
    config_json["filter"]["capacity"] = filter.capacity;
    config_json["filter"]["hash_count"] = filter.hash_count;
    config_json["filter"]["hash_family"]
            = std::string(hash::hash_family_type_to_string(filter.hash_family));
    config_json["estimator"]["bucket_bits"] = estimator.bucket_bits;
    config_json["estimator"]["hash_family"]
            = std::string(hash::hash_family_type_to_string(estimator.hash_family));
    return config_json;
}

void SketchConfig::validate() const {
    if (0 == filter.capacity) {
        throw ConfigurationError(__FILENAME__, __LINE__, "filter capacity must be positive");
    }
    if (filter.capacity > BitSet::cMaxLength) {
        throw ConfigurationError(
                __FILENAME__,
                __LINE__,
                "filter capacity must be at most " + std::to_string(BitSet::cMaxLength)
        );
    }
    if (0 == filter.hash_count) {
        throw ConfigurationError(__FILENAME__, __LINE__, "filter hash_count must be positive");
    }
    if (estimator.bucket_bits < cardinality::HyperLogLog::cMinBucketBits
        || estimator.bucket_bits > cardinality::HyperLogLog::cMaxBucketBits)
    {
        throw ConfigurationError(
                __FILENAME__,
                __LINE__,
                "estimator bucket_bits must be in ["
                        + std::to_string(cardinality::HyperLogLog::cMinBucketBits) + ", "
                        + std::to_string(cardinality::HyperLogLog::cMaxBucketBits) + "]"
        );
    }
}

auto SketchConfig::create_filter() const -> logsketch::filter::BloomFilter {
    return logsketch::filter::BloomFilter(
            filter.capacity,
            filter.hash_count,
            hash::create_hash_family(filter.hash_family)
    );
}

auto SketchConfig::create_estimator() const -> cardinality::HyperLogLog {
    return cardinality::HyperLogLog(
            estimator.bucket_bits,
            hash::create_hash_family(estimator.hash_family)
    );
}
}  // namespace logsketch
