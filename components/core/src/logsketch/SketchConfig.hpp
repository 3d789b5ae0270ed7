#ifndef LOGSKETCH_SKETCHCONFIG_HPP
#define LOGSKETCH_SKETCHCONFIG_HPP

#include <cstddef>
#include <cstdint>
#include <string>

#include <nlohmann/json.hpp>

#include "cardinality/HyperLogLog.hpp"
#include "filter/BloomFilter.hpp"
#include "hash/HashFamily.hpp"
#include "TraceableException.hpp"

namespace logsketch {
struct FilterSettings {
    size_t capacity{1000};
    uint32_t hash_count{3};
    hash::HashFamilyType hash_family{hash::HashFamilyType::Murmur3};
};

struct EstimatorSettings {
    uint32_t bucket_bits{10};
    hash::HashFamilyType hash_family{hash::HashFamilyType::Murmur3};
};

/**
 * Parameters of both sketches. The JSON form is
 * {"filter": {"capacity", "hash_count", "hash_family"},
 *  "estimator": {"bucket_bits", "hash_family"}}
 * with every section and field optional.
 */
struct SketchConfig {
    // Types
    class OperationFailed : public TraceableException {
    public:
        // Constructors
        OperationFailed(ErrorCode error_code, char const* const filename, int line_number)
                : TraceableException(error_code, filename, line_number) {}

        [[nodiscard]] auto what() const noexcept -> char const* override {
            return "SketchConfig operation failed";
        }
    };

    FilterSettings filter;
    EstimatorSettings estimator;

    /**
     * Parses and validates a configuration object
     * @throw ConfigurationError on wrong field types, unknown hash family names or values the
     * sketches would reject
     */
    [[nodiscard]] static auto from_json(nlohmann::json const& config_json) -> SketchConfig;

    /**
     * Reads a JSON configuration file
     * @throw OperationFailed with ErrorCodeFileNotFound if the file cannot be opened
     * @throw OperationFailed with ErrorCodeCorrupt if the file is not valid JSON
     * @throw ConfigurationError as from_json
     */
    [[nodiscard]] static auto load_from_file(std::string const& path) -> SketchConfig;

    [[nodiscard]] auto to_json() const -> nlohmann::json;

    /**
     * @throw ConfigurationError if any setting is outside what the sketches accept
     */
    void validate() const;

    [[nodiscard]] auto create_filter() const -> logsketch::filter::BloomFilter;
    [[nodiscard]] auto create_estimator() const -> cardinality::HyperLogLog;
};
}  // namespace logsketch

#endif  // LOGSKETCH_SKETCHCONFIG_HPP
