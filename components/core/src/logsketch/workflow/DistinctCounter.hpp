#ifndef LOGSKETCH_WORKFLOW_DISTINCTCOUNTER_HPP
#define LOGSKETCH_WORKFLOW_DISTINCTCOUNTER_HPP

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "../cardinality/HyperLogLog.hpp"
#include "../hash/HashFamily.hpp"

namespace logsketch::workflow {
/**
 * Exact and HyperLogLog distinct counts of one input, with the time each method took
 */
struct DistinctCountReport {
    size_t num_values{0};
    size_t exact_count{0};
    double exact_seconds{0.0};
    double approximate_count{0.0};
    double approximate_seconds{0.0};
    cardinality::EstimateRegime regime{cardinality::EstimateRegime::LinearCounting};
    // |approximate - exact| / exact, 0 when the input is empty
    double relative_error{0.0};
    size_t approximate_memory_bytes{0};
};

/**
 * Counts distinct values exactly with a hash set
 */
[[nodiscard]] auto count_unique_exact(std::vector<std::string> const& values) -> size_t;

/**
 * Adds every value to the estimator and returns its estimate
 */
[[nodiscard]] auto count_unique_approximate(
        std::vector<std::string> const& values,
        cardinality::HyperLogLog& estimator
) -> cardinality::CardinalityEstimate;

/**
 * Runs both methods on the same values, timing each one
 * @throw ConfigurationError if bucket_bits is out of range
 */
[[nodiscard]] auto compare_distinct_counts(
        std::vector<std::string> const& values,
        uint32_t bucket_bits,
        hash::HashFamilyType hash_family_type
) -> DistinctCountReport;
}  // namespace logsketch::workflow

#endif  // LOGSKETCH_WORKFLOW_DISTINCTCOUNTER_HPP
