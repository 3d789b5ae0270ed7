#include "DistinctCounter.hpp"

#include <cmath>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include <absl/container/flat_hash_set.h>
#include <spdlog/spdlog.h>

#include "../Stopwatch.hpp"
#include "../hash/HashFamilyConfig.hpp"

namespace logsketch::workflow {
auto count_unique_exact(std::vector<std::string> const& values) -> size_t {
    absl::flat_hash_set<std::string_view> distinct_values;
    distinct_values.reserve(values.size());
    for (auto const& value : values) {
        distinct_values.insert(value);
    }
    return distinct_values.size();
}

auto count_unique_approximate(
        std::vector<std::string> const& values,
        cardinality::HyperLogLog& estimator
) -> cardinality::CardinalityEstimate {
    for (auto const& value : values) {
        estimator.add(value);
    }
    return estimator.estimate_with_regime();
}

auto compare_distinct_counts(
        std::vector<std::string> const& values,
        uint32_t bucket_bits,
        hash::HashFamilyType hash_family_type
) -> DistinctCountReport {
    DistinctCountReport report;
    report.num_values = values.size();

    Stopwatch exact_stopwatch;
    exact_stopwatch.start();
    report.exact_count = count_unique_exact(values);
    exact_stopwatch.stop();
    report.exact_seconds = exact_stopwatch.get_time_taken_in_seconds();

    cardinality::HyperLogLog estimator(bucket_bits, hash::create_hash_family(hash_family_type));
    Stopwatch approximate_stopwatch;
    approximate_stopwatch.start();
    auto const estimate = count_unique_approximate(values, estimator);
    approximate_stopwatch.stop();
    report.approximate_seconds = approximate_stopwatch.get_time_taken_in_seconds();
    report.approximate_count = estimate.value;
    report.regime = estimate.regime;
    report.approximate_memory_bytes = estimator.get_memory_usage();

    if (report.exact_count > 0) {
        auto const exact = static_cast<double>(report.exact_count);
        report.relative_error = std::abs(report.approximate_count - exact) / exact;
    }

    SPDLOG_DEBUG(
            "Distinct count over {} values: exact {} in {:.6f}s, HyperLogLog {:.1f} in {:.6f}s",
            report.num_values,
            report.exact_count,
            report.exact_seconds,
            report.approximate_count,
            report.approximate_seconds
    );
    return report;
}
}  // namespace logsketch::workflow
