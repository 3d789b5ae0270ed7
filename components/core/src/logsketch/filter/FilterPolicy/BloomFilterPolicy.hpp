#ifndef LOGSKETCH_FILTER_BLOOMFILTERPOLICY_HPP
#define LOGSKETCH_FILTER_BLOOMFILTERPOLICY_HPP

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <memory>

#include "../../Defs.hpp"
#include "../../TraceableException.hpp"
#include "FilterPolicy.hpp"

namespace logsketch::filter {

/**
 * Policy for computing optimal Bloom filter parameters.
 *
 * Uses the standard formulas:
 * - bits_per_key = -ln(FPR) / ln(2)^2 ≈ -1.44 × log₂(FPR)
 * - num_hash_functions = bits_per_key × ln(2) ≈ 0.693 × bits_per_key
 */
class BloomFilterPolicy : public IFilterPolicy {
public:
    BloomFilterPolicy() = default;

    [[nodiscard]] auto compute_parameters(double false_positive_rate) const
            -> FilterParameters override {
        auto const bits_per_key = compute_bits_per_key(false_positive_rate);
        auto const num_hash_functions = compute_num_hash_functions(bits_per_key);
        return {bits_per_key, num_hash_functions};
    }

    [[nodiscard]] auto clone() const -> std::unique_ptr<IFilterPolicy> override {
        return std::make_unique<BloomFilterPolicy>();
    }

    /**
     * Computes bits per key for a given false positive rate
     * Formula: m/n = -log₂(FPR) / ln(2)
     */
    [[nodiscard]] static auto compute_bits_per_key(double false_positive_rate) -> double {
        if (false_positive_rate <= 0.0 || false_positive_rate >= 1.0
            || std::isnan(false_positive_rate))
        {
            throw ConfigurationError(
                    __FILENAME__,
                    __LINE__,
                    "false_positive_rate must lie strictly between 0 and 1"
            );
        }
        return -std::log2(false_positive_rate) / std::log(2.0);
    }

    /**
     * Computes optimal number of hash functions for given bits per key
     * Formula: k = (m/n) × ln(2)
     */
    [[nodiscard]] static auto compute_num_hash_functions(double bits_per_key) -> uint32_t {
        auto const k = std::round(bits_per_key * std::log(2.0));
        return std::max(1U, static_cast<uint32_t>(k));
    }

    /**
     * Computes the bit array size for an expected load
     * Formula: m = ceil(-n × ln(FPR) / ln(2)^2)
     * @throw ConfigurationError if num_elements is 0, the rate is not in (0, 1), or the size
     * overflows size_t
     */
    [[nodiscard]] static auto
    compute_bit_array_size(size_t num_elements, double false_positive_rate) -> size_t {
        if (0 == num_elements) {
            throw ConfigurationError(
                    __FILENAME__,
                    __LINE__,
                    "expected number of elements must be positive"
            );
        }
        auto const bits_per_key = compute_bits_per_key(false_positive_rate);
        auto const num_bits = std::ceil(bits_per_key * static_cast<double>(num_elements));
        if (num_bits >= static_cast<double>(std::numeric_limits<size_t>::max())) {
            throw ConfigurationError(__FILENAME__, __LINE__, "bit array size overflows size_t");
        }
        return std::max(static_cast<size_t>(num_bits), size_t{1});
    }

    /**
     * Computes the false positive probability of a filter after num_elements insertions
     * Formula: (1 - e^(-kn/m))^k
     */
    [[nodiscard]] static auto compute_false_positive_rate(
            size_t num_elements,
            size_t bit_array_size,
            uint32_t num_hash_functions
    ) -> double {
        if (0 == bit_array_size || 0 == num_elements) {
            return 0.0;
        }
        double const exponent = -static_cast<double>(num_hash_functions)
                                * static_cast<double>(num_elements)
                                / static_cast<double>(bit_array_size);
        double const base = 1.0 - std::exp(exponent);
        return std::pow(base, num_hash_functions);
    }
};

}  // namespace logsketch::filter

#endif  // LOGSKETCH_FILTER_BLOOMFILTERPOLICY_HPP
