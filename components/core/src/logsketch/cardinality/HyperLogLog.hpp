#ifndef LOGSKETCH_CARDINALITY_HYPERLOGLOG_HPP
#define LOGSKETCH_CARDINALITY_HYPERLOGLOG_HPP

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string_view>
#include <vector>

#include "../hash/HashFamily.hpp"

namespace logsketch::cardinality {
/**
 * Which correction produced a cardinality estimate
 */
enum class EstimateRegime : uint8_t {
    // Raw estimate <= 2.5m with empty registers left: m * ln(m / V)
    LinearCounting = 0,
    // Harmonic-mean estimate alpha_m * m^2 / Z, uncorrected
    Raw = 1,
    // Raw estimate > 2^W / 30: -2^W * ln(1 - E / 2^W)
    LargeRange = 2,
};

struct CardinalityEstimate {
    double value;
    EstimateRegime regime;
};

/**
 * HyperLogLog distinct-value estimator over strings.
 *
 * Each value is hashed once to a W-bit word x. The low b bits of x select one of m = 2^b
 * registers and the remaining W - b bits (x >> b) feed the rank function; every register keeps the
 * largest rank it has seen, so registers never decrease. estimate() reads the registers without
 * modifying them, and its relative standard error is about 1.04 / sqrt(m).
 */
class HyperLogLog {
public:
    static constexpr uint32_t cMinBucketBits = 4;
    static constexpr uint32_t cMaxBucketBits = 24;

    /**
     * Constructs an estimator with the default (MurmurHash3) family
     * @param bucket_bits Number of bits selecting a register, in [cMinBucketBits, cMaxBucketBits]
     * @throw ConfigurationError if bucket_bits is out of range
     */
    explicit HyperLogLog(uint32_t bucket_bits);

    /**
     * @throw ConfigurationError if bucket_bits is out of range, hash_family is null, or the
     * family is too narrow to leave remainder bits
     */
    HyperLogLog(uint32_t bucket_bits, std::unique_ptr<hash::IHashFamily> hash_family);

    void add(std::string_view value);

    /**
     * @return The estimated number of distinct values added, 0 for an empty estimator
     */
    [[nodiscard]] auto estimate() const -> double { return estimate_with_regime().value; }

    /**
     * @return The estimate together with the correction regime that produced it
     */
    [[nodiscard]] auto estimate_with_regime() const -> CardinalityEstimate;

    /**
     * Rank of a remainder: 1 + the number of leading zero bits of remainder within its
     * field_width-bit field. A zero remainder has rank field_width + 1.
     * @param remainder Value occupying the low field_width bits
     * @param field_width Width of the remainder field, in [1, 64]
     */
    [[nodiscard]] static auto rank(uint64_t remainder, uint32_t field_width) -> uint8_t;

    [[nodiscard]] auto get_bucket_bits() const -> uint32_t { return m_bucket_bits; }
    [[nodiscard]] auto get_num_buckets() const -> size_t { return m_registers.size(); }
    [[nodiscard]] auto get_registers() const -> std::vector<uint8_t> const& { return m_registers; }
    [[nodiscard]] auto get_memory_usage() const -> size_t { return m_registers.size(); }
    [[nodiscard]] auto get_hash_family() const -> hash::IHashFamily const& {
        return *m_hash_family;
    }
    [[nodiscard]] auto is_empty() const -> bool;

    /**
     * @return 1.04 / sqrt(m)
     */
    [[nodiscard]] auto get_relative_standard_error() const -> double;

private:
    // Member of the hash family used for every value
    static constexpr uint32_t cHashIndex = 0;

    uint32_t m_bucket_bits;
    std::unique_ptr<hash::IHashFamily> m_hash_family;
    uint32_t m_remainder_width;
    double m_alpha_mm;
    std::vector<uint8_t> m_registers;
};
}  // namespace logsketch::cardinality

#endif  // LOGSKETCH_CARDINALITY_HYPERLOGLOG_HPP
