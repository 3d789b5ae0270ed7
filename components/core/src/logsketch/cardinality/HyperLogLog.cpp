#include "HyperLogLog.hpp"

#include <algorithm>
#include <bit>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <utility>

#include <spdlog/spdlog.h>

#include "../TraceableException.hpp"
#include "../hash/MurmurHashFamily.hpp"

namespace logsketch::cardinality {
namespace {
auto validate_bucket_bits(uint32_t bucket_bits) -> uint32_t {
    if (bucket_bits < HyperLogLog::cMinBucketBits || bucket_bits > HyperLogLog::cMaxBucketBits) {
        throw ConfigurationError(
                __FILENAME__,
                __LINE__,
                "bucket bits must be in [" + std::to_string(HyperLogLog::cMinBucketBits) + ", "
                        + std::to_string(HyperLogLog::cMaxBucketBits) + "], got "
                        + std::to_string(bucket_bits)
        );
    }
    return bucket_bits;
}

auto validate_hash_family(std::unique_ptr<hash::IHashFamily> hash_family, uint32_t bucket_bits)
        -> std::unique_ptr<hash::IHashFamily> {
    if (nullptr == hash_family) {
        throw ConfigurationError(__FILENAME__, __LINE__, "hash family must not be null");
    }
    auto const width = hash_family->get_hash_width();
    if (width > 64 || width <= bucket_bits) {
        throw ConfigurationError(
                __FILENAME__,
                __LINE__,
                "hash width " + std::to_string(width) + " leaves no remainder bits"
        );
    }
    return hash_family;
}

/**
 * Bias correction constant alpha_m. Small register counts use the published fixed constants.
 */
auto compute_alpha(size_t num_buckets) -> double {
    switch (num_buckets) {
        case 16:
            return 0.673;
        case 32:
            return 0.697;
        case 64:
            return 0.709;
        default:
            return 0.7213 / (1.0 + 1.079 / static_cast<double>(num_buckets));
    }
}
}  // namespace

HyperLogLog::HyperLogLog(uint32_t bucket_bits)
        : HyperLogLog(bucket_bits, std::make_unique<hash::MurmurHashFamily>()) {}

HyperLogLog::HyperLogLog(uint32_t bucket_bits, std::unique_ptr<hash::IHashFamily> hash_family)
        : m_bucket_bits{validate_bucket_bits(bucket_bits)},
          m_hash_family{validate_hash_family(std::move(hash_family), bucket_bits)},
          m_remainder_width{m_hash_family->get_hash_width() - m_bucket_bits},
          m_alpha_mm{0.0},
          m_registers(size_t{1} << m_bucket_bits, 0) {
    auto const num_buckets = static_cast<double>(m_registers.size());
    m_alpha_mm = compute_alpha(m_registers.size()) * num_buckets * num_buckets;

    SPDLOG_DEBUG(
            "Created HyperLogLog with {} registers ({} bucket bits, {}-bit hash).",
            m_registers.size(),
            m_bucket_bits,
            m_hash_family->get_hash_width()
    );
}

auto HyperLogLog::rank(uint64_t remainder, uint32_t field_width) -> uint8_t {
    if (0 == remainder) {
        return static_cast<uint8_t>(field_width + 1);
    }
    // The remainder sits in the low field_width bits, so the top 64 - field_width zeros are not
    // part of the field
    auto const leading_zeros = static_cast<uint32_t>(std::countl_zero(remainder));
    return static_cast<uint8_t>(leading_zeros - (64 - field_width) + 1);
}

void HyperLogLog::add(std::string_view value) {
    uint64_t const x = m_hash_family->hash(value, cHashIndex);
    auto const bucket_index = static_cast<size_t>(x & (m_registers.size() - 1));
    uint64_t const remainder = x >> m_bucket_bits;
    auto const value_rank = rank(remainder, m_remainder_width);

    auto& reg = m_registers[bucket_index];
    reg = std::max(reg, value_rank);
}

auto HyperLogLog::estimate_with_regime() const -> CardinalityEstimate {
    double sum = 0.0;
    size_t num_zero_registers = 0;
    for (auto const reg : m_registers) {
        sum += std::ldexp(1.0, -static_cast<int>(reg));
        if (0 == reg) {
            ++num_zero_registers;
        }
    }

    auto const num_buckets = static_cast<double>(m_registers.size());
    double const raw_estimate = m_alpha_mm / sum;

    if (raw_estimate <= 2.5 * num_buckets) {
        if (num_zero_registers > 0) {
            double const linear_count
                    = num_buckets * std::log(num_buckets / static_cast<double>(num_zero_registers));
            return {linear_count, EstimateRegime::LinearCounting};
        }
        return {raw_estimate, EstimateRegime::Raw};
    }

    double const hash_space = std::ldexp(1.0, static_cast<int>(m_hash_family->get_hash_width()));
    if (raw_estimate > hash_space / 30.0) {
        // Saturated registers can push the raw estimate past the hash space
        double const load = std::min(raw_estimate / hash_space, std::nextafter(1.0, 0.0));
        return {-hash_space * std::log1p(-load), EstimateRegime::LargeRange};
    }
    return {raw_estimate, EstimateRegime::Raw};
}

auto HyperLogLog::is_empty() const -> bool {
    return std::all_of(m_registers.begin(), m_registers.end(), [](uint8_t reg) {
        return 0 == reg;
    });
}

auto HyperLogLog::get_relative_standard_error() const -> double {
    return 1.04 / std::sqrt(static_cast<double>(m_registers.size()));
}
}  // namespace logsketch::cardinality
