#include "BloomFilter.hpp"

#include <algorithm>
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
#include "FilterPolicy/BloomFilterPolicy.hpp"

namespace logsketch::filter {
namespace {
auto validate_num_hash_functions(uint32_t num_hash_functions) -> uint32_t {
    if (0 == num_hash_functions) {
        throw ConfigurationError(__FILENAME__, __LINE__, "hash count must be positive");
    }
    return num_hash_functions;
}

auto validate_bit_array_size(size_t bit_array_size) -> size_t {
    if (0 == bit_array_size) {
        throw ConfigurationError(__FILENAME__, __LINE__, "capacity must be positive");
    }
    if (bit_array_size > BitSet::cMaxLength) {
        throw ConfigurationError(
                __FILENAME__,
                __LINE__,
                "capacity " + std::to_string(bit_array_size) + " exceeds the maximum of "
                        + std::to_string(BitSet::cMaxLength) + " bits"
        );
    }
    return bit_array_size;
}

auto validate_hash_family(std::unique_ptr<hash::IHashFamily> hash_family)
        -> std::unique_ptr<hash::IHashFamily> {
    if (nullptr == hash_family) {
        throw ConfigurationError(__FILENAME__, __LINE__, "hash family must not be null");
    }
    return hash_family;
}
}  // namespace

BloomFilter::BloomFilter(size_t bit_array_size, uint32_t num_hash_functions)
        : BloomFilter(
                  bit_array_size,
                  num_hash_functions,
                  std::make_unique<hash::MurmurHashFamily>()
          ) {}

BloomFilter::BloomFilter(
        size_t bit_array_size,
        uint32_t num_hash_functions,
        std::unique_ptr<hash::IHashFamily> hash_family
)
        : m_num_hash_functions{validate_num_hash_functions(num_hash_functions)},
          m_hash_family{validate_hash_family(std::move(hash_family))},
          m_bit_set{validate_bit_array_size(bit_array_size)} {
    SPDLOG_DEBUG(
            "Created bloom filter with {} bits, {} hash functions ({} bytes).",
            m_bit_set.size(),
            m_num_hash_functions,
            m_bit_set.get_memory_usage()
    );
}

auto BloomFilter::create_optimal(
        size_t expected_num_elements,
        double false_positive_rate,
        IFilterPolicy const& policy
) -> BloomFilter {
    if (0 == expected_num_elements) {
        throw ConfigurationError(
                __FILENAME__,
                __LINE__,
                "expected number of elements must be positive"
        );
    }
    auto const params = policy.compute_parameters(false_positive_rate);
    auto const num_bits
            = std::ceil(params.bits_per_key * static_cast<double>(expected_num_elements));
    if (num_bits > static_cast<double>(BitSet::cMaxLength)) {
        throw ConfigurationError(
                __FILENAME__,
                __LINE__,
                "expected number of elements needs more than the maximum of "
                        + std::to_string(BitSet::cMaxLength) + " bits"
        );
    }
    auto const bit_array_size = std::max(static_cast<size_t>(num_bits), size_t{1});
    return BloomFilter(bit_array_size, params.num_hash_functions);
}

auto BloomFilter::create_optimal(size_t expected_num_elements, double false_positive_rate)
        -> BloomFilter {
    return create_optimal(expected_num_elements, false_positive_rate, BloomFilterPolicy{});
}

void BloomFilter::add(std::string_view value) {
    for (uint32_t i = 0; i < m_num_hash_functions; ++i) {
        m_bit_set.set(compute_bit_index(value, i));
    }
}

auto BloomFilter::possibly_contains(std::string_view value) const -> bool {
    for (uint32_t i = 0; i < m_num_hash_functions; ++i) {
        if (false == m_bit_set.get(compute_bit_index(value, i))) {
            return false;  // Definitely not in the set
        }
    }
    return true;  // Possibly in the set
}

auto BloomFilter::get_fill_ratio() const -> double {
    return static_cast<double>(m_bit_set.count()) / static_cast<double>(m_bit_set.size());
}

auto BloomFilter::get_expected_false_positive_rate(size_t num_elements) const -> double {
    return BloomFilterPolicy::compute_false_positive_rate(
            num_elements,
            m_bit_set.size(),
            m_num_hash_functions
    );
}

auto BloomFilter::compute_bit_index(std::string_view value, uint32_t hash_index) const -> size_t {
    return static_cast<size_t>(m_hash_family->hash(value, hash_index) % m_bit_set.size());
}
}  // namespace logsketch::filter
