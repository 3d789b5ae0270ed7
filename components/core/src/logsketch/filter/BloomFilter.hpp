#ifndef LOGSKETCH_FILTER_BLOOMFILTER_HPP
#define LOGSKETCH_FILTER_BLOOMFILTER_HPP

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string_view>

#include "../BitSet.hpp"
#include "../hash/HashFamily.hpp"
#include "FilterPolicy/FilterPolicy.hpp"
#include "ProbabilisticFilter.hpp"

namespace logsketch::filter {
/**
 * A space-efficient probabilistic data structure for testing set membership.
 *
 * add(value) sets the bits hash(value, i) mod m for every member i < k of the hash family.
 * possibly_contains(value) probes the same bits, so a value that was added is always reported
 * (no false negatives). Values never added may be reported too; after n insertions the
 * probability approaches (1 - e^(-kn/m))^k.
 *
 * Bits are never cleared, so the filter only moves from empty to populated.
 */
class BloomFilter : public IProbabilisticFilter {
public:
    /**
     * Constructs a bloom filter with explicit parameters and the default (MurmurHash3) family
     * @param bit_array_size Number of bits (m), must be positive
     * @param num_hash_functions Number of probes per operation (k), must be positive
     * @throw ConfigurationError if either parameter is 0 or bit_array_size > BitSet::cMaxLength
     */
    BloomFilter(size_t bit_array_size, uint32_t num_hash_functions);

    /**
     * Constructs a bloom filter with explicit parameters and a custom hash family
     * @throw ConfigurationError if either parameter is 0, bit_array_size > BitSet::cMaxLength or
     * hash_family is null
     */
    BloomFilter(
            size_t bit_array_size,
            uint32_t num_hash_functions,
            std::unique_ptr<hash::IHashFamily> hash_family
    );

    /**
     * Constructs a bloom filter sized by a policy for the expected load and target false positive
     * rate
     * @throw ConfigurationError if expected_num_elements is 0, the rate is not in (0, 1), or the
     * resulting size exceeds BitSet::cMaxLength
     */
    [[nodiscard]] static auto create_optimal(
            size_t expected_num_elements,
            double false_positive_rate,
            IFilterPolicy const& policy
    ) -> BloomFilter;

    /**
     * Same as above with the default BloomFilterPolicy
     */
    [[nodiscard]] static auto
    create_optimal(size_t expected_num_elements, double false_positive_rate) -> BloomFilter;

    // IProbabilisticFilter interface
    void add(std::string_view value) override;
    [[nodiscard]] auto possibly_contains(std::string_view value) const -> bool override;
    [[nodiscard]] auto is_empty() const -> bool override { return 0 == m_bit_set.count(); }
    [[nodiscard]] auto get_memory_usage() const -> size_t override {
        return m_bit_set.get_memory_usage();
    }

    [[nodiscard]] auto get_bit_array_size() const -> size_t { return m_bit_set.size(); }
    [[nodiscard]] auto get_num_hash_functions() const -> uint32_t {
        return m_num_hash_functions;
    }
    [[nodiscard]] auto get_hash_family() const -> hash::IHashFamily const& {
        return *m_hash_family;
    }
    [[nodiscard]] auto get_bit_set() const -> BitSet const& { return m_bit_set; }

    /**
     * @return Fraction of bits currently set
     */
    [[nodiscard]] auto get_fill_ratio() const -> double;

    /**
     * @return Theoretical false positive rate once num_elements distinct values have been added
     */
    [[nodiscard]] auto get_expected_false_positive_rate(size_t num_elements) const -> double;

    [[nodiscard]] auto clone() const -> std::unique_ptr<IProbabilisticFilter> override {
        auto copy = std::make_unique<BloomFilter>(
                m_bit_set.size(),
                m_num_hash_functions,
                m_hash_family->clone()
        );
        copy->m_bit_set = m_bit_set;
        return copy;
    }

private:
    [[nodiscard]] auto compute_bit_index(std::string_view value, uint32_t hash_index) const
            -> size_t;

    uint32_t m_num_hash_functions;
    std::unique_ptr<hash::IHashFamily> m_hash_family;
    BitSet m_bit_set;
};
}  // namespace logsketch::filter

#endif  // LOGSKETCH_FILTER_BLOOMFILTER_HPP
