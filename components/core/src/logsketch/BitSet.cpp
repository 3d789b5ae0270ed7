#include "BitSet.hpp"

#include <algorithm>
#include <bit>
#include <cstddef>
#include <cstdint>
#include <string>

#include "TraceableException.hpp"

namespace logsketch {
namespace {
auto validate_length(size_t length) -> size_t {
    if (length > BitSet::cMaxLength) {
        throw ConfigurationError(
                __FILENAME__,
                __LINE__,
                "BitSet length " + std::to_string(length) + " exceeds the maximum of "
                        + std::to_string(BitSet::cMaxLength) + " bits"
        );
    }
    return length;
}
}  // namespace

BitSet::BitSet(size_t length)
        : m_bytes(compute_num_bytes(validate_length(length)), 0),
          m_length(length) {}

auto BitSet::get(size_t bit_index) const -> bool {
    check_index(bit_index);
    size_t const byte_index = bit_index / 8;
    size_t const bit_offset = bit_index % 8;
    return (m_bytes[byte_index] & (1U << bit_offset)) != 0;
}

void BitSet::set(size_t bit_index) {
    check_index(bit_index);
    size_t const byte_index = bit_index / 8;
    size_t const bit_offset = bit_index % 8;
    m_bytes[byte_index] |= static_cast<uint8_t>(1U << bit_offset);
}

void BitSet::clear_all() {
    std::fill(m_bytes.begin(), m_bytes.end(), 0);
}

auto BitSet::count() const -> size_t {
    size_t num_set = 0;
    for (auto const byte : m_bytes) {
        num_set += static_cast<size_t>(std::popcount(byte));
    }
    return num_set;
}

void BitSet::check_index(size_t bit_index) const {
    if (bit_index >= m_length) {
        throw IndexError(
                __FILENAME__,
                __LINE__,
                "Bit index " + std::to_string(bit_index) + " is out of range for a BitSet of "
                        + std::to_string(m_length) + " bits"
        );
    }
}
}  // namespace logsketch
