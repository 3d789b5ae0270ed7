#ifndef LOGSKETCH_BITSET_HPP
#define LOGSKETCH_BITSET_HPP

#include <cstddef>
#include <cstdint>
#include <vector>

namespace logsketch {
/**
 * Fixed-length array of bits packed eight to a byte. Bit i lives in byte i / 8 at offset i % 8.
 */
class BitSet {
public:
    // Largest supported length, 8 GiB of storage
    static constexpr size_t cMaxLength = size_t{1} << 36;

    // Constructors
    /**
     * Creates a bit set with every bit cleared
     * @param length Number of bits
     * @throw ConfigurationError if length > cMaxLength
     */
    explicit BitSet(size_t length);

    /**
     * @return Number of bytes needed to hold length bits
     */
    [[nodiscard]] static constexpr auto compute_num_bytes(size_t length) -> size_t {
        return length / 8 + (0 != length % 8 ? 1 : 0);
    }

    // Methods
    /**
     * @param bit_index
     * @return Whether the bit is set
     * @throw IndexError if bit_index >= length
     */
    [[nodiscard]] auto get(size_t bit_index) const -> bool;

    /**
     * Sets the bit to 1. Setting an already-set bit has no effect.
     * @param bit_index
     * @throw IndexError if bit_index >= length
     */
    void set(size_t bit_index);

    void clear_all();

    [[nodiscard]] auto size() const -> size_t { return m_length; }

    /**
     * @return Number of bits currently set
     */
    [[nodiscard]] auto count() const -> size_t;

    /**
     * @return Size of the packed storage in bytes
     */
    [[nodiscard]] auto get_memory_usage() const -> size_t { return m_bytes.size(); }

    [[nodiscard]] auto get_bytes() const -> std::vector<uint8_t> const& { return m_bytes; }

    auto operator==(BitSet const& rhs) const -> bool = default;

private:
    void check_index(size_t bit_index) const;

    std::vector<uint8_t> m_bytes;
    size_t m_length;
};
}  // namespace logsketch

#endif  // LOGSKETCH_BITSET_HPP
