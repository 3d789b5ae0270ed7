#ifndef LOGSKETCH_HASH_HASHFAMILY_HPP
#define LOGSKETCH_HASH_HASHFAMILY_HPP

#include <cstdint>
#include <memory>
#include <string_view>

namespace logsketch::hash {

/**
 * Hash family type enumeration
 */
enum class HashFamilyType : uint8_t {
    Murmur3 = 0,
    Md5 = 1,
};

/**
 * Abstract interface for a family of seeded string hashes.
 *
 * hash(value, i) must be deterministic across processes and uniformly distributed over the full
 * width of the family. Different indexes act as different seeds, so the outputs for one value
 * under different indexes are effectively independent.
 */
class IHashFamily {
public:
    virtual ~IHashFamily() = default;

    /**
     * @param value Any string, including the empty string
     * @param index Member of the family to evaluate
     * @return The hash of value under the given member
     */
    [[nodiscard]] virtual auto hash(std::string_view value, uint32_t index) const -> uint64_t = 0;

    /**
     * @return Number of significant bits in every value returned by hash
     */
    [[nodiscard]] virtual auto get_hash_width() const -> uint32_t = 0;

    [[nodiscard]] virtual auto get_type() const -> HashFamilyType = 0;

    /**
     * Creates a deep copy of this family
     */
    [[nodiscard]] virtual auto clone() const -> std::unique_ptr<IHashFamily> = 0;

protected:
    IHashFamily() = default;
    IHashFamily(IHashFamily const&) = default;
    auto operator=(IHashFamily const&) -> IHashFamily& = default;
    IHashFamily(IHashFamily&&) = default;
    auto operator=(IHashFamily&&) -> IHashFamily& = default;
};

}  // namespace logsketch::hash

#endif  // LOGSKETCH_HASH_HASHFAMILY_HPP
