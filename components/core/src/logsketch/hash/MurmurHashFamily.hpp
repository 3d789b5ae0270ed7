#ifndef LOGSKETCH_HASH_MURMURHASHFAMILY_HPP
#define LOGSKETCH_HASH_MURMURHASHFAMILY_HPP

#include <cstdint>
#include <memory>
#include <string_view>

#include "../Defs.hpp"
#include "HashFamily.hpp"

namespace logsketch::hash {

/**
 * MurmurHash3 (x64, 128-bit) seeded with the member index. The first 64-bit word of the digest is
 * the hash value.
 */
class MurmurHashFamily : public IHashFamily {
public:
    MurmurHashFamily() = default;

    [[nodiscard]] auto hash(std::string_view value, uint32_t index) const -> uint64_t override;

    [[nodiscard]] auto get_hash_width() const -> uint32_t override { return cHashWidth; }

    [[nodiscard]] auto get_type() const -> HashFamilyType override {
        return HashFamilyType::Murmur3;
    }

    [[nodiscard]] auto clone() const -> std::unique_ptr<IHashFamily> override {
        return std::make_unique<MurmurHashFamily>();
    }
};

}  // namespace logsketch::hash

#endif  // LOGSKETCH_HASH_MURMURHASHFAMILY_HPP
