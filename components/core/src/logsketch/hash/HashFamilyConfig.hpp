#ifndef LOGSKETCH_HASH_HASHFAMILYCONFIG_HPP
#define LOGSKETCH_HASH_HASHFAMILYCONFIG_HPP

#include <memory>
#include <optional>
#include <string_view>

#include "HashFamily.hpp"

namespace logsketch::hash {
/**
 * Parses a hash family name ("murmur3" or "md5", case-insensitive)
 * @return The family type, or std::nullopt for an unknown name
 */
[[nodiscard]] auto parse_hash_family_type(std::string_view type_str)
        -> std::optional<HashFamilyType>;

[[nodiscard]] auto hash_family_type_to_string(HashFamilyType type) -> std::string_view;

/**
 * Creates the family implementing the given type
 */
[[nodiscard]] auto create_hash_family(HashFamilyType type) -> std::unique_ptr<IHashFamily>;
}  // namespace logsketch::hash

#endif  // LOGSKETCH_HASH_HASHFAMILYCONFIG_HPP
