#include "HashFamilyConfig.hpp"

#include <algorithm>
#include <cctype>
#include <memory>
#include <stdexcept>
#include <string>

#include "Md5HashFamily.hpp"
#include "MurmurHashFamily.hpp"

namespace logsketch::hash {
namespace {
std::string to_lower(std::string_view input) {
    std::string out(input);
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return out;
}
}  // namespace

auto parse_hash_family_type(std::string_view type_str) -> std::optional<HashFamilyType> {
    auto lowered = to_lower(type_str);
    if (lowered == "murmur3" || lowered == "murmur") {
        return HashFamilyType::Murmur3;
    }
    if (lowered == "md5") {
        return HashFamilyType::Md5;
    }
    return std::nullopt;
}

auto hash_family_type_to_string(HashFamilyType type) -> std::string_view {
    switch (type) {
        case HashFamilyType::Murmur3:
            return "murmur3";
        case HashFamilyType::Md5:
            return "md5";
    }
    return "unknown";
}

auto create_hash_family(HashFamilyType type) -> std::unique_ptr<IHashFamily> {
    switch (type) {
        case HashFamilyType::Murmur3:
            return std::make_unique<MurmurHashFamily>();
        case HashFamilyType::Md5:
            return std::make_unique<Md5HashFamily>();
    }
    throw std::logic_error("Invalid HashFamilyType: unreachable code path");
}
}  // namespace logsketch::hash
