#include "Md5HashFamily.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>

#include "../ErrorCode.hpp"
#include "../hash_utils.hpp"

namespace logsketch::hash {
auto Md5HashFamily::hash(std::string_view value, uint32_t index) const -> uint64_t {
    std::array<unsigned char, sizeof(index)> index_bytes{};
    for (size_t i = 0; i < index_bytes.size(); ++i) {
        index_bytes[i] = static_cast<unsigned char>((index >> (8 * i)) & 0xFFU);
    }
    // Member 0 hashes the value alone
    std::span<unsigned char const> prefix;
    if (0 != index) {
        prefix = index_bytes;
    }
    std::span<unsigned char const> const input(
            reinterpret_cast<unsigned char const*>(value.data()),
            value.size()
    );

    std::array<unsigned char, cMd5DigestSize> digest{};
    if (ErrorCodeSuccess != get_md5_hash(prefix, input, digest)) {
        throw OperationFailed(ErrorCodeFailure, __FILENAME__, __LINE__);
    }

    uint64_t hash_value = 0;
    for (size_t i = 0; i < sizeof(uint64_t); ++i) {
        hash_value |= static_cast<uint64_t>(digest[i]) << (8 * i);
    }
    return hash_value;
}
}  // namespace logsketch::hash
