#include "MurmurHashFamily.hpp"

#include <cstdint>
#include <span>
#include <string_view>

#include "../hash_utils.hpp"

namespace logsketch::hash {
auto MurmurHashFamily::hash(std::string_view value, uint32_t index) const -> uint64_t {
    auto const* value_bytes = reinterpret_cast<unsigned char const*>(value.data());
    std::span<unsigned char const> value_span(value_bytes, value.size());
    return murmurhash3_x64_128(value_span, index)[0];
}
}  // namespace logsketch::hash
