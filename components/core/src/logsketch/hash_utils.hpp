#ifndef LOGSKETCH_HASH_UTILS_HPP
#define LOGSKETCH_HASH_UTILS_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>

#include "ErrorCode.hpp"

namespace logsketch {
/**
 * Computes MurmurHash3 (x64, 128-bit variant) of a byte range.
 * @param input
 * @param seed
 * @return The two 64-bit halves of the hash, in the order the reference implementation emits them
 */
[[nodiscard]] auto murmurhash3_x64_128(std::span<unsigned char const> input, uint32_t seed)
        -> std::array<uint64_t, 2>;

constexpr size_t cMd5DigestSize = 16;

/**
 * Computes the MD5 digest of prefix followed by input through OpenSSL's EVP interface. Each
 * thread reuses one digest context, so no allocation happens per call.
 * @param prefix
 * @param input
 * @param hash Returns the digest
 * @return ErrorCodeSuccess on success
 * @return ErrorCodeFailure if OpenSSL could not compute the digest
 */
[[nodiscard]] auto get_md5_hash(
        std::span<unsigned char const> prefix,
        std::span<unsigned char const> input,
        std::array<unsigned char, cMd5DigestSize>& hash
) -> ErrorCode;

/**
 * Computes the MD5 digest of a byte range
 */
[[nodiscard]] auto
get_md5_hash(std::span<unsigned char const> input, std::array<unsigned char, cMd5DigestSize>& hash)
        -> ErrorCode;
}  // namespace logsketch

#endif  // LOGSKETCH_HASH_UTILS_HPP
