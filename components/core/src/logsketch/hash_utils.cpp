#include "hash_utils.hpp"

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <span>

#include <openssl/evp.h>
#include <spdlog/spdlog.h>

#include "ErrorCode.hpp"

namespace logsketch {
namespace {
/**
 * Owns an EVP_MD_CTX. Digests reinitialize it, so one context serves many computations.
 */
class EvpDigestContext {
public:
    EvpDigestContext() : m_ctx{EVP_MD_CTX_new()} {}

    ~EvpDigestContext() { EVP_MD_CTX_free(m_ctx); }

    EvpDigestContext(EvpDigestContext const&) = delete;
    auto operator=(EvpDigestContext const&) -> EvpDigestContext& = delete;
    EvpDigestContext(EvpDigestContext&&) = delete;
    auto operator=(EvpDigestContext&&) -> EvpDigestContext& = delete;

    [[nodiscard]] auto get() const -> EVP_MD_CTX* { return m_ctx; }

private:
    EVP_MD_CTX* m_ctx;
};

constexpr uint64_t cMurmurC1 = 0x87c3'7b91'1142'53d5ULL;
constexpr uint64_t cMurmurC2 = 0x4cf5'ad43'2745'937fULL;

inline auto rotl64(uint64_t x, int r) -> uint64_t {
    return (x << r) | (x >> (64 - r));
}

inline auto fmix64(uint64_t k) -> uint64_t {
    k ^= k >> 33;
    k *= 0xff51'afd7'ed55'8ccdULL;
    k ^= k >> 33;
    k *= 0xc4ce'b9fe'1a85'ec53ULL;
    k ^= k >> 33;
    return k;
}

inline auto read_block64(unsigned char const* data) -> uint64_t {
    uint64_t block = 0;
    std::memcpy(&block, data, sizeof(block));
    return block;
}
}  // namespace

auto murmurhash3_x64_128(std::span<unsigned char const> input, uint32_t seed)
        -> std::array<uint64_t, 2> {
    auto const* data = input.data();
    size_t const len = input.size();
    size_t const num_blocks = len / 16;

    uint64_t h1 = seed;
    uint64_t h2 = seed;

    for (size_t i = 0; i < num_blocks; ++i) {
        uint64_t k1 = read_block64(data + i * 16);
        uint64_t k2 = read_block64(data + i * 16 + 8);

        k1 *= cMurmurC1;
        k1 = rotl64(k1, 31);
        k1 *= cMurmurC2;
        h1 ^= k1;

        h1 = rotl64(h1, 27);
        h1 += h2;
        h1 = h1 * 5 + 0x52dc'e729;

        k2 *= cMurmurC2;
        k2 = rotl64(k2, 33);
        k2 *= cMurmurC1;
        h2 ^= k2;

        h2 = rotl64(h2, 31);
        h2 += h1;
        h2 = h2 * 5 + 0x3849'5ab5;
    }

    auto const* tail = data + num_blocks * 16;
    uint64_t k1 = 0;
    uint64_t k2 = 0;

    // Remaining 1 to 15 bytes, highest first
    switch (len & 15U) {
        case 15:
            k2 ^= static_cast<uint64_t>(tail[14]) << 48;
            [[fallthrough]];
        case 14:
            k2 ^= static_cast<uint64_t>(tail[13]) << 40;
            [[fallthrough]];
        case 13:
            k2 ^= static_cast<uint64_t>(tail[12]) << 32;
            [[fallthrough]];
        case 12:
            k2 ^= static_cast<uint64_t>(tail[11]) << 24;
            [[fallthrough]];
        case 11:
            k2 ^= static_cast<uint64_t>(tail[10]) << 16;
            [[fallthrough]];
        case 10:
            k2 ^= static_cast<uint64_t>(tail[9]) << 8;
            [[fallthrough]];
        case 9:
            k2 ^= static_cast<uint64_t>(tail[8]);
            k2 *= cMurmurC2;
            k2 = rotl64(k2, 33);
            k2 *= cMurmurC1;
            h2 ^= k2;
            [[fallthrough]];
        case 8:
            k1 ^= static_cast<uint64_t>(tail[7]) << 56;
            [[fallthrough]];
        case 7:
            k1 ^= static_cast<uint64_t>(tail[6]) << 48;
            [[fallthrough]];
        case 6:
            k1 ^= static_cast<uint64_t>(tail[5]) << 40;
            [[fallthrough]];
        case 5:
            k1 ^= static_cast<uint64_t>(tail[4]) << 32;
            [[fallthrough]];
        case 4:
            k1 ^= static_cast<uint64_t>(tail[3]) << 24;
            [[fallthrough]];
        case 3:
            k1 ^= static_cast<uint64_t>(tail[2]) << 16;
            [[fallthrough]];
        case 2:
            k1 ^= static_cast<uint64_t>(tail[1]) << 8;
            [[fallthrough]];
        case 1:
            k1 ^= static_cast<uint64_t>(tail[0]);
            k1 *= cMurmurC1;
            k1 = rotl64(k1, 31);
            k1 *= cMurmurC2;
            h1 ^= k1;
            break;
        default:
            break;
    }

    h1 ^= static_cast<uint64_t>(len);
    h2 ^= static_cast<uint64_t>(len);

    h1 += h2;
    h2 += h1;

    h1 = fmix64(h1);
    h2 = fmix64(h2);

    h1 += h2;
    h2 += h1;

    return {h1, h2};
}

auto get_md5_hash(
        std::span<unsigned char const> prefix,
        std::span<unsigned char const> input,
        std::array<unsigned char, cMd5DigestSize>& hash
) -> ErrorCode {
    thread_local EvpDigestContext const context;
    if (nullptr == context.get()) {
        SPDLOG_ERROR("EVP_MD_CTX_new failed.");
        return ErrorCodeFailure;
    }

    if (1 != EVP_DigestInit_ex(context.get(), EVP_md5(), nullptr)) {
        SPDLOG_ERROR("EVP_DigestInit_ex failed.");
        return ErrorCodeFailure;
    }

    if (false == prefix.empty()
        && 1 != EVP_DigestUpdate(context.get(), prefix.data(), prefix.size()))
    {
        SPDLOG_ERROR("EVP_DigestUpdate failed.");
        return ErrorCodeFailure;
    }
    if (1 != EVP_DigestUpdate(context.get(), input.data(), input.size())) {
        SPDLOG_ERROR("EVP_DigestUpdate failed.");
        return ErrorCodeFailure;
    }

    std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
    unsigned int digest_length = 0;
    if (1 != EVP_DigestFinal_ex(context.get(), digest.data(), &digest_length)) {
        SPDLOG_ERROR("EVP_DigestFinal_ex failed.");
        return ErrorCodeFailure;
    }
    if (cMd5DigestSize != digest_length) {
        SPDLOG_ERROR("Unexpected MD5 digest length {}.", digest_length);
        return ErrorCodeFailure;
    }
    std::copy_n(digest.begin(), cMd5DigestSize, hash.begin());

    return ErrorCodeSuccess;
}

auto get_md5_hash(
        std::span<unsigned char const> input,
        std::array<unsigned char, cMd5DigestSize>& hash
) -> ErrorCode {
    return get_md5_hash({}, input, hash);
}
}  // namespace logsketch
