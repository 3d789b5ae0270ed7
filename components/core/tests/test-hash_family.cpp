#include <array>
#include <cstddef>
#include <cstdint>
#include <set>
#include <span>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include <catch2/catch.hpp>

#include "../src/logsketch/hash/HashFamilyConfig.hpp"
#include "../src/logsketch/hash/Md5HashFamily.hpp"
#include "../src/logsketch/hash/MurmurHashFamily.hpp"
#include "../src/logsketch/hash_utils.hpp"

using logsketch::hash::HashFamilyType;
using logsketch::hash::Md5HashFamily;
using logsketch::hash::MurmurHashFamily;

namespace {
auto to_byte_span(std::string_view value) -> std::span<unsigned char const> {
    return {reinterpret_cast<unsigned char const*>(value.data()), value.size()};
}
}  // namespace

TEST_CASE("murmurhash3_x64_128 matches the reference implementation", "[hash]") {
    auto const hello = logsketch::murmurhash3_x64_128(to_byte_span("hello"), 0);
    REQUIRE(hello[0] == 0xcbd8'a7b3'41bd'9b02ULL);
    REQUIRE(hello[1] == 0x5b1e'906a'48ae'1d19ULL);

    auto const empty = logsketch::murmurhash3_x64_128(to_byte_span(""), 0);
    REQUIRE(empty[0] == 0);
    REQUIRE(empty[1] == 0);
}

TEST_CASE("get_md5_hash produces the MD5 digest", "[hash]") {
    std::array<unsigned char, logsketch::cMd5DigestSize> digest{};
    REQUIRE(logsketch::ErrorCodeSuccess == logsketch::get_md5_hash(to_byte_span("hello"), digest));
    REQUIRE(digest[0] == 0x5d);
    REQUIRE(digest[1] == 0x41);
    REQUIRE(digest[15] == 0x92);

    // A prefix is digested as if it were concatenated with the input
    std::array<unsigned char, logsketch::cMd5DigestSize> split_digest{};
    REQUIRE(logsketch::ErrorCodeSuccess
            == logsketch::get_md5_hash(to_byte_span("he"), to_byte_span("llo"), split_digest));
    REQUIRE(split_digest == digest);

    std::array<unsigned char, logsketch::cMd5DigestSize> empty_prefix_digest{};
    REQUIRE(logsketch::ErrorCodeSuccess
            == logsketch::get_md5_hash({}, to_byte_span("hello"), empty_prefix_digest));
    REQUIRE(empty_prefix_digest == digest);
}

TEST_CASE("Md5HashFamily member i digests the index bytes before the value", "[hash]") {
    Md5HashFamily const family;
    std::string const value = "192.168.0.1";
    for (uint32_t const index : {1U, 2U, 0x0102'0304U}) {
        std::string prefixed;
        for (size_t i = 0; i < sizeof(index); ++i) {
            prefixed.push_back(static_cast<char>((index >> (8 * i)) & 0xFFU));
        }
        prefixed += value;

        std::array<unsigned char, logsketch::cMd5DigestSize> digest{};
        REQUIRE(logsketch::ErrorCodeSuccess
                == logsketch::get_md5_hash(to_byte_span(prefixed), digest));
        uint64_t expected = 0;
        for (size_t i = 0; i < sizeof(uint64_t); ++i) {
            expected |= static_cast<uint64_t>(digest[i]) << (8 * i);
        }
        REQUIRE(family.hash(value, index) == expected);
    }
}

TEST_CASE("Md5HashFamily gives the same hashes on every thread", "[hash]") {
    Md5HashFamily const family;
    std::vector<uint64_t> expected;
    for (uint32_t i = 0; i < 64; ++i) {
        expected.push_back(family.hash("value-" + std::to_string(i), i % 8));
    }

    std::vector<std::vector<uint64_t>> per_thread(4);
    std::vector<std::thread> threads;
    for (auto& hashes : per_thread) {
        threads.emplace_back([&family, &hashes]() {
            for (uint32_t i = 0; i < 64; ++i) {
                hashes.push_back(family.hash("value-" + std::to_string(i), i % 8));
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    for (auto const& hashes : per_thread) {
        REQUIRE(hashes == expected);
    }
}

TEST_CASE("Hash families are deterministic and seeded by index", "[hash]") {
    auto const type = GENERATE(HashFamilyType::Murmur3, HashFamilyType::Md5);
    auto const family = logsketch::hash::create_hash_family(type);
    REQUIRE(family->get_type() == type);
    REQUIRE(family->get_hash_width() == 64);

    auto const other = family->clone();
    REQUIRE(other->get_type() == type);

    for (std::string const value :
         {"", "a", "password123", "192.168.0.1", "a longer value spanning blocks"})
    {
        std::set<uint64_t> per_index;
        for (uint32_t i = 0; i < 8; ++i) {
            auto const h = family->hash(value, i);
            REQUIRE(h == family->hash(value, i));
            REQUIRE(h == other->hash(value, i));
            per_index.insert(h);
        }
        // Different members of the family disagree on the same value
        REQUIRE(per_index.size() == 8);
    }
}

TEST_CASE("Md5HashFamily member 0 is the leading digest word", "[hash]") {
    Md5HashFamily family;
    // MD5("hello") = 5d41402abc4b2a76...
    REQUIRE(family.hash("hello", 0) == 0x762a'4bbc'2a40'415dULL);
    // MD5("") = d41d8cd98f00b204...
    REQUIRE(family.hash("", 0) == 0x04b2'008f'd98c'1dd4ULL);
}

TEST_CASE("MurmurHashFamily member i uses seed i", "[hash]") {
    MurmurHashFamily family;
    REQUIRE(family.hash("hello", 0) == 0xcbd8'a7b3'41bd'9b02ULL);
    REQUIRE(family.hash("", 0) == 0);
    REQUIRE(family.hash("", 1) != 0);
}

TEST_CASE("Hash family names", "[hash]") {
    using logsketch::hash::hash_family_type_to_string;
    using logsketch::hash::parse_hash_family_type;

    REQUIRE(parse_hash_family_type("murmur3") == HashFamilyType::Murmur3);
    REQUIRE(parse_hash_family_type("Murmur") == HashFamilyType::Murmur3);
    REQUIRE(parse_hash_family_type("MD5") == HashFamilyType::Md5);
    REQUIRE_FALSE(parse_hash_family_type("sha256").has_value());
    REQUIRE_FALSE(parse_hash_family_type("").has_value());

    REQUIRE(hash_family_type_to_string(HashFamilyType::Murmur3) == "murmur3");
    REQUIRE(hash_family_type_to_string(HashFamilyType::Md5) == "md5");
}
