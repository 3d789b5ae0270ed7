#include <filesystem>
#include <fstream>
#include <limits>
#include <string>

#include <catch2/catch.hpp>
#include <nlohmann/json.hpp>

#include "../src/logsketch/BitSet.hpp"
#include "../src/logsketch/ErrorCode.hpp"
#include "../src/logsketch/SketchConfig.hpp"
#include "../src/logsketch/TraceableException.hpp"

using logsketch::ConfigurationError;
using logsketch::SketchConfig;
using logsketch::hash::HashFamilyType;

namespace {
auto write_temp_file(std::string const& name, std::string const& contents)
        -> std::filesystem::path {
    auto path = std::filesystem::temp_directory_path() / name;
    std::ofstream file(path);
    file << contents;
    return path;
}
}  // namespace

TEST_CASE("SketchConfig defaults", "[SketchConfig]") {
    auto const config = SketchConfig::from_json(nlohmann::json::object());
    REQUIRE(config.filter.capacity == 1000);
    REQUIRE(config.filter.hash_count == 3);
    REQUIRE(config.filter.hash_family == HashFamilyType::Murmur3);
    REQUIRE(config.estimator.bucket_bits == 10);
    REQUIRE(config.estimator.hash_family == HashFamilyType::Murmur3);
    REQUIRE_NOTHROW(SketchConfig{}.validate());
}

TEST_CASE("SketchConfig reads every field", "[SketchConfig]") {
    auto const config = SketchConfig::from_json(nlohmann::json::parse(R"({
        "filter": {"capacity": 4096, "hash_count": 5, "hash_family": "MD5"},
        "estimator": {"bucket_bits": 14, "hash_family": "murmur"}
    })"));
    REQUIRE(config.filter.capacity == 4096);
    REQUIRE(config.filter.hash_count == 5);
    REQUIRE(config.filter.hash_family == HashFamilyType::Md5);
    REQUIRE(config.estimator.bucket_bits == 14);
    REQUIRE(config.estimator.hash_family == HashFamilyType::Murmur3);

    auto const filter = config.create_filter();
    REQUIRE(filter.get_bit_array_size() == 4096);
    REQUIRE(filter.get_num_hash_functions() == 5);
    REQUIRE(filter.get_hash_family().get_type() == HashFamilyType::Md5);

    auto const estimator = config.create_estimator();
    REQUIRE(estimator.get_num_buckets() == 16'384);
}

TEST_CASE("SketchConfig keeps defaults for omitted fields", "[SketchConfig]") {
    auto const config
            = SketchConfig::from_json(nlohmann::json::parse(R"({"filter": {"hash_count": 7}})"));
    REQUIRE(config.filter.capacity == 1000);
    REQUIRE(config.filter.hash_count == 7);
    REQUIRE(config.estimator.bucket_bits == 10);
}

TEST_CASE("SketchConfig rejects invalid values", "[SketchConfig]") {
    auto const invalid_json = GENERATE(
            as<std::string>{},
            R"([1, 2])",
            R"({"filter": 3})",
            R"({"filter": {"capacity": "big"}})",
            R"({"filter": {"capacity": -1}})",
            R"({"filter": {"capacity": 0}})",
            R"({"filter": {"capacity": 18446744073709551615}})",
            R"({"filter": {"capacity": 68719476737}})",
            R"({"filter": {"hash_count": 2.5}})",
            R"({"filter": {"hash_count": 0}})",
            R"({"filter": {"hash_family": "sha1"}})",
            R"({"filter": {"hash_family": 5}})",
            R"({"estimator": {"bucket_bits": 30}})",
            R"({"estimator": {"bucket_bits": 3}})"
    );
    CAPTURE(invalid_json);
    REQUIRE_THROWS_AS(
            SketchConfig::from_json(nlohmann::json::parse(invalid_json)),
            ConfigurationError
    );
}

TEST_CASE("SketchConfig rejects an oversized capacity override", "[SketchConfig]") {
    SketchConfig config;
    config.filter.capacity = std::numeric_limits<size_t>::max();
    REQUIRE_THROWS_AS(config.validate(), ConfigurationError);

    config.filter.capacity = logsketch::BitSet::cMaxLength;
    REQUIRE_NOTHROW(config.validate());
}

TEST_CASE("SketchConfig round-trips through JSON", "[SketchConfig]") {
    SketchConfig config;
    config.filter.capacity = 123;
    config.filter.hash_family = HashFamilyType::Md5;
    config.estimator.bucket_bits = 6;

    auto const config_json = config.to_json();
    REQUIRE(config_json["filter"]["hash_family"] == "md5");
    REQUIRE(config_json["estimator"]["hash_family"] == "murmur3");

    auto const parsed = SketchConfig::from_json(config_json);
    REQUIRE(parsed.filter.capacity == 123);
    REQUIRE(parsed.filter.hash_count == 3);
    REQUIRE(parsed.filter.hash_family == HashFamilyType::Md5);
    REQUIRE(parsed.estimator.bucket_bits == 6);
}

TEST_CASE("SketchConfig loads files", "[SketchConfig]") {
    SECTION("valid file") {
        auto const path = write_temp_file(
                "logsketch-test-config.json",
                R"({"estimator": {"bucket_bits": 12}})"
        );
        auto const config = SketchConfig::load_from_file(path.string());
        std::filesystem::remove(path);
        REQUIRE(config.estimator.bucket_bits == 12);
    }

    SECTION("malformed file") {
        auto const path = write_temp_file("logsketch-test-malformed.json", "{\"filter\": ");
        try {
            static_cast<void>(SketchConfig::load_from_file(path.string()));
            std::filesystem::remove(path);
            FAIL("expected OperationFailed");
        } catch (SketchConfig::OperationFailed const& e) {
            std::filesystem::remove(path);
            REQUIRE(e.get_error_code() == logsketch::ErrorCodeCorrupt);
        }
    }

    SECTION("missing file") {
        auto const path = std::filesystem::temp_directory_path() / "logsketch-test-missing.json";
        std::filesystem::remove(path);
        try {
            static_cast<void>(SketchConfig::load_from_file(path.string()));
            FAIL("expected OperationFailed");
        } catch (SketchConfig::OperationFailed const& e) {
            REQUIRE(e.get_error_code() == logsketch::ErrorCodeFileNotFound);
        }
    }
}
