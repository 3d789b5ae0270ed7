#include <cmath>
#include <cstddef>
#include <limits>

#include <catch2/catch.hpp>

#include "../src/logsketch/TraceableException.hpp"
#include "../src/logsketch/filter/FilterPolicy/BloomFilterPolicy.hpp"

using logsketch::ConfigurationError;
using logsketch::filter::BloomFilterPolicy;

TEST_CASE("BloomFilterPolicy uses the closed-form optimum", "[BloomFilterPolicy]") {
    BloomFilterPolicy const policy;

    auto const params = policy.compute_parameters(0.01);
    double const ln2 = std::log(2.0);
    REQUIRE(params.bits_per_key == Approx(-std::log(0.01) / (ln2 * ln2)));
    REQUIRE(params.num_hash_functions == 7);

    // m = -n ln(p) / ln(2)^2
    REQUIRE(BloomFilterPolicy::compute_bit_array_size(1000, 0.01) == 9586);
    REQUIRE(BloomFilterPolicy::compute_bit_array_size(1, 0.5) == 2);

    // k = (m/n) ln 2, never below one
    REQUIRE(BloomFilterPolicy::compute_num_hash_functions(10.0) == 7);
    REQUIRE(BloomFilterPolicy::compute_num_hash_functions(0.1) == 1);

    REQUIRE(policy.clone()->compute_parameters(0.01).num_hash_functions == 7);
}

TEST_CASE("BloomFilterPolicy false positive formula", "[BloomFilterPolicy]") {
    REQUIRE(BloomFilterPolicy::compute_false_positive_rate(0, 1000, 3) == 0.0);
    REQUIRE(BloomFilterPolicy::compute_false_positive_rate(3, 1000, 3)
            == Approx(std::pow(1.0 - std::exp(-0.009), 3.0)));
    REQUIRE(BloomFilterPolicy::compute_false_positive_rate(1000, 9586, 7) < 0.011);
}

TEST_CASE("BloomFilterPolicy rejects impossible targets", "[BloomFilterPolicy]") {
    BloomFilterPolicy const policy;
    REQUIRE_THROWS_AS(policy.compute_parameters(0.0), ConfigurationError);
    REQUIRE_THROWS_AS(policy.compute_parameters(1.0), ConfigurationError);
    REQUIRE_THROWS_AS(policy.compute_parameters(-0.5), ConfigurationError);
    REQUIRE_THROWS_AS(BloomFilterPolicy::compute_bit_array_size(0, 0.01), ConfigurationError);
    REQUIRE_THROWS_AS(
            BloomFilterPolicy::compute_bit_array_size(std::numeric_limits<size_t>::max(), 0.01),
            ConfigurationError
    );
}
