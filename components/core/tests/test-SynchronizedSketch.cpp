#include <atomic>
#include <cmath>
#include <cstddef>
#include <string>
#include <thread>
#include <vector>

#include <catch2/catch.hpp>

#include "../src/logsketch/cardinality/HyperLogLog.hpp"
#include "../src/logsketch/concurrent/SynchronizedSketch.hpp"
#include "../src/logsketch/filter/BloomFilter.hpp"

using logsketch::cardinality::HyperLogLog;
using logsketch::concurrent::SynchronizedSketch;
using logsketch::filter::BloomFilter;

namespace {
constexpr size_t cNumThreads = 4;
constexpr size_t cValuesPerThread = 2000;

auto make_values() -> std::vector<std::string> {
    std::vector<std::string> values;
    values.reserve(cNumThreads * cValuesPerThread);
    for (size_t i = 0; i < cNumThreads * cValuesPerThread; ++i) {
        values.push_back("user-" + std::to_string(i));
    }
    return values;
}

template <typename SketchType>
void add_concurrently(
        SynchronizedSketch<SketchType>& sketch,
        std::vector<std::string> const& values
) {
    std::vector<std::thread> writers;
    writers.reserve(cNumThreads);
    for (size_t t = 0; t < cNumThreads; ++t) {
        writers.emplace_back([&sketch, &values, t]() {
            for (size_t i = t; i < values.size(); i += cNumThreads) {
                sketch.add(values[i]);
            }
        });
    }
    for (auto& writer : writers) {
        writer.join();
    }
}
}  // namespace

TEST_CASE("Concurrent adds to a BloomFilter lose nothing", "[SynchronizedSketch]") {
    auto const values = make_values();

    SynchronizedSketch<BloomFilter> shared(20'000, 4);
    std::atomic<bool> done{false};
    std::thread reader([&shared, &done]() {
        // A value that was never added may be reported, but reading must not disturb writers
        while (false == done.load()) {
            static_cast<void>(shared.possibly_contains("user-0"));
        }
    });
    add_concurrently(shared, values);
    done.store(true);
    reader.join();

    BloomFilter sequential(20'000, 4);
    for (auto const& value : values) {
        sequential.add(value);
    }

    shared.read([&sequential](BloomFilter const& filter) {
        REQUIRE(filter.get_bit_set() == sequential.get_bit_set());
        return 0;
    });
    for (auto const& value : values) {
        REQUIRE(shared.possibly_contains(value));
    }
}

TEST_CASE("Concurrent adds to a HyperLogLog match a sequential run", "[SynchronizedSketch]") {
    auto const values = make_values();

    SynchronizedSketch<HyperLogLog> shared(12U);
    add_concurrently(shared, values);

    HyperLogLog sequential(12);
    for (auto const& value : values) {
        sequential.add(value);
    }

    auto const registers = shared.read([](HyperLogLog const& estimator) {
        return estimator.get_registers();
    });
    REQUIRE(registers == sequential.get_registers());
    REQUIRE(shared.estimate() == sequential.estimate());
}

TEST_CASE("SynchronizedSketch adds a range under one lock", "[SynchronizedSketch]") {
    std::vector<std::string> const values{"10.0.0.1", "10.0.0.2", "10.0.0.1"};

    SynchronizedSketch<HyperLogLog> estimator(10U);
    estimator.add_all(values);
    REQUIRE(estimator.estimate() == Approx(1024.0 * std::log(1024.0 / 1022.0)));

    SynchronizedSketch<BloomFilter> filter(1000, 3);
    filter.add_all(values);
    REQUIRE(filter.possibly_contains("10.0.0.2"));
}
