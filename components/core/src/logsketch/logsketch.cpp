#include <cstddef>
#include <cstdint>
#include <exception>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <boost/program_options.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/sinks/stdout_sinks.h>
#include <spdlog/spdlog.h>

#include "cardinality/HyperLogLog.hpp"
#include "hash/HashFamilyConfig.hpp"
#include "SketchConfig.hpp"
#include "workflow/DistinctCounter.hpp"
#include "workflow/IpAddressExtractor.hpp"
#include "workflow/UniquenessChecker.hpp"

using namespace logsketch;

namespace {
auto read_lines(std::string const& path, std::vector<std::string>& lines, std::string& error)
        -> bool {
    std::ifstream in(path);
    if (false == in.is_open()) {
        error = "failed to open file";
        return false;
    }

    std::string line;
    while (std::getline(in, line)) {
        if (false == line.empty() && '\r' == line.back()) {
            line.pop_back();
        }
        lines.emplace_back(std::move(line));
    }
    if (in.bad()) {
        error = "failed while reading file";
        return false;
    }
    return true;
}

auto emit_json(nlohmann::json const& output, std::string const& output_path, std::string& error)
        -> bool {
    std::ofstream out(output_path, std::ios::binary | std::ios::trunc);
    if (false == out.is_open()) {
        error = "failed to open output file";
        return false;
    }
    out << output.dump(2) << '\n';
    if (false == out.good()) {
        error = "failed to write output file";
        return false;
    }
    return true;
}

auto regime_to_string(cardinality::EstimateRegime regime) -> char const* {
    switch (regime) {
        case cardinality::EstimateRegime::LinearCounting:
            return "linear_counting";
        case cardinality::EstimateRegime::Raw:
            return "raw";
        case cardinality::EstimateRegime::LargeRange:
            return "large_range";
    }
    return "unknown";
}

auto parse_hash_family_option(std::string const& name) -> hash::HashFamilyType {
    auto const type = hash::parse_hash_family_type(name);
    if (false == type.has_value()) {
        throw std::invalid_argument("Unknown hash family: " + name);
    }
    return type.value();
}

auto load_base_config(std::string const& config_path) -> SketchConfig {
    if (config_path.empty()) {
        return SketchConfig{};
    }
    return SketchConfig::load_from_file(config_path);
}

auto run_uniqueness(
        SketchConfig const& config,
        std::string const& existing_path,
        std::string const& candidates_path,
        std::string const& output_json_path
) -> int {
    std::string error;
    std::vector<std::string> existing;
    if (false == existing_path.empty() && false == read_lines(existing_path, existing, error)) {
        SPDLOG_ERROR("Failed to read existing values {} - {}", existing_path, error);
        return 1;
    }

    std::vector<std::string> candidates;
    if (false == read_lines(candidates_path, candidates, error)) {
        SPDLOG_ERROR("Failed to read candidates {} - {}", candidates_path, error);
        return 1;
    }

    auto filter = config.create_filter();
    size_t num_seeded = 0;
    for (auto const& value : existing) {
        if (workflow::is_valid_candidate(value)) {
            filter.add(value);
            ++num_seeded;
        }
    }
    if (filter.get_expected_false_positive_rate(num_seeded + candidates.size()) > 0.05) {
        SPDLOG_WARN(
                "Filter of {} bits is undersized for {} values; expect frequent false positives.",
                filter.get_bit_array_size(),
                num_seeded + candidates.size()
        );
    }

    auto const results = workflow::check_uniqueness(filter, candidates);

    nlohmann::json output;
    output["config"] = config.to_json();
    output["num_existing"] = num_seeded;
    output["results"] = nlohmann::json::array();
    for (auto const& result : results) {
        auto const status = workflow::uniqueness_status_to_string(result.status);
        std::cout << "'" << result.value << "' - " << status << std::endl;
        output["results"].push_back({{"value", result.value}, {"status", std::string(status)}});
    }
    output["fill_ratio"] = filter.get_fill_ratio();

    if (false == output_json_path.empty() && false == emit_json(output, output_json_path, error)) {
        SPDLOG_ERROR("Failed to write uniqueness output {} - {}", output_json_path, error);
        return 1;
    }
    return 0;
}

auto run_compare(
        SketchConfig const& config,
        std::string const& log_path,
        std::string const& output_json_path
) -> int {
    workflow::IpAddressExtractor extractor;
    auto const ip_addresses = extractor.load_from_file(log_path);

    auto const report = workflow::compare_distinct_counts(
            ip_addresses,
            config.estimator.bucket_bits,
            config.estimator.hash_family
    );

    std::cout << "Distinct value comparison (" << report.num_values << " values)\n";
    std::cout << std::left << std::setw(14) << "Method" << std::right << std::setw(20)
              << "Distinct values" << std::setw(16) << "Time (s)" << '\n';
    std::cout << std::left << std::setw(14) << "Exact" << std::right << std::setw(20)
              << report.exact_count << std::setw(16) << std::fixed << std::setprecision(6)
              << report.exact_seconds << '\n';
    std::cout << std::left << std::setw(14) << "HyperLogLog" << std::right << std::setw(20)
              << std::setprecision(1) << report.approximate_count << std::setw(16)
              << std::setprecision(6) << report.approximate_seconds << std::endl;

    if (output_json_path.empty()) {
        return 0;
    }

    nlohmann::json output;
    output["config"] = config.to_json();
    output["num_values"] = report.num_values;
    output["exact"]["count"] = report.exact_count;
    output["exact"]["seconds"] = report.exact_seconds;
    output["hyperloglog"]["estimate"] = report.approximate_count;
    output["hyperloglog"]["seconds"] = report.approximate_seconds;
    output["hyperloglog"]["regime"] = regime_to_string(report.regime);
    output["hyperloglog"]["relative_error"] = report.relative_error;
    output["hyperloglog"]["memory_bytes"] = report.approximate_memory_bytes;

    std::string error;
    if (false == emit_json(output, output_json_path, error)) {
        SPDLOG_ERROR("Failed to write comparison output {} - {}", output_json_path, error);
        return 1;
    }
    return 0;
}
}  // namespace

int main(int argc, char const* argv[]) {
    try {
        auto stderr_logger = spdlog::stderr_logger_st("stderr");
        spdlog::set_default_logger(stderr_logger);
        spdlog::set_pattern("%Y-%m-%dT%H:%M:%S.%e%z [%l] %v");
    } catch (std::exception const&) {
        return 1;
    }

    try {
        namespace po = boost::program_options;

        auto print_usage = []() {
            std::cerr << "Usage: logsketch <command> [options]\n"
                         "Commands:\n"
                         "  uniqueness  Check candidate values against a bloom filter\n"
                         "  compare     Compare exact and HyperLogLog distinct IP counts of a log\n"
                      << std::endl;
        };

        if (argc < 2) {
            print_usage();
            return 1;
        }

        std::string command = argv[1];
        if (command == "--help" || command == "-h") {
            print_usage();
            return 0;
        }

        if (command == "uniqueness") {
            std::string existing_path;
            std::string candidates_path;
            std::string config_path;
            std::string output_json_path;
            size_t capacity{0};
            uint32_t hash_count{0};
            std::string hash_family;

            po::options_description options("Uniqueness options");
            // clang-format off
            options.add_options()
                    ("help,h", "Show help")
                    ("existing", po::value<std::string>(&existing_path)->value_name("PATH"),
                     "File with one already-used value per line")
                    ("candidates", po::value<std::string>(&candidates_path)->value_name("PATH"),
                     "File with one candidate value per line")
                    ("config", po::value<std::string>(&config_path)->value_name("PATH"),
                     "JSON sketch configuration")
                    ("capacity", po::value<size_t>(&capacity)->value_name("BITS"),
                     "Number of bits in the filter")
                    ("hashes", po::value<uint32_t>(&hash_count)->value_name("K"),
                     "Number of hash functions")
                    ("hash", po::value<std::string>(&hash_family)->value_name("NAME"),
                     "Hash family (murmur3 or md5)")
                    ("output-json", po::value<std::string>(&output_json_path)->value_name("PATH"),
                     "Also write results as JSON to this file");
            // clang-format on

            po::positional_options_description positional;
            positional.add("candidates", 1);

            int sub_argc = argc - 1;
            char const** sub_argv = argv + 1;
            po::variables_map vm;
            po::store(
                    po::command_line_parser(sub_argc, sub_argv)
                            .options(options)
                            .positional(positional)
                            .run(),
                    vm
            );
            po::notify(vm);

            if (vm.count("help")) {
                std::cerr << "Usage: logsketch uniqueness --candidates <PATH> [--existing <PATH>]"
                             " [options]"
                          << std::endl
                          << std::endl;
                std::cerr << options << std::endl;
                return 0;
            }

            if (candidates_path.empty()) {
                throw std::invalid_argument("candidates must be specified.");
            }

            auto config = load_base_config(config_path);
            if (vm.count("capacity")) {
                config.filter.capacity = capacity;
            }
            if (vm.count("hashes")) {
                config.filter.hash_count = hash_count;
            }
            if (vm.count("hash")) {
                config.filter.hash_family = parse_hash_family_option(hash_family);
            }
            config.validate();

            return run_uniqueness(config, existing_path, candidates_path, output_json_path);
        }

        if (command == "compare") {
            std::string log_path;
            std::string config_path;
            std::string output_json_path;
            uint32_t bucket_bits{0};
            std::string hash_family;

            po::options_description options("Compare options");
            // clang-format off
            options.add_options()
                    ("help,h", "Show help")
                    ("log-file", po::value<std::string>(&log_path)->value_name("PATH"),
                     "Log file to extract IP addresses from")
                    ("config", po::value<std::string>(&config_path)->value_name("PATH"),
                     "JSON sketch configuration")
                    ("bucket-bits,b", po::value<uint32_t>(&bucket_bits)->value_name("B"),
                     "Number of HyperLogLog bucket bits")
                    ("hash", po::value<std::string>(&hash_family)->value_name("NAME"),
                     "Hash family (murmur3 or md5)")
                    ("output-json", po::value<std::string>(&output_json_path)->value_name("PATH"),
                     "Also write results as JSON to this file");
            // clang-format on

            po::positional_options_description positional;
            positional.add("log-file", 1);

            int sub_argc = argc - 1;
            char const** sub_argv = argv + 1;
            po::variables_map vm;
            po::store(
                    po::command_line_parser(sub_argc, sub_argv)
                            .options(options)
                            .positional(positional)
                            .run(),
                    vm
            );
            po::notify(vm);

            if (vm.count("help")) {
                std::cerr << "Usage: logsketch compare --log-file <PATH> [options]" << std::endl
                          << std::endl;
                std::cerr << options << std::endl;
                return 0;
            }

            if (log_path.empty()) {
                throw std::invalid_argument("log-file must be specified.");
            }

            auto config = load_base_config(config_path);
            if (vm.count("bucket-bits")) {
                config.estimator.bucket_bits = bucket_bits;
            }
            if (vm.count("hash")) {
                config.estimator.hash_family = parse_hash_family_option(hash_family);
            }
            config.validate();

            return run_compare(config, log_path, output_json_path);
        }

        print_usage();
        return 1;
    } catch (std::exception const& e) {
        SPDLOG_ERROR("{}", e.what());
        std::cerr << "Try --help for usage." << std::endl;
        return 1;
    }
}
