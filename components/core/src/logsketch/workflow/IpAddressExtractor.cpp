#include "IpAddressExtractor.hpp"

#include <cstddef>
#include <fstream>
#include <optional>
#include <regex>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

#include "../ErrorCode.hpp"

namespace logsketch::workflow {
IpAddressExtractor::IpAddressExtractor()
        : m_pattern{R"((?:\d{1,3}\.){3}\d{1,3})", std::regex::ECMAScript | std::regex::optimize} {}

auto IpAddressExtractor::extract(std::string_view line) const -> std::optional<std::string> {
    std::match_results<std::string_view::const_iterator> match;
    if (false == std::regex_search(line.cbegin(), line.cend(), match, m_pattern)) {
        return std::nullopt;
    }
    return match.str(0);
}

auto IpAddressExtractor::load_from_file(std::string const& path) const
        -> std::vector<std::string> {
    std::ifstream file(path);
    if (false == file.is_open()) {
        SPDLOG_ERROR("Failed to open log file {}", path);
        throw OperationFailed(ErrorCodeFileNotFound, __FILENAME__, __LINE__);
    }

    std::vector<std::string> ip_addresses;
    std::string line;
    size_t num_lines = 0;
    while (std::getline(file, line)) {
        ++num_lines;
        if (auto ip_address = extract(line); ip_address.has_value()) {
            ip_addresses.emplace_back(std::move(ip_address.value()));
        }
    }
    if (file.bad()) {
        SPDLOG_ERROR("Failed while reading log file {}", path);
        throw OperationFailed(ErrorCodeFailure, __FILENAME__, __LINE__);
    }

    if (ip_addresses.empty()) {
        SPDLOG_WARN("No IP addresses found in {} ({} lines)", path, num_lines);
    } else {
        SPDLOG_INFO(
                "Extracted {} IP addresses from {} lines of {}",
                ip_addresses.size(),
                num_lines,
                path
        );
    }
    return ip_addresses;
}
}  // namespace logsketch::workflow
