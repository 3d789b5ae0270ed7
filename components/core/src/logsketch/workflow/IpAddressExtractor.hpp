#ifndef LOGSKETCH_WORKFLOW_IPADDRESSEXTRACTOR_HPP
#define LOGSKETCH_WORKFLOW_IPADDRESSEXTRACTOR_HPP

#include <optional>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

#include "../TraceableException.hpp"

namespace logsketch::workflow {
/**
 * Pulls IPv4-like tokens (four dot-separated groups of one to three digits) out of log lines.
 * Octet ranges are not checked, so "999.1.1.1" is extracted as well.
 */
class IpAddressExtractor {
public:
    // Types
    class OperationFailed : public TraceableException {
    public:
        // Constructors
        OperationFailed(ErrorCode error_code, char const* const filename, int line_number)
                : TraceableException(error_code, filename, line_number) {}

        [[nodiscard]] auto what() const noexcept -> char const* override {
            return "IpAddressExtractor operation failed";
        }
    };

    // Constructors
    IpAddressExtractor();

    // Methods
    /**
     * @param line
     * @return The first IPv4-like token in the line, or std::nullopt if there is none
     */
    [[nodiscard]] auto extract(std::string_view line) const -> std::optional<std::string>;

    /**
     * Reads a line-oriented log file and extracts the first IPv4-like token of every line. Lines
     * without a token are skipped.
     * @param path
     * @return The tokens in file order, duplicates included
     * @throw OperationFailed with ErrorCodeFileNotFound if the file cannot be opened
     * @throw OperationFailed with ErrorCodeFailure if reading fails midway
     */
    [[nodiscard]] auto load_from_file(std::string const& path) const -> std::vector<std::string>;

private:
    std::regex m_pattern;
};
}  // namespace logsketch::workflow

#endif  // LOGSKETCH_WORKFLOW_IPADDRESSEXTRACTOR_HPP
