#ifndef LOGSKETCH_WORKFLOW_UNIQUENESSCHECKER_HPP
#define LOGSKETCH_WORKFLOW_UNIQUENESSCHECKER_HPP

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "../filter/ProbabilisticFilter.hpp"

namespace logsketch::workflow {
enum class UniquenessStatus : uint8_t {
    Invalid = 0,
    AlreadyUsed = 1,
    Unique = 2,
};

struct UniquenessResult {
    std::string value;
    UniquenessStatus status;
};

/**
 * A candidate is valid if it is non-empty. Any other byte sequence is accepted as is.
 */
[[nodiscard]] auto is_valid_candidate(std::string_view candidate) -> bool;

/**
 * Classifies each candidate in order. Invalid candidates never reach the filter; a valid
 * candidate the filter may already contain is reported as already used; any other valid candidate
 * is unique and is added, so a later repeat of it is reported as already used.
 *
 * Since the filter can report false positives, a fresh candidate is occasionally reported as
 * already used. A used candidate is never reported as unique.
 * @param filter
 * @param candidates
 * @return One result per candidate, in input order
 */
[[nodiscard]] auto check_uniqueness(
        filter::IProbabilisticFilter& filter,
        std::vector<std::string> const& candidates
) -> std::vector<UniquenessResult>;

[[nodiscard]] auto uniqueness_status_to_string(UniquenessStatus status) -> std::string_view;
}  // namespace logsketch::workflow

#endif  // LOGSKETCH_WORKFLOW_UNIQUENESSCHECKER_HPP
