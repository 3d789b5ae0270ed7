#include "UniquenessChecker.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace logsketch::workflow {
auto is_valid_candidate(std::string_view candidate) -> bool {
    return false == candidate.empty();
}

auto check_uniqueness(
        filter::IProbabilisticFilter& filter,
        std::vector<std::string> const& candidates
) -> std::vector<UniquenessResult> {
    std::vector<UniquenessResult> results;
    results.reserve(candidates.size());

    for (auto const& candidate : candidates) {
        if (false == is_valid_candidate(candidate)) {
            results.push_back({candidate, UniquenessStatus::Invalid});
            continue;
        }

        if (filter.possibly_contains(candidate)) {
            results.push_back({candidate, UniquenessStatus::AlreadyUsed});
        } else {
            filter.add(candidate);
            results.push_back({candidate, UniquenessStatus::Unique});
        }
    }

    return results;
}

auto uniqueness_status_to_string(UniquenessStatus status) -> std::string_view {
    switch (status) {
        case UniquenessStatus::Invalid:
            return "invalid";
        case UniquenessStatus::AlreadyUsed:
            return "already used";
        case UniquenessStatus::Unique:
            return "unique";
    }
    return "unknown";
}
}  // namespace logsketch::workflow
