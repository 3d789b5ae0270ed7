#ifndef LOGSKETCH_FILTER_PROBABILISTICFILTER_HPP
#define LOGSKETCH_FILTER_PROBABILISTICFILTER_HPP

#include <cstddef>
#include <memory>
#include <string_view>

namespace logsketch::filter {

/**
 * Abstract interface for probabilistic membership filters
 */
class IProbabilisticFilter {
public:
    virtual ~IProbabilisticFilter() = default;

    virtual void add(std::string_view value) = 0;
    [[nodiscard]] virtual auto possibly_contains(std::string_view value) const -> bool = 0;
    [[nodiscard]] virtual auto is_empty() const -> bool = 0;
    [[nodiscard]] virtual auto get_memory_usage() const -> size_t = 0;

    /**
     * Create a deep copy of this filter
     */
    [[nodiscard]] virtual auto clone() const -> std::unique_ptr<IProbabilisticFilter> = 0;

protected:
    IProbabilisticFilter() = default;
    IProbabilisticFilter(IProbabilisticFilter const&) = delete;
    auto operator=(IProbabilisticFilter const&) -> IProbabilisticFilter& = delete;
    IProbabilisticFilter(IProbabilisticFilter&&) = default;
    auto operator=(IProbabilisticFilter&&) -> IProbabilisticFilter& = default;
};

}  // namespace logsketch::filter

#endif  // LOGSKETCH_FILTER_PROBABILISTICFILTER_HPP
