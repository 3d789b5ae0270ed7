#ifndef LOGSKETCH_CONCURRENT_SYNCHRONIZEDSKETCH_HPP
#define LOGSKETCH_CONCURRENT_SYNCHRONIZEDSKETCH_HPP

#include <mutex>
#include <shared_mutex>
#include <string_view>
#include <utility>

namespace logsketch::concurrent {
/**
 * Owns a sketch (BloomFilter or HyperLogLog) and serializes writers to it.
 *
 * Neither sketch's add is safe to run concurrently with itself: two threads raising the same
 * register, or setting bits in the same byte, can lose an update. Here every add runs under an
 * exclusive lock and every read under a shared lock, so readers run in parallel with each other
 * and observe the sketch either before or after any add, never in between.
 */
template <typename SketchType>
class SynchronizedSketch {
public:
    // Constructors
    template <typename... Args>
    explicit SynchronizedSketch(Args&&... args) : m_sketch(std::forward<Args>(args)...) {}

    SynchronizedSketch(SynchronizedSketch const&) = delete;
    auto operator=(SynchronizedSketch const&) -> SynchronizedSketch& = delete;

    // Methods
    void add(std::string_view value) {
        std::unique_lock lock(m_mutex);
        m_sketch.add(value);
    }

    /**
     * Adds every value of a range while holding the write lock once
     */
    template <typename Range>
    void add_all(Range const& values) {
        std::unique_lock lock(m_mutex);
        for (auto const& value : values) {
            m_sketch.add(value);
        }
    }

    /**
     * Runs function(sketch const&) under a shared lock and returns its result
     */
    template <typename Function>
    auto read(Function&& function) const {
        std::shared_lock lock(m_mutex);
        return std::forward<Function>(function)(std::as_const(m_sketch));
    }

    [[nodiscard]] auto possibly_contains(std::string_view value) const -> bool {
        std::shared_lock lock(m_mutex);
        return m_sketch.possibly_contains(value);
    }

    [[nodiscard]] auto estimate() const -> double {
        std::shared_lock lock(m_mutex);
        return m_sketch.estimate();
    }

private:
    mutable std::shared_mutex m_mutex;
    SketchType m_sketch;
};
}  // namespace logsketch::concurrent

#endif  // LOGSKETCH_CONCURRENT_SYNCHRONIZEDSKETCH_HPP
