#ifndef LOGSKETCH_STOPWATCH_HPP
#define LOGSKETCH_STOPWATCH_HPP

#include <chrono>

namespace logsketch {
/**
 * Accumulates wall-clock time across start/stop pairs
 */
class Stopwatch {
public:
    // Constructors
    Stopwatch() { reset(); }

    // Methods
    void start();
    void stop();
    void reset();

    [[nodiscard]] auto get_time_taken_in_seconds() const -> double;

private:
    std::chrono::steady_clock::time_point m_begin;
    std::chrono::steady_clock::duration m_time_taken;
};
}  // namespace logsketch

#endif  // LOGSKETCH_STOPWATCH_HPP
