#include "Stopwatch.hpp"

#include <chrono>

namespace logsketch {
void Stopwatch::start() {
    m_begin = std::chrono::steady_clock::now();
}

void Stopwatch::stop() {
    auto const end = std::chrono::steady_clock::now();
    m_time_taken += end - m_begin;
}

void Stopwatch::reset() {
    m_time_taken = std::chrono::steady_clock::duration::zero();
}

auto Stopwatch::get_time_taken_in_seconds() const -> double {
    return std::chrono::duration<double>(m_time_taken).count();
}
}  // namespace logsketch
