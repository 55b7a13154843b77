/* @file TimeSource.cpp
 * @brief steady_clock and tick-counter time sources
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <limits>
#include <stdexcept>

// bangbang headers
#include "core/TimeSource.hpp"

using namespace bangbang::core;

std::chrono::milliseconds SteadyTimeSource::now() const {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now().time_since_epoch());
}

TickTimeSource::TickTimeSource(TickFn ticks, std::chrono::microseconds tickPeriod)
    : ticks_{ ticks }, period_{ tickPeriod } {
  if (ticks_ == nullptr)
    throw std::invalid_argument("[TickTimeSource] tick counter is nullptr");
  if (period_.count() <= 0)
    throw std::invalid_argument("[TickTimeSource] tick period must be positive");
}

std::chrono::milliseconds TickTimeSource::now() const {
  constexpr auto kMax = static_cast<std::uint64_t>(std::numeric_limits<std::chrono::milliseconds::rep>::max());

  const std::uint64_t ticks = ticks_();
  const auto us = static_cast<std::uint64_t>(period_.count());

  // ticks * us / 1000, split so no intermediate product wraps
  const std::uint64_t q = ticks / 1000;
  const std::uint64_t r = ticks % 1000;
  if (q != 0 && us > kMax / q)
    return std::chrono::milliseconds::max();
  const std::uint64_t whole = q * us;
  const std::uint64_t part = r * (us / 1000) + (r * (us % 1000)) / 1000;
  if (whole > kMax - part)
    return std::chrono::milliseconds::max();
  return std::chrono::milliseconds{ static_cast<std::chrono::milliseconds::rep>(whole + part) };
}
