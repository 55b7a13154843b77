#pragma once
/** @file  TimeSource.hpp
 *  @brief Injected monotonic clock capability (std clock or embedded tick counter).
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <chrono>
#include <cstdint>

namespace bangbang {
  namespace core {

    /**
 * @class TimeSource
 * @brief "Give me the current monotonic instant", in ms since an arbitrary epoch.
 *
 *  * Handed to controllers by reference at construction; they only read it.
 *  * Implementations are expected never to go backwards. Controllers cope
 *    when one does anyway.
 */
    class TimeSource {
    public:
      virtual ~TimeSource() = default;

      virtual std::chrono::milliseconds now() const = 0;
    };

    /** std::chrono::steady_clock, for hosts with an OS. */
    class SteadyTimeSource final : public TimeSource {
    public:
      std::chrono::milliseconds now() const override;
    };

    /**
 * @class TickTimeSource
 * @brief Adapts a free-running tick counter (SysTick, timer ISR, millis()).
 *
 *  * \p ticks is a plain function pointer, no allocation, ISR-friendly.
 *  * \p tickPeriod scales one tick; default is 1 ms per tick.
 *  * Readings past `milliseconds::max()` saturate there instead of wrapping.
 */
    class TickTimeSource final : public TimeSource {
    public:
      using TickFn = std::uint64_t (*)();

      /// Throws `std::invalid_argument` on a null counter or non-positive period.
      explicit TickTimeSource(TickFn ticks,
                              std::chrono::microseconds tickPeriod = std::chrono::milliseconds{ 1 });

      std::chrono::milliseconds now() const override;

    private:
      TickFn ticks_;
      std::chrono::microseconds period_;
    };

  } // namespace core
} // namespace bangbang
