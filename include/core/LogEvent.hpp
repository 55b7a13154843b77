#pragma once
/** @file  LogEvent.hpp
 *  @brief Fixed-size transition record + the sink interface controllers report to.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <chrono>
#include <cstdint>

// bangbang headers
#include "core/State.hpp"

namespace bangbang {
  namespace core {

    /**
 * @struct LogEvent
 * @brief One controller decision, trivially copyable so it fits a lock-free ring.
 *
 *  `detail` depends on `kind`: remaining ms (Denied), handler code (Rejected),
 *  size of the backwards step in ms (ClockAnomaly), 0 (Committed).
 */
    struct LogEvent {
      enum class Kind : std::uint8_t { Committed, Denied, Rejected, ClockAnomaly };

      std::chrono::milliseconds timestamp{ 0 };
      Kind kind{ Kind::Committed };
      State from{ State::A };
      State to{ State::A };
      std::int64_t detail{ 0 };
    };

    inline const char* toString(LogEvent::Kind k) {
      switch (k) {
      case LogEvent::Kind::Committed:
        return "committed";
      case LogEvent::Kind::Denied:
        return "denied";
      case LogEvent::Kind::Rejected:
        return "rejected";
      case LogEvent::Kind::ClockAnomaly:
        return "clock_anomaly";
      }
      return "unknown";
    }

    /**
 * @class EventSink
 * @brief Receives LogEvents from a controller.
 *
 *  Called on the controller's own thread, possibly from an ISR or a tight
 *  polling loop: implementations must not block or throw.
 */
    class EventSink {
    public:
      virtual ~EventSink() = default;
      virtual void onEvent(const LogEvent& event) noexcept = 0;
    };

  } // namespace core
} // namespace bangbang
