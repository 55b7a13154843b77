#pragma once
/** @file  TimedOnOff.hpp
 *  @brief On/off controller that enforces a minimum dwell time per state.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <chrono>

// bangbang headers
#include "core/DwellPolicy.hpp"
#include "core/LogEvent.hpp"
#include "core/OnOff.hpp"
#include "core/StateHolder.hpp"
#include "core/TimeSource.hpp"

namespace bangbang {
  namespace core {

    /**
 * @class TimedOnOff
 * @brief Wraps an OnOff and refuses to leave a state before its minimum dwell.
 *
 *  * The clock is read once per set(); the same reading is used for the
 *    dwell check and, on success, becomes `lastTransition()`.
 *  * Order of checks: same-state (no-op success) -> dwell -> handlers.
 *  * Denials and handler rejections leave state and timestamp untouched.
 *  * A clock reading earlier than `lastTransition()` counts as zero elapsed
 *    time and is reported as a ClockAnomaly event. `lastTransition()` never
 *    moves backwards.
 *  * Does not own the clock or the sink; both must outlive the controller.
 */
    class TimedOnOff : public StateHolder {
    public:
      TimedOnOff(State initial, DwellPolicy policy, const TimeSource& clock,
                 OnOff::Handler onEnterOn = {}, OnOff::Handler onEnterOff = {});
      TimedOnOff(bool on, DwellPolicy policy, const TimeSource& clock,
                 OnOff::Handler onEnterOn = {}, OnOff::Handler onEnterOff = {});

      State state() const override { return inner_.state(); }
      [[nodiscard]] TransitionResult set(State next) override;

      /// Instant of the last committed transition (construction time until then).
      std::chrono::milliseconds lastTransition() const { return lastTransition_; }

      /// How long until the current state may be left, per the clock right now.
      std::chrono::milliseconds remaining() const;

      const DwellPolicy& policy() const { return policy_; }

      /// nullptr detaches.
      void attachSink(EventSink* sink) { sink_ = sink; }

    private:
      void emit(std::chrono::milliseconds now, LogEvent::Kind kind, State from, State to,
                std::int64_t detail) const;

      OnOff inner_;
      DwellPolicy policy_;
      const TimeSource& clock_;
      std::chrono::milliseconds lastTransition_;
      EventSink* sink_{ nullptr };
    };

  } // namespace core
} // namespace bangbang
