/* @file TimedOnOff.cpp
 * @brief minimum-dwell enforcement on top of the bare on/off controller
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <utility>

// bangbang headers
#include "core/TimedOnOff.hpp"

using namespace bangbang::core;
using std::chrono::milliseconds;

TimedOnOff::TimedOnOff(State initial, DwellPolicy policy, const TimeSource& clock,
                       OnOff::Handler onEnterOn, OnOff::Handler onEnterOff)
    : inner_{ initial, std::move(onEnterOn), std::move(onEnterOff) },
      policy_{ policy },
      clock_{ clock },
      lastTransition_{ clock.now() } {}

TimedOnOff::TimedOnOff(bool on, DwellPolicy policy, const TimeSource& clock,
                       OnOff::Handler onEnterOn, OnOff::Handler onEnterOff)
    : TimedOnOff(on ? State::On : State::Off, policy, clock, std::move(onEnterOn),
                 std::move(onEnterOff)) {}

TransitionResult TimedOnOff::set(State next) {
  const State current = inner_.state();

  // not a transition: dwell never applies and the timestamp stays put
  if (next == current)
    return std::nullopt;

  const milliseconds now = clock_.now();
  if (now < lastTransition_)
    emit(now, LogEvent::Kind::ClockAnomaly, current, next, (lastTransition_ - now).count());

  const milliseconds wait = policy_.remaining(current, lastTransition_, now);
  if (wait > milliseconds::zero()) {
    emit(now, LogEvent::Kind::Denied, current, next, wait.count());
    return TransitionError::tooSoon(current, next, wait);
  }

  if (auto err = inner_.set(next)) {
    emit(now, LogEvent::Kind::Rejected, current, next, err->code);
    return err;
  }

  lastTransition_ = std::max(lastTransition_, now);
  emit(now, LogEvent::Kind::Committed, current, next, 0);
  return std::nullopt;
}

milliseconds TimedOnOff::remaining() const {
  return policy_.remaining(inner_.state(), lastTransition_, clock_.now());
}

void TimedOnOff::emit(milliseconds now, LogEvent::Kind kind, State from, State to,
                      std::int64_t detail) const {
  if (sink_)
    sink_->onEvent(LogEvent{ now, kind, from, to, detail });
}
