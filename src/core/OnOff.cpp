/* @file OnOff.cpp
 * @brief bare on/off controller, handler gate only
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

#include "core/OnOff.hpp"

#include <utility>

using namespace bangbang::core;

OnOff::OnOff(State initial, Handler onEnterOn, Handler onEnterOff)
    : state_{ initial }, onEnterOn_{ std::move(onEnterOn) }, onEnterOff_{ std::move(onEnterOff) } {}

OnOff::OnOff(bool on, Handler onEnterOn, Handler onEnterOff)
    : OnOff(on ? State::On : State::Off, std::move(onEnterOn), std::move(onEnterOff)) {}

TransitionResult OnOff::set(State next) {
  if (next == state_)
    return std::nullopt;

  const Handler& handler = (next == State::On) ? onEnterOn_ : onEnterOff_;
  if (handler) {
    if (const auto code = handler())
      return TransitionError::rejected(state_, next, *code);
  }

  state_ = next;
  return std::nullopt;
}
