#pragma once
/** @file  StateHolder.hpp
 *  @brief Abstract capability contract shared by every bang-bang controller.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include "core/State.hpp"
#include "core/TransitionError.hpp"

namespace bangbang::core {

  /**
 * @class StateHolder
 * @brief Report the current state, attempt to set a new one.
 *
 *  * Callers (the device loop that owns the actuator) program against this.
 *  * Synchronous and non-blocking; no internal locking. The owner serialises
 *    access if more than one thread drives the same instance.
 *  * A failed `set()` leaves the holder exactly as it was.
 */
  class StateHolder {
  public:
    virtual ~StateHolder() = default;

    /// Most recently committed state.
    virtual State state() const = 0;

    /// Request a transition to \p next; policy is up to the implementation.
    [[nodiscard]] virtual TransitionResult set(State next) = 0;

    /// Flip to the opposite state. Goes through set(), so its policy applies.
    [[nodiscard]] TransitionResult bang() { return set(opposite(state())); }

    bool isOn() const { return state() == State::On; }
    bool isOff() const { return state() == State::Off; }
  };

} // namespace bangbang::core
