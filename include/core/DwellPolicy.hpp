#pragma once
/** @file  DwellPolicy.hpp
 *  @brief Per-state minimum-time-in-state rule.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <chrono>

// bangbang headers
#include "core/State.hpp"

namespace bangbang {
  namespace core {

    /**
 * @class DwellPolicy
 * @brief How long a controller must stay in a state before it may leave it.
 *
 *  * `minimumOn` guards On -> Off, `minimumOff` guards Off -> On.
 *  * Zero means unconstrained. Negative inputs are clamped to zero.
 *  * Elapsed time saturates at zero when `now` is earlier than `since`, so a
 *    clock that steps backwards can only delay a transition.
 */
    class DwellPolicy {
    public:
      DwellPolicy() = default;
      DwellPolicy(std::chrono::milliseconds minimumOn, std::chrono::milliseconds minimumOff);

      /// Same minimum for both states.
      static DwellPolicy symmetric(std::chrono::milliseconds minimum);

      std::chrono::milliseconds minimumIn(State s) const;
      std::chrono::milliseconds minimumOn() const { return minimumOn_; }
      std::chrono::milliseconds minimumOff() const { return minimumOff_; }

      /// `now - since`, or zero if the clock went backwards.
      static std::chrono::milliseconds elapsed(std::chrono::milliseconds since,
                                               std::chrono::milliseconds now);

      /// Time left before \p current may be left; zero once permitted.
      std::chrono::milliseconds remaining(State current, std::chrono::milliseconds since,
                                          std::chrono::milliseconds now) const;

      bool permits(State current, std::chrono::milliseconds since,
                   std::chrono::milliseconds now) const {
        return remaining(current, since, now) == std::chrono::milliseconds::zero();
      }

    private:
      std::chrono::milliseconds minimumOn_{ 0 };
      std::chrono::milliseconds minimumOff_{ 0 };
    };

  } // namespace core
} // namespace bangbang
