#pragma once
/** @file  State.hpp
 *  @brief Closed two-valued controller state (A/B, a.k.a. Off/On).
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cstdint>
#include <ostream>

namespace bangbang {
  namespace core {

    /**
 * @enum State
 * @brief The only two states a bang-bang controller can be in.
 *
 *  * `Off` / `On` are application aliases for `A` / `B`.
 *  * Closed: nothing else converts into a State.
 */
    enum class State : std::uint8_t {
      A,
      B,
      Off = A,
      On = B,
    };

    /// Total A <-> B mapping.
    constexpr State opposite(State s) noexcept { return s == State::A ? State::B : State::A; }

    inline const char* toString(State s) {
      switch (s) {
      case State::A:
        return "off";
      case State::B:
        return "on";
      }
      return "off";
    }

    inline std::ostream& operator<<(std::ostream& os, State s) { return os << toString(s); }

  } // namespace core
} // namespace bangbang
