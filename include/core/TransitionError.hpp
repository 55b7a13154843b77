#pragma once
/** @file  TransitionError.hpp
 *  @brief Result type returned by every set()/bang() call.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <chrono>
#include <cstdint>
#include <optional>
#include <ostream>

// bangbang headers
#include "core/State.hpp"

namespace bangbang {
  namespace core {

    /**
 * @struct TransitionError
 * @brief Why a requested transition was not committed.
 *
 *  * `TooSoon`: the minimum dwell of the current state has not elapsed,
 *    `remaining` says how long is left.
 *  * `HandlerRejected`: a transition handler vetoed the change, `code` is
 *    whatever the handler returned.
 */
    struct TransitionError {
      enum class Reason : std::uint8_t { TooSoon, HandlerRejected };

      Reason reason{ Reason::TooSoon };
      State from{ State::A };
      State to{ State::B };
      std::chrono::milliseconds remaining{ 0 };
      int code{ 0 };

      static constexpr TransitionError tooSoon(State from, State to,
                                               std::chrono::milliseconds remaining) noexcept {
        return TransitionError{ Reason::TooSoon, from, to, remaining, 0 };
      }

      static constexpr TransitionError rejected(State from, State to, int code) noexcept {
        return TransitionError{ Reason::HandlerRejected, from, to, std::chrono::milliseconds{ 0 },
                                code };
      }

      bool operator==(const TransitionError&) const = default;
    };

    /// Empty == committed (or nothing to do); engaged == denied, state untouched.
    using TransitionResult = std::optional<TransitionError>;

    inline const char* toString(TransitionError::Reason r) {
      switch (r) {
      case TransitionError::Reason::TooSoon:
        return "TooSoon";
      case TransitionError::Reason::HandlerRejected:
        return "HandlerRejected";
      }
      return "Unknown";
    }

    inline std::ostream& operator<<(std::ostream& os, const TransitionError& e) {
      os << toString(e.reason) << " (" << e.from << " -> " << e.to;
      if (e.reason == TransitionError::Reason::TooSoon)
        os << ", " << e.remaining.count() << " ms remaining";
      else
        os << ", code " << e.code;
      return os << ')';
    }

  } // namespace core
} // namespace bangbang
