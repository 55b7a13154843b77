#pragma once
/** @file  OnOff.hpp
 *  @brief Bare on/off bang-bang controller (no timing).
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <functional>
#include <optional>

// bangbang headers
#include "core/StateHolder.hpp"

namespace bangbang {
  namespace core {

    /**
 * @class OnOff
 * @brief StateHolder whose only legality check is the optional handlers.
 *
 *  * `onEnterOn` runs before a transition into On, `onEnterOff` before a
 *    transition into Off. Returning a code vetoes the transition.
 *  * Handlers are never run by the constructor or by a same-state set().
 *  * Setting the current state again is a no-op success.
 */
    class OnOff : public StateHolder {
    public:
      /// Empty optional approves the transition; a value blocks it with that code.
      using Handler = std::function<std::optional<int>()>;

      explicit OnOff(State initial, Handler onEnterOn = {}, Handler onEnterOff = {});
      explicit OnOff(bool on, Handler onEnterOn = {}, Handler onEnterOff = {});

      State state() const override { return state_; }
      [[nodiscard]] TransitionResult set(State next) override;

    private:
      State state_;
      Handler onEnterOn_{};
      Handler onEnterOff_{};
    };

  } // namespace core
} // namespace bangbang
