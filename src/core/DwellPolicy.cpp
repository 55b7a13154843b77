/* @file DwellPolicy.cpp
 * @brief saturating elapsed-time arithmetic and per-state minimum lookup
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

#include "core/DwellPolicy.hpp"

#include <algorithm>

using namespace bangbang::core;
using std::chrono::milliseconds;

DwellPolicy::DwellPolicy(milliseconds minimumOn, milliseconds minimumOff)
    : minimumOn_{ std::max(minimumOn, milliseconds::zero()) },
      minimumOff_{ std::max(minimumOff, milliseconds::zero()) } {}

DwellPolicy DwellPolicy::symmetric(milliseconds minimum) { return DwellPolicy{ minimum, minimum }; }

milliseconds DwellPolicy::minimumIn(State s) const {
  return s == State::On ? minimumOn_ : minimumOff_;
}

milliseconds DwellPolicy::elapsed(milliseconds since, milliseconds now) {
  if (now < since)
    return milliseconds::zero();
  return now - since;
}

milliseconds DwellPolicy::remaining(State current, milliseconds since, milliseconds now) const {
  const milliseconds minimum = minimumIn(current);
  const milliseconds spent = elapsed(since, now);
  if (spent >= minimum)
    return milliseconds::zero();
  return minimum - spent;
}
