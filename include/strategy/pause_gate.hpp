#pragma once
#include "strategy/strategy_events.hpp"

// Two independent gates. Closing one never touches the other.
class PauseGate {
public:
  bool IsPaused(PauseDirection d) const { return d == PauseDirection::Deposit ? deposit_paused_ : withdraw_paused_; }
  // Returns the previous value
  bool Set(PauseDirection d, bool value) {
    bool& slot = d == PauseDirection::Deposit ? deposit_paused_ : withdraw_paused_;
    bool before = slot;
    slot = value;
    return before;
  }
private:
  bool deposit_paused_ = false;
  bool withdraw_paused_ = false;
};
