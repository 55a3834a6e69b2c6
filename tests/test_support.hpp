#pragma once
#include <gtest/gtest.h>
#include <vector>
#include "common/errors.hpp"
#include "strategy/strategy_events.hpp"

// Runs fn and returns the StrategyError code it raised. Fails the test if none was raised.
template <typename Fn>
ErrorCode StrategyErrorCodeOf(Fn&& fn) {
  try {
    fn();
  } catch (const StrategyError& e) {
    return e.Code();
  }
  ADD_FAILURE() << "expected a StrategyError";
  return ErrorCode::InvalidConfiguration;
}

inline std::vector<StrategyEventKind> KindsOf(const RecordingEventSink& sink) {
  std::vector<StrategyEventKind> kinds;
  for (const auto& e : sink.Events()) kinds.push_back(e.kind);
  return kinds;
}
