#pragma once
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "common/types.hpp"

class EventSink;

struct ScenarioStepResult {
  size_t index = 0;
  std::string op;
  bool ok = true;
  std::string error;          // ErrorCode name, "ProtocolError", or exception text
  std::string message;
  Amount held = 0;
  Amount pool = 0;
  Amount current_balance = 0;
  std::vector<std::string> mismatches;  // failed "expect" checks
};

struct ScenarioReport {
  std::string name;
  std::vector<ScenarioStepResult> steps;
  bool Passed() const;
};

nlohmann::json StepResultToJson(const ScenarioStepResult& r);
nlohmann::json ReportToJson(const ScenarioReport& report);

// Runs a JSON scenario against a fresh SimDeployment:
//   {"name": "...",
//    "setup": {"cooldown_duration": 0, "threshold": 0, "held": 0, "staked": 0, "cooldown": 0},
//    "steps": [{"op": "deposit", "amount": 50, "expect": {"held": 50}}, ...]}
// Each step is its own chain transaction. Unknown ops throw std::invalid_argument before any
// step runs; a malformed field throws std::invalid_argument when its step is reached.
ScenarioReport RunScenario(const nlohmann::json& scenario, EventSink* events = nullptr);
ScenarioReport RunScenarioFile(const std::string& path, EventSink* events = nullptr);
