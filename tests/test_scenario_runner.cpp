#include <gtest/gtest.h>
#include <stdexcept>
#include <nlohmann/json.hpp>
#include "sim/scenario_runner.hpp"
#include "strategy/strategy_events.hpp"

using json = nlohmann::json;

TEST(ScenarioRunner, ShippedScenariosPass) {
  for (const char* path : {"scenarios/threshold_batching.json",
                           "scenarios/cooldown_withdrawal.json",
                           "scenarios/emergency.json"}) {
    ScenarioReport report = RunScenarioFile(path);
    EXPECT_TRUE(report.Passed()) << path << "\n" << ReportToJson(report).dump(2);
  }
}

TEST(ScenarioRunner, RecordsFailuresWithoutStopping) {
  json scenario = json::parse(R"({
    "name": "failures",
    "setup": {"held": 10},
    "steps": [
      {"op": "withdraw", "amount": 11},
      {"op": "set_pause", "caller": "user", "direction": "withdraw", "value": true},
      {"op": "withdraw", "amount": 4, "expect": {"held": 6}}
    ]
  })");
  RecordingEventSink sink;
  ScenarioReport report = RunScenario(scenario, &sink);

  ASSERT_EQ(report.steps.size(), 3u);
  EXPECT_EQ(report.name, "failures");
  EXPECT_FALSE(report.steps[0].ok);
  EXPECT_EQ(report.steps[0].error, "InsufficientFunds");
  EXPECT_EQ(report.steps[0].held, 10u);
  EXPECT_EQ(report.steps[1].error, "PauserNotAuthorized");
  EXPECT_TRUE(report.steps[2].ok);
  EXPECT_TRUE(report.Passed());
  ASSERT_EQ(sink.Events().size(), 1u);
  EXPECT_EQ(sink.Events()[0].kind, StrategyEventKind::Withdrawn);
}

TEST(ScenarioRunner, ReportsExpectationMismatches) {
  json scenario = json::parse(R"({
    "steps": [{"op": "deposit", "amount": 5, "expect": {"held": 5, "ok": false}}]
  })");
  ScenarioReport report = RunScenario(scenario);
  EXPECT_FALSE(report.Passed());
  // threshold 0 stakes immediately, and the step succeeded
  ASSERT_EQ(report.steps[0].mismatches.size(), 2u);

  json out = ReportToJson(report);
  EXPECT_FALSE(out["passed"].get<bool>());
  EXPECT_EQ(out["steps"][0]["pool"].get<Amount>(), 5u);
  EXPECT_TRUE(out["steps"][0].contains("mismatches"));
}

TEST(ScenarioRunner, CooldownLifecycleAndRoles) {
  json scenario = json::parse(R"({
    "setup": {"cooldown_duration": 100, "staked": 60},
    "steps": [
      {"op": "cooldown_shares", "caller": "cooldown_admin", "amount": 10, "expect": {"error": "CooldownNotAuthorized"}},
      {"op": "grant_role", "account": "cooldown_admin", "role": "cooldown_admin"},
      {"op": "cooldown_shares", "caller": "cooldown_admin", "amount": 10, "expect": {"ok": true, "pool": 10}},
      {"op": "advance_time", "seconds": 100},
      {"op": "emergency_withdraw", "expect": {"held": 10, "pool": 0}},
      {"op": "set_cooldown_duration", "seconds": 0, "expect": {"pool": 50, "current_balance": 60}}
    ]
  })");
  ScenarioReport report = RunScenario(scenario);
  EXPECT_TRUE(report.Passed()) << ReportToJson(report).dump(2);
}

TEST(ScenarioRunner, NativeRescueSteps) {
  json scenario = json::parse(R"({
    "steps": [
      {"op": "fund_native", "amount": 9},
      {"op": "refuse_native", "account": "user"},
      {"op": "rescue_eth", "to": "user", "amount": 0, "expect": {"error": "TransferFailed"}},
      {"op": "rescue_eth", "to": "owner", "amount": 0, "expect": {"ok": true}}
    ]
  })");
  EXPECT_TRUE(RunScenario(scenario).Passed());
}

TEST(ScenarioRunner, MalformedScenariosAreRejected) {
  EXPECT_THROW(RunScenario(json::array()), std::invalid_argument);
  EXPECT_THROW(RunScenario(json::parse(R"({"steps": [{"op": "mint"}]})")), std::invalid_argument);
  EXPECT_THROW(RunScenario(json::parse(R"({"steps": [{"op": "deposit", "amount": -1}]})")), std::invalid_argument);
  EXPECT_THROW(RunScenario(json::parse(R"({"steps": [{"op": "set_pause", "direction": "sideways", "value": true}]})")),
               std::invalid_argument);
  EXPECT_THROW(RunScenarioFile("scenarios/does_not_exist.json"), std::runtime_error);
}
