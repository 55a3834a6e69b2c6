#include "sim/scenario_runner.hpp"
#include "sim/sim_deployment.hpp"
#include "auth/cluster_registry.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include <fstream>
#include <functional>
#include <map>
#include <stdexcept>

using json = nlohmann::json;

namespace {

const std::map<std::string, Address>& Aliases() {
  static const std::map<std::string, Address> aliases = {
    {"owner", SimAddresses::OWNER},
    {"aggregator", SimAddresses::AGGREGATOR},
    {"pauser", SimAddresses::PAUSER},
    {"cooldown_admin", SimAddresses::COOLDOWN_ADMIN},
    {"user", SimAddresses::USER},
    {"strategy", SimAddresses::STRATEGY},
  };
  return aliases;
}

Address ResolveAccount(const json& step, const char* field, const char* fallback) {
  std::string v = step.contains(field) ? step.at(field).get<std::string>() : std::string(fallback);
  auto it = Aliases().find(v);
  return it == Aliases().end() ? v : it->second;
}

Amount AmountField(const json& step, const char* field, Amount fallback = 0) {
  if (!step.contains(field)) return fallback;
  const auto& v = step.at(field);
  if (!v.is_number_unsigned()) {
    throw std::invalid_argument(std::string("field '") + field + "' must be a non-negative integer");
  }
  return v.get<Amount>();
}

PauseDirection DirectionField(const json& step) {
  std::string d = step.at("direction").get<std::string>();
  if (d == "deposit") return PauseDirection::Deposit;
  if (d == "withdraw") return PauseDirection::Withdraw;
  throw std::invalid_argument("unknown pause direction: " + d);
}

const std::string& RoleField(const json& step) {
  std::string r = step.at("role").get<std::string>();
  if (r == "pauser") return Roles::Pauser();
  if (r == "cooldown_admin") return Roles::CooldownAdmin();
  throw std::invalid_argument("unknown role: " + r);
}

using StepFn = std::function<void(SimDeployment&, const json&)>;

const std::map<std::string, StepFn>& Operations() {
  static const std::map<std::string, StepFn> ops = {
    {"deposit", [](SimDeployment& d, const json& s) {
      Amount amount = AmountField(s, "amount");
      d.FundHeld(amount);
      d.Strategy().OnDeposit(amount);
    }},
    {"withdraw", [](SimDeployment& d, const json& s) {
      d.Strategy().OnWithdraw(ResolveAccount(s, "to", "user"), AmountField(s, "amount"));
    }},
    {"set_pause", [](SimDeployment& d, const json& s) {
      d.Strategy().SetPause(ResolveAccount(s, "caller", "owner"), DirectionField(s), s.at("value").get<bool>());
    }},
    {"set_threshold", [](SimDeployment& d, const json& s) {
      d.Strategy().SetDepositThreshold(ResolveAccount(s, "caller", "owner"), AmountField(s, "amount"));
    }},
    {"cooldown_assets", [](SimDeployment& d, const json& s) {
      d.Strategy().CooldownAssets(ResolveAccount(s, "caller", "owner"), AmountField(s, "amount"));
    }},
    {"cooldown_shares", [](SimDeployment& d, const json& s) {
      d.Strategy().CooldownShares(ResolveAccount(s, "caller", "owner"), AmountField(s, "amount"));
    }},
    {"emergency_withdraw", [](SimDeployment& d, const json& s) {
      d.Strategy().EmergencyWithdraw(ResolveAccount(s, "caller", "owner"));
    }},
    {"rescue_eth", [](SimDeployment& d, const json& s) {
      d.Strategy().RescueEth(ResolveAccount(s, "caller", "owner"), ResolveAccount(s, "to", "owner"), AmountField(s, "amount"));
    }},
    {"fund_native", [](SimDeployment& d, const json& s) {
      Amount current = d.Chain().NativeBalance(SimAddresses::STRATEGY);
      d.Chain().SetNativeBalance(SimAddresses::STRATEGY, AmountMath::CheckedAdd(current, AmountField(s, "amount")));
    }},
    {"refuse_native", [](SimDeployment& d, const json& s) {
      d.Chain().SetRefusesNative(ResolveAccount(s, "account", "user"), s.value("value", true));
    }},
    {"grant_role", [](SimDeployment& d, const json& s) {
      d.Chain().GrantRole(SimAddresses::REGISTRY, ResolveAccount(s, "account", "pauser"), RoleField(s));
    }},
    {"revoke_role", [](SimDeployment& d, const json& s) {
      d.Chain().RevokeRole(SimAddresses::REGISTRY, ResolveAccount(s, "account", "pauser"), RoleField(s));
    }},
    {"advance_time", [](SimDeployment& d, const json& s) {
      d.Chain().AdvanceTime(AmountField(s, "seconds"));
    }},
    {"accrue_yield", [](SimDeployment& d, const json& s) {
      d.AccrueYield(AmountField(s, "amount"));
    }},
    {"set_cooldown_duration", [](SimDeployment& d, const json& s) {
      d.Chain().SetCooldownDuration(SimAddresses::STAKING, AmountField(s, "seconds"));
    }},
    {"check", [](SimDeployment&, const json&) {}},
  };
  return ops;
}

void Validate(const json& scenario) {
  if (!scenario.is_object()) throw std::invalid_argument("scenario must be a JSON object");
  if (!scenario.contains("steps") || !scenario["steps"].is_array()) throw std::invalid_argument("scenario needs a 'steps' array");
  size_t i = 0;
  for (const auto& s : scenario["steps"]) {
    if (!s.is_object() || !s.contains("op") || !s["op"].is_string()) {
      throw std::invalid_argument("step " + std::to_string(i) + " needs an 'op' string");
    }
    if (!Operations().count(s["op"].get<std::string>())) {
      throw std::invalid_argument("step " + std::to_string(i) + ": unknown op '" + s["op"].get<std::string>() + "'");
    }
    ++i;
  }
}

void CheckExpectations(const json& expect, ScenarioStepResult& r) {
  auto check_amount = [&](const char* key, Amount actual) {
    if (!expect.contains(key)) return;
    Amount want = expect.at(key).get<Amount>();
    if (want != actual) {
      r.mismatches.push_back(std::string(key) + ": expected " + std::to_string(want) + ", got " + std::to_string(actual));
    }
  };
  check_amount("held", r.held);
  check_amount("pool", r.pool);
  check_amount("current_balance", r.current_balance);
  if (expect.contains("ok") && expect["ok"].get<bool>() != r.ok) {
    r.mismatches.push_back(std::string("ok: expected ") + (r.ok ? "false" : "true"));
  }
  if (expect.contains("error")) {
    std::string want = expect["error"].get<std::string>();
    if (want != r.error) r.mismatches.push_back("error: expected " + want + ", got '" + r.error + "'");
  }
}

}  // namespace

bool ScenarioReport::Passed() const {
  for (const auto& s : steps) if (!s.mismatches.empty()) return false;
  return true;
}

json StepResultToJson(const ScenarioStepResult& r) {
  json j = {
    {"index", r.index}, {"op", r.op}, {"ok", r.ok},
    {"held", r.held}, {"pool", r.pool}, {"current_balance", r.current_balance},
  };
  if (!r.ok) {
    j["error"] = r.error;
    j["message"] = r.message;
  }
  if (!r.mismatches.empty()) j["mismatches"] = r.mismatches;
  return j;
}

json ReportToJson(const ScenarioReport& report) {
  json steps = json::array();
  for (const auto& s : report.steps) steps.push_back(StepResultToJson(s));
  return {{"name", report.name}, {"passed", report.Passed()}, {"steps", steps}};
}

ScenarioReport RunScenario(const json& scenario, EventSink* events) {
  Validate(scenario);
  const json setup = scenario.value("setup", json::object());

  SimDeploymentOptions options;
  options.name = scenario.value("name", options.name);
  options.cooldown_duration = AmountField(setup, "cooldown_duration");
  options.deposit_threshold = AmountField(setup, "threshold");
  options.events = events;
  SimDeployment d(options);
  d.FundHeld(AmountField(setup, "held"));
  d.SeedStaked(AmountField(setup, "staked"));
  d.SeedCooldown(AmountField(setup, "cooldown"));
  d.Chain().AdvanceTime(AmountField(setup, "elapsed"));

  ScenarioReport report;
  report.name = options.name;
  size_t index = 0;
  for (const auto& step : scenario["steps"]) {
    ScenarioStepResult r;
    r.index = index++;
    r.op = step["op"].get<std::string>();
    try {
      d.Run([&]{ Operations().at(r.op)(d, step); });
    } catch (const StrategyError& e) {
      r.ok = false;
      r.error = ErrorCodeName(e.Code());
      r.message = e.what();
    } catch (const ProtocolError& e) {
      r.ok = false;
      r.error = "ProtocolError";
      r.message = e.what();
    } catch (const std::invalid_argument&) {
      throw;
    } catch (const std::exception& e) {
      r.ok = false;
      r.error = "Error";
      r.message = e.what();
    }
    r.held = d.Held();
    r.pool = d.Strategy().Harvestable();
    r.current_balance = d.Strategy().CurrentBalance();
    if (step.contains("expect")) CheckExpectations(step["expect"], r);
    if (!r.mismatches.empty()) {
      Logger::Warning("scenario " + report.name + " step " + std::to_string(r.index) + " (" + r.op + ") mismatch: " + r.mismatches.front());
    }
    report.steps.push_back(std::move(r));
  }
  return report;
}

ScenarioReport RunScenarioFile(const std::string& path, EventSink* events) {
  std::ifstream in(path);
  if (!in.is_open()) throw std::runtime_error("cannot open scenario file: " + path);
  json scenario = json::parse(in, nullptr, false);
  if (scenario.is_discarded()) throw std::invalid_argument("scenario file is not valid JSON: " + path);
  return RunScenario(scenario, events);
}
