#include "common/logger.hpp"
#include "common/config_manager.hpp"
#include "config/network.hpp"
#include "config/strategy_config.hpp"
#include "monitor/strategy_monitor.hpp"
#include "net/http_client.hpp"
#include "node_connection/rpc_client.hpp"
#include "sim/scenario_runner.hpp"
#include "telemetry/jsonl_event_sink.hpp"
#include "telemetry/structured_logger.hpp"
#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <nlohmann/json.hpp>

static void PrintUsage(const char* argv0) {
  std::cout << "usage:\n"
            << "  " << argv0 << " simulate <scenario.json> [--env <path>]\n"
            << "  " << argv0 << " monitor [--env <path>]\n";
}

static int RunSimulate(const std::string& path, const StrategyConfig& cfg) {
  std::ifstream in(path);
  if (!in.is_open()) {
    std::cout << "ERROR: cannot open scenario " << path << std::endl;
    return 1;
  }
  nlohmann::json scenario = nlohmann::json::parse(in, nullptr, false);
  if (scenario.is_discarded()) {
    std::cout << "ERROR: scenario " << path << " is not valid JSON" << std::endl;
    return 1;
  }
  // .env supplies defaults the scenario does not set itself
  if (!scenario.contains("name")) scenario["name"] = cfg.name;
  if (!scenario.contains("setup")) scenario["setup"] = nlohmann::json::object();
  if (!scenario["setup"].contains("threshold")) scenario["setup"]["threshold"] = cfg.deposit_threshold;

  JsonlEventSink events;
  Logger::Info("Running scenario " + path);
  ScenarioReport report = RunScenario(scenario, &events);
  std::cout << ReportToJson(report).dump(2) << std::endl;
  Logger::Info("Scenario " + report.name + (report.Passed() ? " passed" : " FAILED"));
  return report.Passed() ? 0 : 2;
}

static int RunMonitor() {
  NetworkConfig net = LoadNetworkConfig();
  std::unique_ptr<HttpClient> http = CreateCurlHttpClient();
  RpcClient rpc(*http, net.rpc_url, net.auth_header, net.timeout_ms);
  Logger::Info("Reading strategy " + net.strategy_address + " via " + net.rpc_url);
  OnChainStrategyReport report = ReadStrategyReport(rpc, net);
  std::cout << OnChainReportToJson(report).dump(2) << std::endl;
  return 0;
}

int main(int argc, char** argv) {
  if (argc < 2) { PrintUsage(argv[0]); return 1; }
  const std::string command = argv[1];
  std::string env_path = ".env";
  std::string scenario_path;
  for (int i = 2; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--env" && i + 1 < argc) env_path = argv[++i];
    else if (scenario_path.empty()) scenario_path = arg;
    else { PrintUsage(argv[0]); return 1; }
  }

  int rc = 1;
  try {
    ConfigManager::Initialize(env_path);
    StrategyConfig cfg = LoadStrategyConfig();
    Logger::Initialize(cfg.log_file, cfg.log_level, cfg.log_stderr);
    StructuredLogger::Instance().Initialize(cfg.events_file);
    Logger::Info("=== " + cfg.name + " starting: " + command + " ===");

    if (command == "simulate" && !scenario_path.empty()) {
      rc = RunSimulate(scenario_path, cfg);
    } else if (command == "monitor" && scenario_path.empty()) {
      rc = RunMonitor();
    } else {
      PrintUsage(argv[0]);
      rc = 1;
    }
  } catch (const std::exception& e) {
    std::cout << "CRITICAL ERROR: " << e.what() << std::endl;
    Logger::Critical(e.what());
    rc = 1;
  }
  StructuredLogger::Instance().Shutdown();
  Logger::Shutdown();
  return rc;
}
