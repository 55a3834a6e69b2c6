#pragma once
#include <string>
#include <vector>
#include "common/types.hpp"

enum class PauseDirection { Deposit, Withdraw };

const char* PauseDirectionName(PauseDirection d);

enum class StrategyEventKind {
  DepositThresholdUpdated,
  DepositQueued,
  DepositCommitted,
  Withdrawn,
  ClusterUpdated,
  PauseUpdated,
  EmergencyWithdrawn,
  EthRescued,
  CooldownRequested,
  OwnershipTransferred
};

const char* StrategyEventName(StrategyEventKind kind);

// One signal. Fields not used by a kind stay at their defaults.
struct StrategyEvent {
  StrategyEventKind kind;
  Amount amount = 0;            // queued/committed/withdrawn/realized/rescued/cooldown quantity, new threshold
  Amount previous_amount = 0;   // old threshold
  Address account;              // recipient, new registry, new owner
  Address previous_account;     // old registry, old owner
  PauseDirection direction = PauseDirection::Deposit;
  bool before = false;
  bool after = false;
  std::string detail;           // cooldown kind: "assets" | "shares"
};

// Receives events after the state change they describe is final. Delivery cannot
// be rolled back, so sinks must not throw.
class EventSink {
public:
  virtual ~EventSink() = default;
  virtual void Emit(const StrategyEvent& event) noexcept = 0;
};

// Keeps every delivered event in order.
class RecordingEventSink : public EventSink {
public:
  void Emit(const StrategyEvent& event) noexcept override { events_.push_back(event); }
  const std::vector<StrategyEvent>& Events() const { return events_; }
  void Clear() { events_.clear(); }
private:
  std::vector<StrategyEvent> events_;
};
