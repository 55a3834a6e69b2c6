#pragma once
#include <string>
#include <vector>
#include "common/types.hpp"
#include "common/errors.hpp"
#include "strategy/pause_gate.hpp"
#include "strategy/redemption_path.hpp"
#include "strategy/strategy_events.hpp"

class StakingVault;
class WrapAdapter;
class TokenLedger;
class NativeWallet;
class ClusterRegistry;

struct StrategyParams {
  std::string name;
  std::string description;
  Address self;                 // the strategy's own account
  Address owner;
  Amount deposit_threshold = 0;
};

// Collaborators are not owned and must outlive the strategy. `events` may be null.
struct StrategyDependencies {
  StakingVault* staking_vault = nullptr;
  WrapAdapter* wrap_adapter = nullptr;
  TokenLedger* held_asset = nullptr;
  NativeWallet* native_wallet = nullptr;
  ClusterRegistry* cluster = nullptr;
  EventSink* events = nullptr;
};

struct StrategyStatus {
  Address owner;
  Address cluster;
  Amount deposit_threshold = 0;
  bool deposit_paused = false;
  bool withdraw_paused = false;
  RedemptionMode mode = RedemptionMode::Immediate;
  Amount held = 0;
  Amount pool = 0;
  Amount current_balance = 0;
};

// Custody adapter between a vault aggregator and a cooldown-redeemed staking asset.
//
// Deposits accumulate as held (wrapped) balance until it reaches the deposit threshold,
// then the whole held balance is unwrapped and staked. Withdrawals draw from held balance
// first and from the staking position for the rest.
//
// Every mutating call is all-or-nothing for the strategy's own storage and its signals:
// on any exception the previous state is restored and no event is delivered. Events
// go to the EventSink only once the call has succeeded (sinks are noexcept). Nested
// calls into any mutating entry point during another one fail with ReentrantCall.
class CooldownStrategy {
public:
  CooldownStrategy(const StrategyParams& params, const StrategyDependencies& deps);

  CooldownStrategy(const CooldownStrategy&) = delete;
  CooldownStrategy& operator=(const CooldownStrategy&) = delete;

  const std::string& Name() const { return name_; }
  const std::string& Description() const { return description_; }
  const Address& Self() const { return self_; }
  const Address& Owner() const { return state_.owner; }
  Address ClusterAddress() const;
  Amount DepositThreshold() const { return state_.deposit_threshold; }
  bool IsPaused(PauseDirection d) const { return state_.gate.IsPaused(d); }

  // Live reads; see CooldownTracker
  Amount QueuedBalance() const;
  Amount PendingCooldownAmount() const;
  Amount ImmediateWithdrawable() const;
  Amount Harvestable() const;
  // Held balance plus the pool reading of the current mode
  Amount CurrentBalance() const;
  RedemptionMode CurrentMode() const;
  StrategyStatus Status() const;

  // Aggregator hooks. `amount` on deposit is informational; the held balance is re-read.
  void OnDeposit(Amount amount);
  void OnWithdraw(const Address& to, Amount amount);

  // Owner or PAUSER_ROLE
  void SetPause(const Address& caller, PauseDirection direction, bool value);
  // Owner or COOLDOWN_ADMIN_ROLE; forwarded to the staking vault as is
  void CooldownAssets(const Address& caller, Amount assets);
  void CooldownShares(const Address& caller, Amount shares);

  // Owner only
  void SetDepositThreshold(const Address& caller, Amount threshold);
  void SetCluster(const Address& caller, ClusterRegistry* registry);
  // Closes both gates and moves the whole staking position back to held balance
  void EmergencyWithdraw(const Address& caller);
  // amount == 0 sends the whole native balance
  void RescueEth(const Address& caller, const Address& to, Amount amount);
  void TransferOwnership(const Address& caller, const Address& new_owner);

private:
  struct State {
    Address owner;
    Amount deposit_threshold = 0;
    PauseGate gate;
    ClusterRegistry* cluster = nullptr;
  };
  class Operation;

  std::string name_;
  std::string description_;
  Address self_;
  StakingVault* vault_;
  WrapAdapter* wrap_;
  TokenLedger* held_;
  NativeWallet* native_;
  EventSink* events_;
  State state_;
  bool in_call_ = false;

  void Reject(ErrorCode code, const std::string& detail) const;
  void RequireOwner(const Address& caller) const;
  void RequireOwnerOrRole(const Address& caller, const std::string& role, ErrorCode code) const;
};
