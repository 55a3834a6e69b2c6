#pragma once
#include <memory>
#include <string>
#include "sim/sim_chain.hpp"
#include "sim/sim_protocols.hpp"
#include "strategy/cooldown_strategy.hpp"

namespace SimAddresses {
  inline const Address OWNER      = "0x00000000000000000000000000000000000000a1";
  inline const Address AGGREGATOR = "0x00000000000000000000000000000000000000a2";
  inline const Address PAUSER     = "0x00000000000000000000000000000000000000a3";
  inline const Address COOLDOWN_ADMIN = "0x00000000000000000000000000000000000000a4";
  inline const Address USER       = "0x00000000000000000000000000000000000000a5";
  inline const Address STRATEGY   = "0x00000000000000000000000000000000000000b1";
  inline const Address UNDERLYING = "0x00000000000000000000000000000000000000c1";
  inline const Address WRAPPED    = "0x00000000000000000000000000000000000000c2";
  inline const Address STAKING    = "0x00000000000000000000000000000000000000c3";
  inline const Address SILO       = "0x00000000000000000000000000000000000000c4";
  inline const Address REGISTRY   = "0x00000000000000000000000000000000000000d1";
}

struct SimDeploymentOptions {
  std::string name = "cooldown-staking";
  std::string description = "Threshold-batched deposits into a cooldown staking vault";
  unsigned long long cooldown_duration = 0;
  Amount deposit_threshold = 0;
  EventSink* events = nullptr;
};

// One strategy wired to simulated protocols on a private SimChain.
class SimDeployment {
public:
  explicit SimDeployment(const SimDeploymentOptions& options = SimDeploymentOptions());

  SimChain& Chain() { return chain_; }
  CooldownStrategy& Strategy() { return *strategy_; }
  SimStakingVault& StakingVault() { return staking_; }
  SimClusterRegistry& Registry() { return registry_; }

  // Aggregator moves `amount` wrapped into the strategy (backed 1:1 by new underlying)
  void FundHeld(Amount amount);
  // Places `amount` underlying in the staking vault on behalf of the strategy
  void SeedStaked(Amount amount);
  // Places `amount` underlying directly in the strategy's cooldown, maturing after the vault's duration
  void SeedCooldown(Amount amount);
  // Adds `amount` underlying to the vault without minting shares
  void AccrueYield(Amount amount);

  Amount Held() const;
  Amount Shares() const;
  Amount WrappedBalance(const Address& holder) const;

  // Chain transaction around fn: ledgers revert if fn throws
  template <typename Fn>
  auto Run(Fn&& fn) -> decltype(fn()) { return chain_.Transact(std::forward<Fn>(fn)); }

private:
  SimChain chain_;
  SimStakingVault staking_;
  SimWrapAdapter wrap_;
  SimTokenLedger held_;
  SimNativeWallet native_;
  SimClusterRegistry registry_;
  std::unique_ptr<CooldownStrategy> strategy_;
};
