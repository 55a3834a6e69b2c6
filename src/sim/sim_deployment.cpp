#include "sim/sim_deployment.hpp"
#include "utils/hex.hpp"

SimDeployment::SimDeployment(const SimDeploymentOptions& options)
  : staking_(chain_, SimAddresses::STAKING, SimAddresses::STRATEGY),
    wrap_(chain_, SimAddresses::WRAPPED, SimAddresses::UNDERLYING, SimAddresses::STRATEGY),
    held_(chain_, SimAddresses::WRAPPED, SimAddresses::STRATEGY),
    native_(chain_, SimAddresses::STRATEGY),
    registry_(chain_, SimAddresses::REGISTRY) {
  chain_.CreateVault(SimAddresses::STAKING, SimAddresses::UNDERLYING, SimAddresses::SILO, options.cooldown_duration);

  StrategyParams params;
  params.name = options.name;
  params.description = options.description;
  params.self = SimAddresses::STRATEGY;
  params.owner = SimAddresses::OWNER;
  params.deposit_threshold = options.deposit_threshold;

  StrategyDependencies deps;
  deps.staking_vault = &staking_;
  deps.wrap_adapter = &wrap_;
  deps.held_asset = &held_;
  deps.native_wallet = &native_;
  deps.cluster = &registry_;
  deps.events = options.events;
  strategy_.reset(new CooldownStrategy(params, deps));
}

void SimDeployment::FundHeld(Amount amount) {
  chain_.Mint(SimAddresses::UNDERLYING, SimAddresses::WRAPPED, amount);
  chain_.Mint(SimAddresses::WRAPPED, SimAddresses::STRATEGY, amount);
}

void SimDeployment::SeedStaked(Amount amount) {
  Amount shares = staking_.ConvertToShares(amount);
  chain_.Mint(SimAddresses::UNDERLYING, SimAddresses::STAKING, amount);
  chain_.Mint(SimAddresses::STAKING, SimAddresses::STRATEGY, shares);
}

void SimDeployment::SeedCooldown(Amount amount) {
  if (amount == 0) return;
  SimVaultState& v = chain_.Vault(SimAddresses::STAKING);
  chain_.Mint(SimAddresses::UNDERLYING, v.silo, amount);
  CooldownInfo& c = v.cooldowns[ToLowerHex(SimAddresses::STRATEGY)];
  c.underlying_amount = AmountMath::CheckedAdd(c.underlying_amount, amount);
  c.cooldown_end = chain_.Now() + v.cooldown_duration;
}

void SimDeployment::AccrueYield(Amount amount) {
  chain_.Mint(SimAddresses::UNDERLYING, SimAddresses::STAKING, amount);
}

Amount SimDeployment::Held() const { return chain_.BalanceOf(SimAddresses::WRAPPED, SimAddresses::STRATEGY); }

Amount SimDeployment::Shares() const { return chain_.BalanceOf(SimAddresses::STAKING, SimAddresses::STRATEGY); }

Amount SimDeployment::WrappedBalance(const Address& holder) const { return chain_.BalanceOf(SimAddresses::WRAPPED, holder); }
