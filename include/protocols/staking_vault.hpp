#pragma once
#include "common/types.hpp"

// cooldowns(holder): amount queued for unstake and when it matures (unix seconds)
struct CooldownInfo {
  unsigned long long cooldown_end = 0;
  Amount underlying_amount = 0;
};

// Read side of the yield-bearing staking asset. Implemented on-chain (RPC) and in the simulator.
class StakingVaultView {
public:
  virtual ~StakingVaultView() = default;
  virtual Address VaultAddress() const = 0;
  // Asset accepted by deposit() and paid out by withdraw()/unstake()
  virtual Address Asset() const = 0;
  // Zero selects immediate redemption, anything else cooldown redemption
  virtual unsigned long long CooldownDuration() const = 0;
  virtual CooldownInfo Cooldowns(const Address& holder) const = 0;
  virtual Amount MaxWithdraw(const Address& holder) const = 0;
};

// Mutating side. Calls act on behalf of the bound caller (the strategy). Failures throw ProtocolError.
class StakingVault : public StakingVaultView {
public:
  virtual void Deposit(Amount assets, const Address& receiver) = 0;
  virtual void Withdraw(Amount assets, const Address& receiver, const Address& owner) = 0;
  virtual void CooldownAssets(Amount assets) = 0;
  virtual void CooldownShares(Amount shares) = 0;
  virtual void Unstake(const Address& receiver) = 0;
};
