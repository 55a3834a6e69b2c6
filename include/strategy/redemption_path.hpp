#pragma once
#include "common/types.hpp"
#include "protocols/staking_vault.hpp"

enum class RedemptionMode { Immediate, Cooldown };

const char* RedemptionModeName(RedemptionMode mode);
// Immediate iff the vault's cooldown duration is zero
RedemptionMode RedemptionModeFor(unsigned long long cooldown_duration);

// How value leaves the staking position. One instance per mode; selected from the
// vault's live cooldown duration by SelectRedemptionPath.
class RedemptionPath {
public:
  virtual ~RedemptionPath() = default;
  virtual RedemptionMode Mode() const = 0;
  // Underlying amount recoverable from the pool under this mode right now
  virtual Amount Available(const StakingVaultView& vault, const Address& holder) const = 0;
  // Pulls at least `draw` underlying to `holder` and returns the amount actually realized.
  // Cooldown mode realizes the whole matured cooldown regardless of `draw`.
  virtual Amount Realize(StakingVault& vault, const Address& holder, Amount draw) const = 0;
  // Exits the whole position; returns the amount realized
  virtual Amount RealizeAll(StakingVault& vault, const Address& holder) const = 0;
};

class ImmediateRedemption : public RedemptionPath {
public:
  RedemptionMode Mode() const override { return RedemptionMode::Immediate; }
  Amount Available(const StakingVaultView& vault, const Address& holder) const override;
  Amount Realize(StakingVault& vault, const Address& holder, Amount draw) const override;
  Amount RealizeAll(StakingVault& vault, const Address& holder) const override;
};

class CooldownRedemption : public RedemptionPath {
public:
  RedemptionMode Mode() const override { return RedemptionMode::Cooldown; }
  Amount Available(const StakingVaultView& vault, const Address& holder) const override;
  Amount Realize(StakingVault& vault, const Address& holder, Amount draw) const override;
  Amount RealizeAll(StakingVault& vault, const Address& holder) const override;
};

const RedemptionPath& SelectRedemptionPath(const StakingVaultView& vault);
