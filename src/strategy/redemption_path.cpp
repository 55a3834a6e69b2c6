#include "strategy/redemption_path.hpp"

const char* RedemptionModeName(RedemptionMode mode) {
  return mode == RedemptionMode::Immediate ? "immediate" : "cooldown";
}

RedemptionMode RedemptionModeFor(unsigned long long cooldown_duration) {
  return cooldown_duration == 0 ? RedemptionMode::Immediate : RedemptionMode::Cooldown;
}

Amount ImmediateRedemption::Available(const StakingVaultView& vault, const Address& holder) const {
  return vault.MaxWithdraw(holder);
}

Amount ImmediateRedemption::Realize(StakingVault& vault, const Address& holder, Amount draw) const {
  if (draw == 0) return 0;
  vault.Withdraw(draw, holder, holder);
  return draw;
}

Amount ImmediateRedemption::RealizeAll(StakingVault& vault, const Address& holder) const {
  return Realize(vault, holder, vault.MaxWithdraw(holder));
}

Amount CooldownRedemption::Available(const StakingVaultView& vault, const Address& holder) const {
  return vault.Cooldowns(holder).underlying_amount;
}

Amount CooldownRedemption::Realize(StakingVault& vault, const Address& holder, Amount) const {
  return RealizeAll(vault, holder);
}

Amount CooldownRedemption::RealizeAll(StakingVault& vault, const Address& holder) const {
  Amount cooling = vault.Cooldowns(holder).underlying_amount;
  vault.Unstake(holder);
  return cooling;
}

const RedemptionPath& SelectRedemptionPath(const StakingVaultView& vault) {
  static const ImmediateRedemption immediate;
  static const CooldownRedemption cooldown;
  if (RedemptionModeFor(vault.CooldownDuration()) == RedemptionMode::Immediate) return immediate;
  return cooldown;
}
