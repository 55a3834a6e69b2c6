#include "sim/sim_protocols.hpp"
#include "sim/sim_chain.hpp"
#include "common/errors.hpp"
#include "utils/hex.hpp"

// ---------------------------------------------------------------------------
// SimStakingVault

Address SimStakingVault::Asset() const { return chain_.Vault(vault_).asset; }

unsigned long long SimStakingVault::CooldownDuration() const { return chain_.Vault(vault_).cooldown_duration; }

CooldownInfo SimStakingVault::Cooldowns(const Address& holder) const {
  const auto& cooldowns = chain_.Vault(vault_).cooldowns;
  auto it = cooldowns.find(ToLowerHex(holder));
  return it == cooldowns.end() ? CooldownInfo{} : it->second;
}

Amount SimStakingVault::TotalAssets() const { return chain_.BalanceOf(Asset(), vault_); }

Amount SimStakingVault::SharesOf(const Address& holder) const { return chain_.BalanceOf(vault_, holder); }

Amount SimStakingVault::ConvertToShares(Amount assets) const {
  Amount supply = chain_.TotalSupply(vault_);
  Amount total = TotalAssets();
  if (supply == 0 || total == 0) return assets;
  return AmountMath::MulDivDown(assets, supply, total);
}

Amount SimStakingVault::ConvertToAssets(Amount shares) const {
  Amount supply = chain_.TotalSupply(vault_);
  if (supply == 0) return shares;
  return AmountMath::MulDivDown(shares, TotalAssets(), supply);
}

Amount SimStakingVault::PreviewWithdraw(Amount assets) const {
  Amount supply = chain_.TotalSupply(vault_);
  Amount total = TotalAssets();
  if (supply == 0 || total == 0) return assets;
  return AmountMath::MulDivUp(assets, supply, total);
}

Amount SimStakingVault::MaxWithdraw(const Address& holder) const {
  return ConvertToAssets(SharesOf(holder));
}

void SimStakingVault::Deposit(Amount assets, const Address& receiver) {
  if (assets == 0) throw ProtocolError("InvalidAmount: zero deposit");
  Amount shares = ConvertToShares(assets);
  if (shares == 0) throw ProtocolError("InvalidAmount: deposit rounds to zero shares");
  chain_.Move(Asset(), caller_, vault_, assets);
  chain_.Mint(vault_, receiver, shares);
}

void SimStakingVault::Withdraw(Amount assets, const Address& receiver, const Address& owner) {
  if (CooldownDuration() != 0) throw ProtocolError("OperationNotAllowed: withdraw while cooldown is on");
  if (!SameAddress(owner, caller_)) throw ProtocolError("withdraw owner is not the caller");
  if (assets > MaxWithdraw(owner)) throw ProtocolError("ExceededMaxWithdraw");
  Amount shares = PreviewWithdraw(assets);
  chain_.Burn(vault_, owner, shares);
  chain_.Move(Asset(), vault_, receiver, assets);
}

void SimStakingVault::StartCooldown(Amount shares, Amount assets) {
  chain_.Burn(vault_, caller_, shares);
  SimVaultState& v = chain_.Vault(vault_);
  chain_.Move(v.asset, vault_, v.silo, assets);
  CooldownInfo& c = v.cooldowns[ToLowerHex(caller_)];
  c.underlying_amount = AmountMath::CheckedAdd(c.underlying_amount, assets);
  c.cooldown_end = chain_.Now() + v.cooldown_duration;
}

void SimStakingVault::CooldownAssets(Amount assets) {
  if (CooldownDuration() == 0) throw ProtocolError("OperationNotAllowed: cooldown is off");
  if (assets > MaxWithdraw(caller_)) throw ProtocolError("ExcessiveWithdrawAmount");
  StartCooldown(PreviewWithdraw(assets), assets);
}

void SimStakingVault::CooldownShares(Amount shares) {
  if (CooldownDuration() == 0) throw ProtocolError("OperationNotAllowed: cooldown is off");
  if (shares > SharesOf(caller_)) throw ProtocolError("ExcessiveRedeemAmount");
  StartCooldown(shares, ConvertToAssets(shares));
}

void SimStakingVault::Unstake(const Address& receiver) {
  SimVaultState& v = chain_.Vault(vault_);
  CooldownInfo& c = v.cooldowns[ToLowerHex(caller_)];
  if (chain_.Now() < c.cooldown_end && v.cooldown_duration != 0) {
    throw ProtocolError("InvalidCooldown: matures at " + std::to_string(c.cooldown_end));
  }
  Amount amount = c.underlying_amount;
  c = CooldownInfo{};
  chain_.Move(v.asset, v.silo, receiver, amount);
}

// ---------------------------------------------------------------------------
// SimWrapAdapter

void SimWrapAdapter::Wrap(const Address& from, const Address& to, Amount amount) {
  if (!SameAddress(from, caller_)) throw ProtocolError("wrap source is not the caller");
  chain_.Move(underlying_, from, wrapped_, amount);
  chain_.Mint(wrapped_, to, amount);
}

void SimWrapAdapter::Unwrap(const Address& to, Amount amount) {
  chain_.Burn(wrapped_, caller_, amount);
  chain_.Move(underlying_, wrapped_, to, amount);
}

// ---------------------------------------------------------------------------
// Ledgers and registry

Amount SimTokenLedger::BalanceOf(const Address& holder) const { return chain_.BalanceOf(token_, holder); }

void SimTokenLedger::Transfer(const Address& to, Amount amount) { chain_.Move(token_, caller_, to, amount); }

Amount SimNativeWallet::Balance() const { return chain_.NativeBalance(holder_); }

bool SimNativeWallet::Send(const Address& to, Amount amount) { return chain_.SendNative(holder_, to, amount); }

bool SimClusterRegistry::HasRole(const Address& account, const std::string& role_id) const {
  return chain_.HasRole(registry_, account, role_id);
}
