#pragma once
#include "protocols/staking_vault.hpp"
#include "protocols/wrap_adapter.hpp"
#include "protocols/erc20.hpp"
#include "protocols/native_wallet.hpp"
#include "auth/cluster_registry.hpp"

class SimChain;

// Cooldown staking vault with ERC-4626 share accounting. Shares are the token at the
// vault address; cooling assets sit at the silo address. Mutating calls act as `caller`.
//
// withdraw() is only allowed while the cooldown duration is zero, cooldown requests only
// while it is non-zero. A new cooldown request adds to the cooling amount and restarts the
// maturity clock. unstake() pays out the whole cooling amount once matured (or when the
// duration has been set to zero); with nothing cooling it pays out zero.
class SimStakingVault : public StakingVault {
public:
  SimStakingVault(SimChain& chain, const Address& vault, const Address& caller)
    : chain_(chain), vault_(vault), caller_(caller) {}

  Address VaultAddress() const override { return vault_; }
  Address Asset() const override;
  unsigned long long CooldownDuration() const override;
  CooldownInfo Cooldowns(const Address& holder) const override;
  Amount MaxWithdraw(const Address& holder) const override;

  void Deposit(Amount assets, const Address& receiver) override;
  void Withdraw(Amount assets, const Address& receiver, const Address& owner) override;
  void CooldownAssets(Amount assets) override;
  void CooldownShares(Amount shares) override;
  void Unstake(const Address& receiver) override;

  Amount TotalAssets() const;
  Amount ConvertToShares(Amount assets) const;
  Amount ConvertToAssets(Amount shares) const;
  Amount PreviewWithdraw(Amount assets) const;
  Amount SharesOf(const Address& holder) const;
private:
  void StartCooldown(Amount shares, Amount assets);
  SimChain& chain_;
  Address vault_;
  Address caller_;
};

// 1:1 wrapper. Underlying backing the wrapped supply is held at the wrapped token address.
class SimWrapAdapter : public WrapAdapter {
public:
  SimWrapAdapter(SimChain& chain, const Address& wrapped, const Address& underlying, const Address& caller)
    : chain_(chain), wrapped_(wrapped), underlying_(underlying), caller_(caller) {}
  void Wrap(const Address& from, const Address& to, Amount amount) override;
  void Unwrap(const Address& to, Amount amount) override;
  Address UnderlyingAsset() const override { return underlying_; }
private:
  SimChain& chain_;
  Address wrapped_;
  Address underlying_;
  Address caller_;
};

class SimTokenLedger : public TokenLedger {
public:
  SimTokenLedger(SimChain& chain, const Address& token, const Address& caller)
    : chain_(chain), token_(token), caller_(caller) {}
  Address TokenAddress() const override { return token_; }
  Amount BalanceOf(const Address& holder) const override;
  void Transfer(const Address& to, Amount amount) override;
private:
  SimChain& chain_;
  Address token_;
  Address caller_;
};

class SimNativeWallet : public NativeWallet {
public:
  SimNativeWallet(SimChain& chain, const Address& holder) : chain_(chain), holder_(holder) {}
  Amount Balance() const override;
  bool Send(const Address& to, Amount amount) override;
private:
  SimChain& chain_;
  Address holder_;
};

class SimClusterRegistry : public ClusterRegistry {
public:
  SimClusterRegistry(SimChain& chain, const Address& registry) : chain_(chain), registry_(registry) {}
  Address RegistryAddress() const override { return registry_; }
  bool HasRole(const Address& account, const std::string& role_id) const override;
private:
  SimChain& chain_;
  Address registry_;
};
