#pragma once
#include <map>
#include <set>
#include <string>
#include <utility>
#include "common/types.hpp"
#include "protocols/staking_vault.hpp"

struct SimVaultState {
  Address asset;
  Address silo;
  unsigned long long cooldown_duration = 0;
  std::map<Address, CooldownInfo> cooldowns;
};

// Everything that a reverted transaction must restore.
struct SimChainState {
  std::map<Address, std::map<Address, Amount>> balances;  // token -> holder -> amount
  std::map<Address, Amount> supply;
  std::map<Address, Amount> native;
  std::set<Address> refuse_native;
  std::map<Address, SimVaultState> vaults;
  std::set<std::pair<Address, std::string>> roles;         // (registry:account, role)
  unsigned long long now = 0;
};

// In-memory ledger for running the strategy against simulated protocols.
// Addresses are compared case-insensitively.
class SimChain {
public:
  explicit SimChain(unsigned long long start_time = 1700000000ULL);

  Amount BalanceOf(const Address& token, const Address& holder) const;
  Amount TotalSupply(const Address& token) const;
  void Mint(const Address& token, const Address& to, Amount amount);
  // Throws ProtocolError on insufficient balance
  void Burn(const Address& token, const Address& from, Amount amount);
  void Move(const Address& token, const Address& from, const Address& to, Amount amount);

  Amount NativeBalance(const Address& holder) const;
  void SetNativeBalance(const Address& holder, Amount amount);
  void SetRefusesNative(const Address& holder, bool refuses);
  // false if `to` refuses or `from` lacks balance; nothing moves in that case
  bool SendNative(const Address& from, const Address& to, Amount amount);

  unsigned long long Now() const { return state_.now; }
  void AdvanceTime(unsigned long long seconds);

  void CreateVault(const Address& vault, const Address& asset, const Address& silo, unsigned long long cooldown_duration);
  SimVaultState& Vault(const Address& vault);
  const SimVaultState& Vault(const Address& vault) const;
  void SetCooldownDuration(const Address& vault, unsigned long long seconds);

  void GrantRole(const Address& registry, const Address& account, const std::string& role);
  void RevokeRole(const Address& registry, const Address& account, const std::string& role);
  bool HasRole(const Address& registry, const Address& account, const std::string& role) const;

  // Runs fn; on any exception restores every ledger to its state before the call and rethrows.
  template <typename Fn>
  auto Transact(Fn&& fn) -> decltype(fn()) {
    SimChainState snapshot = state_;
    try {
      return fn();
    } catch (...) {
      state_ = std::move(snapshot);
      throw;
    }
  }

private:
  SimChainState state_;
};
