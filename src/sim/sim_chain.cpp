#include "sim/sim_chain.hpp"
#include "common/errors.hpp"
#include "utils/hex.hpp"

static Address Key(const Address& a) { return ToLowerHex(a); }

SimChain::SimChain(unsigned long long start_time) { state_.now = start_time; }

Amount SimChain::BalanceOf(const Address& token, const Address& holder) const {
  auto t = state_.balances.find(Key(token));
  if (t == state_.balances.end()) return 0;
  auto h = t->second.find(Key(holder));
  return h == t->second.end() ? 0 : h->second;
}

Amount SimChain::TotalSupply(const Address& token) const {
  auto it = state_.supply.find(Key(token));
  return it == state_.supply.end() ? 0 : it->second;
}

void SimChain::Mint(const Address& token, const Address& to, Amount amount) {
  Amount& supply = state_.supply[Key(token)];
  supply = AmountMath::CheckedAdd(supply, amount);
  Amount& bal = state_.balances[Key(token)][Key(to)];
  bal += amount;
}

void SimChain::Burn(const Address& token, const Address& from, Amount amount) {
  Amount& bal = state_.balances[Key(token)][Key(from)];
  if (bal < amount) {
    throw ProtocolError("burn exceeds balance: token " + token + " holder " + from + " has " +
                        std::to_string(bal) + ", needs " + std::to_string(amount));
  }
  bal -= amount;
  state_.supply[Key(token)] -= amount;
}

void SimChain::Move(const Address& token, const Address& from, const Address& to, Amount amount) {
  Amount& src = state_.balances[Key(token)][Key(from)];
  if (src < amount) {
    throw ProtocolError("transfer exceeds balance: token " + token + " holder " + from + " has " +
                        std::to_string(src) + ", needs " + std::to_string(amount));
  }
  src -= amount;
  state_.balances[Key(token)][Key(to)] += amount;
}

Amount SimChain::NativeBalance(const Address& holder) const {
  auto it = state_.native.find(Key(holder));
  return it == state_.native.end() ? 0 : it->second;
}

void SimChain::SetNativeBalance(const Address& holder, Amount amount) {
  state_.native[Key(holder)] = amount;
}

void SimChain::SetRefusesNative(const Address& holder, bool refuses) {
  if (refuses) state_.refuse_native.insert(Key(holder));
  else state_.refuse_native.erase(Key(holder));
}

bool SimChain::SendNative(const Address& from, const Address& to, Amount amount) {
  if (state_.refuse_native.count(Key(to))) return false;
  Amount& src = state_.native[Key(from)];
  if (src < amount) return false;
  src -= amount;
  Amount& dst = state_.native[Key(to)];
  dst = AmountMath::CheckedAdd(dst, amount);
  return true;
}

void SimChain::AdvanceTime(unsigned long long seconds) {
  state_.now += seconds;
}

void SimChain::CreateVault(const Address& vault, const Address& asset, const Address& silo, unsigned long long cooldown_duration) {
  SimVaultState v;
  v.asset = asset;
  v.silo = silo;
  v.cooldown_duration = cooldown_duration;
  state_.vaults[Key(vault)] = v;
}

SimVaultState& SimChain::Vault(const Address& vault) {
  auto it = state_.vaults.find(Key(vault));
  if (it == state_.vaults.end()) throw ProtocolError("no staking vault at " + vault);
  return it->second;
}

const SimVaultState& SimChain::Vault(const Address& vault) const {
  auto it = state_.vaults.find(Key(vault));
  if (it == state_.vaults.end()) throw ProtocolError("no staking vault at " + vault);
  return it->second;
}

void SimChain::SetCooldownDuration(const Address& vault, unsigned long long seconds) {
  Vault(vault).cooldown_duration = seconds;
}

void SimChain::GrantRole(const Address& registry, const Address& account, const std::string& role) {
  state_.roles.insert({Key(registry) + ":" + Key(account), ToLowerHex(role)});
}

void SimChain::RevokeRole(const Address& registry, const Address& account, const std::string& role) {
  state_.roles.erase({Key(registry) + ":" + Key(account), ToLowerHex(role)});
}

bool SimChain::HasRole(const Address& registry, const Address& account, const std::string& role) const {
  return state_.roles.count({Key(registry) + ":" + Key(account), ToLowerHex(role)}) > 0;
}
