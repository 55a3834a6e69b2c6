#include "protocols/staking_vault_rpc.hpp"
#include "node_connection/rpc_client.hpp"
#include "encoding/abi.hpp"
#include "crypto/keccak.hpp"

std::string RpcStakingVaultView::Call(const std::string& data) const {
  return rpc_.EthCall(vault_, data, block_);
}

Address RpcStakingVaultView::Asset() const {
  static const std::string sel = Crypto::FunctionSelector("asset()");
  return Abi::DecodeAddress(Call(Abi::EncodeCall(sel, {})));
}

unsigned long long RpcStakingVaultView::CooldownDuration() const {
  static const std::string sel = Crypto::FunctionSelector("cooldownDuration()");
  return Abi::DecodeUint(Call(Abi::EncodeCall(sel, {})));
}

// cooldowns(address) returns (uint104 cooldownEnd, uint152 underlyingAmount)
OnChainCooldown RpcStakingVaultView::Cooldowns(const Address& holder) const {
  static const std::string sel = Crypto::FunctionSelector("cooldowns(address)");
  auto res = Call(Abi::EncodeCall(sel, {Abi::EncodeAddress(holder)}));
  OnChainCooldown info;
  info.cooldown_end = Abi::DecodeUint(res, 0);
  info.underlying_amount = Abi::DecodeUint256(res, 1);
  return info;
}

Uint256 RpcStakingVaultView::MaxWithdraw(const Address& holder) const {
  static const std::string sel = Crypto::FunctionSelector("maxWithdraw(address)");
  return Abi::DecodeUint256(Call(Abi::EncodeCall(sel, {Abi::EncodeAddress(holder)})));
}
