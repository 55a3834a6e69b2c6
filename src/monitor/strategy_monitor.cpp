#include "monitor/strategy_monitor.hpp"
#include "config/network.hpp"
#include "node_connection/rpc_client.hpp"
#include "protocols/erc20.hpp"
#include "protocols/staking_vault_rpc.hpp"
#include "utils/hex.hpp"
#include <string>

OnChainStrategyReport ReadStrategyReport(RpcClient& rpc, const NetworkConfig& cfg) {
  const std::string block = rpc.EthBlockNumber();
  RpcStakingVaultView vault(rpc, cfg.staking_vault, block);

  OnChainStrategyReport r;
  r.strategy = cfg.strategy_address;
  r.block_number = std::stoull(Strip0x(block), nullptr, 16);
  r.decimals = ERC20::Decimals(rpc, cfg.held_asset, block);
  r.cooldown_duration = vault.CooldownDuration();
  r.mode = RedemptionModeFor(r.cooldown_duration);

  OnChainCooldown cooldown = vault.Cooldowns(cfg.strategy_address);
  r.cooldown_end = cooldown.cooldown_end;
  r.pending_cooldown = cooldown.underlying_amount;
  r.immediate_withdrawable = vault.MaxWithdraw(cfg.strategy_address);
  r.pool = r.mode == RedemptionMode::Immediate ? r.immediate_withdrawable : r.pending_cooldown;
  r.held = ERC20::BalanceOf(rpc, cfg.held_asset, cfg.strategy_address, block);
  r.current_balance = AmountMath::CheckedAdd(r.held, r.pool);
  r.native_balance = intx::from_string<Uint256>(rpc.EthGetBalance(cfg.strategy_address, block));
  return r;
}

nlohmann::json OnChainReportToJson(const OnChainStrategyReport& r) {
  using AmountMath::ToDecimal;
  return {
    {"strategy", r.strategy},
    {"block_number", r.block_number},
    {"decimals", r.decimals},
    {"mode", RedemptionModeName(r.mode)},
    {"cooldown_duration", r.cooldown_duration},
    {"cooldown_end", r.cooldown_end},
    {"held", ToDecimal(r.held)},
    {"pending_cooldown", ToDecimal(r.pending_cooldown)},
    {"immediate_withdrawable", ToDecimal(r.immediate_withdrawable)},
    {"pool", ToDecimal(r.pool)},
    {"current_balance", ToDecimal(r.current_balance)},
    {"native_balance", ToDecimal(r.native_balance)},
  };
}
