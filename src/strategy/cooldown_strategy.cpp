#include "strategy/cooldown_strategy.hpp"
#include "strategy/cooldown_tracker.hpp"
#include "protocols/staking_vault.hpp"
#include "protocols/wrap_adapter.hpp"
#include "protocols/erc20.hpp"
#include "protocols/native_wallet.hpp"
#include "auth/cluster_registry.hpp"
#include "common/logger.hpp"
#include "utils/hex.hpp"
#include <utility>

// Re-entrancy guard plus undo scope for one mutating call. Events are buffered and
// only delivered by Commit(), after the new state is final. EventSink::Emit is
// noexcept, so delivery cannot leave a committed state with a partial event list.
class CooldownStrategy::Operation {
public:
  Operation(CooldownStrategy& strategy, const char* name) : strategy_(strategy), saved_(strategy.state_) {
    if (strategy_.in_call_) strategy_.Reject(ErrorCode::ReentrantCall, name);
    strategy_.in_call_ = true;
  }
  ~Operation() {
    if (!committed_) strategy_.state_ = saved_;
    strategy_.in_call_ = false;
  }
  Operation(const Operation&) = delete;
  Operation& operator=(const Operation&) = delete;

  void Emit(StrategyEvent event) { pending_.push_back(std::move(event)); }

  void Commit() {
    committed_ = true;
    if (!strategy_.events_) return;
    for (const auto& e : pending_) strategy_.events_->Emit(e);
  }
private:
  CooldownStrategy& strategy_;
  State saved_;
  std::vector<StrategyEvent> pending_;
  bool committed_ = false;
};

CooldownStrategy::CooldownStrategy(const StrategyParams& params, const StrategyDependencies& deps)
  : name_(params.name), description_(params.description), self_(params.self),
    vault_(deps.staking_vault), wrap_(deps.wrap_adapter), held_(deps.held_asset),
    native_(deps.native_wallet), events_(deps.events) {
  if (!vault_) Reject(ErrorCode::InvalidConfiguration, "staking vault is null");
  if (!wrap_) Reject(ErrorCode::InvalidConfiguration, "wrap adapter is null");
  if (!held_) Reject(ErrorCode::InvalidConfiguration, "held asset ledger is null");
  if (!native_) Reject(ErrorCode::InvalidConfiguration, "native wallet is null");
  if (!deps.cluster) Reject(ErrorCode::InvalidConfiguration, "cluster registry is null");
  if (self_.empty()) Reject(ErrorCode::InvalidConfiguration, "strategy address is empty");
  if (params.owner.empty()) Reject(ErrorCode::InvalidConfiguration, "owner is empty");
  if (!SameAddress(wrap_->UnderlyingAsset(), vault_->Asset())) {
    Reject(ErrorCode::InvalidConfiguration,
           "asset mismatch: wrap adapter underlying " + wrap_->UnderlyingAsset() + " vs staking asset " + vault_->Asset());
  }
  state_.owner = params.owner;
  state_.deposit_threshold = params.deposit_threshold;
  state_.cluster = deps.cluster;
  Logger::Log(LogLevel::INFO, name_, "strategy ready: self=" + self_ + " owner=" + state_.owner +
              " threshold=" + std::to_string(state_.deposit_threshold), __FILE__, __LINE__);
}

void CooldownStrategy::Reject(ErrorCode code, const std::string& detail) const {
  Logger::Log(LogLevel::WARNING, name_, std::string("rejected ") + ErrorCodeName(code) + ": " + detail, __FILE__, __LINE__);
  throw StrategyError(code, detail);
}

void CooldownStrategy::RequireOwner(const Address& caller) const {
  if (!SameAddress(caller, state_.owner)) Reject(ErrorCode::NotOwner, caller);
}

void CooldownStrategy::RequireOwnerOrRole(const Address& caller, const std::string& role, ErrorCode code) const {
  if (SameAddress(caller, state_.owner)) return;
  if (state_.cluster->HasRole(caller, role)) return;
  Reject(code, caller);
}

Address CooldownStrategy::ClusterAddress() const {
  return state_.cluster->RegistryAddress();
}

// ---------------------------------------------------------------------------
// Reads

Amount CooldownStrategy::QueuedBalance() const {
  return held_->BalanceOf(self_);
}

Amount CooldownStrategy::PendingCooldownAmount() const {
  return CooldownTracker(*vault_, self_).PendingCooldownAmount();
}

Amount CooldownStrategy::ImmediateWithdrawable() const {
  return CooldownTracker(*vault_, self_).ImmediateWithdrawable();
}

Amount CooldownStrategy::Harvestable() const {
  return CooldownTracker(*vault_, self_).Harvestable();
}

Amount CooldownStrategy::CurrentBalance() const {
  return AmountMath::CheckedAdd(QueuedBalance(), CooldownTracker(*vault_, self_).PoolBalance());
}

RedemptionMode CooldownStrategy::CurrentMode() const {
  return CooldownTracker(*vault_, self_).CurrentMode();
}

StrategyStatus CooldownStrategy::Status() const {
  CooldownTracker tracker(*vault_, self_);
  StrategyStatus s;
  s.owner = state_.owner;
  s.cluster = ClusterAddress();
  s.deposit_threshold = state_.deposit_threshold;
  s.deposit_paused = state_.gate.IsPaused(PauseDirection::Deposit);
  s.withdraw_paused = state_.gate.IsPaused(PauseDirection::Withdraw);
  s.mode = tracker.CurrentMode();
  s.held = QueuedBalance();
  s.pool = tracker.PoolBalance();
  s.current_balance = AmountMath::CheckedAdd(s.held, s.pool);
  return s;
}

// ---------------------------------------------------------------------------
// Threshold batcher

void CooldownStrategy::OnDeposit(Amount amount) {
  Operation op(*this, "OnDeposit");
  if (state_.gate.IsPaused(PauseDirection::Deposit)) Reject(ErrorCode::DepositBlocked, "deposit gate closed");

  const Amount queued = held_->BalanceOf(self_);
  if (queued < state_.deposit_threshold) {
    StrategyEvent e{StrategyEventKind::DepositQueued};
    e.amount = amount;
    op.Emit(e);
    op.Commit();
    Logger::Log(LogLevel::INFO, name_, "deposit queued: amount=" + std::to_string(amount) +
                " held=" + std::to_string(queued) + " threshold=" + std::to_string(state_.deposit_threshold), __FILE__, __LINE__);
    return;
  }

  // A zero threshold with nothing held commits zero without touching the protocol
  if (queued > 0) {
    wrap_->Unwrap(self_, queued);
    vault_->Deposit(queued, self_);
  }
  StrategyEvent e{StrategyEventKind::DepositCommitted};
  e.amount = queued;
  op.Emit(e);
  op.Commit();
  Logger::Log(LogLevel::INFO, name_, "deposit committed: amount=" + std::to_string(queued), __FILE__, __LINE__);
}

// ---------------------------------------------------------------------------
// Redemption planner

void CooldownStrategy::OnWithdraw(const Address& to, Amount amount) {
  Operation op(*this, "OnWithdraw");
  if (state_.gate.IsPaused(PauseDirection::Withdraw)) Reject(ErrorCode::WithdrawBlocked, "withdraw gate closed");

  const RedemptionPath& path = SelectRedemptionPath(*vault_);
  const Amount available = path.Available(*vault_, self_);
  const Amount held = held_->BalanceOf(self_);
  const Amount pool_draw = AmountMath::SaturatingSub(amount, held);
  if (pool_draw > available) {
    Reject(ErrorCode::InsufficientFunds, "requested " + std::to_string(amount) + ", held " + std::to_string(held) +
           ", pool " + std::to_string(available));
  }

  if (pool_draw > 0) {
    const Amount realized = path.Realize(*vault_, self_, pool_draw);
    if (realized > 0) wrap_->Wrap(self_, self_, realized);
    Logger::Log(LogLevel::DEBUG, name_, std::string("pool draw via ") + RedemptionModeName(path.Mode()) +
                ": draw=" + std::to_string(pool_draw) + " realized=" + std::to_string(realized), __FILE__, __LINE__);
  }
  held_->Transfer(to, amount);

  StrategyEvent e{StrategyEventKind::Withdrawn};
  e.account = to;
  e.amount = amount;
  op.Emit(e);
  op.Commit();
  Logger::Log(LogLevel::INFO, name_, "withdrawn: to=" + to + " amount=" + std::to_string(amount), __FILE__, __LINE__);
}

// ---------------------------------------------------------------------------
// Administration

void CooldownStrategy::SetPause(const Address& caller, PauseDirection direction, bool value) {
  Operation op(*this, "SetPause");
  RequireOwnerOrRole(caller, Roles::Pauser(), ErrorCode::PauserNotAuthorized);
  StrategyEvent e{StrategyEventKind::PauseUpdated};
  e.direction = direction;
  e.before = state_.gate.Set(direction, value);
  e.after = value;
  op.Emit(e);
  op.Commit();
  Logger::Log(LogLevel::INFO, name_, std::string(PauseDirectionName(direction)) + " pause " +
              (e.before ? "on" : "off") + " -> " + (value ? "on" : "off") + " by " + caller, __FILE__, __LINE__);
}

void CooldownStrategy::CooldownAssets(const Address& caller, Amount assets) {
  Operation op(*this, "CooldownAssets");
  RequireOwnerOrRole(caller, Roles::CooldownAdmin(), ErrorCode::CooldownNotAuthorized);
  vault_->CooldownAssets(assets);
  StrategyEvent e{StrategyEventKind::CooldownRequested};
  e.detail = "assets";
  e.amount = assets;
  op.Emit(e);
  op.Commit();
  Logger::Log(LogLevel::INFO, name_, "cooldown requested: assets=" + std::to_string(assets), __FILE__, __LINE__);
}

void CooldownStrategy::CooldownShares(const Address& caller, Amount shares) {
  Operation op(*this, "CooldownShares");
  RequireOwnerOrRole(caller, Roles::CooldownAdmin(), ErrorCode::CooldownNotAuthorized);
  vault_->CooldownShares(shares);
  StrategyEvent e{StrategyEventKind::CooldownRequested};
  e.detail = "shares";
  e.amount = shares;
  op.Emit(e);
  op.Commit();
  Logger::Log(LogLevel::INFO, name_, "cooldown requested: shares=" + std::to_string(shares), __FILE__, __LINE__);
}

void CooldownStrategy::SetDepositThreshold(const Address& caller, Amount threshold) {
  Operation op(*this, "SetDepositThreshold");
  RequireOwner(caller);
  StrategyEvent e{StrategyEventKind::DepositThresholdUpdated};
  e.previous_amount = state_.deposit_threshold;
  e.amount = threshold;
  state_.deposit_threshold = threshold;
  op.Emit(e);
  op.Commit();
  Logger::Log(LogLevel::INFO, name_, "deposit threshold " + std::to_string(e.previous_amount) + " -> " +
              std::to_string(threshold), __FILE__, __LINE__);
}

void CooldownStrategy::SetCluster(const Address& caller, ClusterRegistry* registry) {
  Operation op(*this, "SetCluster");
  RequireOwner(caller);
  if (!registry) Reject(ErrorCode::InvalidConfiguration, "cluster registry is null");
  StrategyEvent e{StrategyEventKind::ClusterUpdated};
  e.previous_account = state_.cluster->RegistryAddress();
  e.account = registry->RegistryAddress();
  state_.cluster = registry;
  op.Emit(e);
  op.Commit();
  Logger::Log(LogLevel::INFO, name_, "cluster " + e.previous_account + " -> " + e.account, __FILE__, __LINE__);
}

void CooldownStrategy::TransferOwnership(const Address& caller, const Address& new_owner) {
  Operation op(*this, "TransferOwnership");
  RequireOwner(caller);
  if (new_owner.empty()) Reject(ErrorCode::InvalidConfiguration, "new owner is empty");
  StrategyEvent e{StrategyEventKind::OwnershipTransferred};
  e.previous_account = state_.owner;
  e.account = new_owner;
  state_.owner = new_owner;
  op.Emit(e);
  op.Commit();
  Logger::Log(LogLevel::INFO, name_, "ownership " + e.previous_account + " -> " + new_owner, __FILE__, __LINE__);
}

// ---------------------------------------------------------------------------
// Emergency liquidator

void CooldownStrategy::EmergencyWithdraw(const Address& caller) {
  Operation op(*this, "EmergencyWithdraw");
  RequireOwner(caller);

  for (PauseDirection d : {PauseDirection::Deposit, PauseDirection::Withdraw}) {
    StrategyEvent e{StrategyEventKind::PauseUpdated};
    e.direction = d;
    e.before = state_.gate.Set(d, true);
    e.after = true;
    op.Emit(e);
  }

  const RedemptionPath& path = SelectRedemptionPath(*vault_);
  const Amount realized = path.RealizeAll(*vault_, self_);
  if (realized > 0) wrap_->Wrap(self_, self_, realized);

  StrategyEvent e{StrategyEventKind::EmergencyWithdrawn};
  e.amount = realized;
  op.Emit(e);
  op.Commit();
  Logger::Log(LogLevel::WARNING, name_, std::string("emergency withdraw via ") + RedemptionModeName(path.Mode()) +
              ": realized=" + std::to_string(realized) + ", both gates closed", __FILE__, __LINE__);
}

void CooldownStrategy::RescueEth(const Address& caller, const Address& to, Amount amount) {
  Operation op(*this, "RescueEth");
  RequireOwner(caller);
  const Amount balance = native_->Balance();
  const Amount value = amount == 0 ? balance : amount;
  if (value > balance) {
    Reject(ErrorCode::TransferFailed, "native balance " + std::to_string(balance) + " below " + std::to_string(value));
  }
  if (!native_->Send(to, value)) Reject(ErrorCode::TransferFailed, "recipient " + to + " refused " + std::to_string(value));
  StrategyEvent e{StrategyEventKind::EthRescued};
  e.account = to;
  e.amount = value;
  op.Emit(e);
  op.Commit();
  Logger::Log(LogLevel::INFO, name_, "rescued native " + std::to_string(value) + " to " + to, __FILE__, __LINE__);
}
