#include <gtest/gtest.h>
#include "sim/sim_deployment.hpp"
#include "auth/cluster_registry.hpp"
#include "test_support.hpp"

namespace {

constexpr unsigned long long kDay = 24 * 3600;
const Address kStranger = "0x00000000000000000000000000000000000000ee";

}  // namespace

TEST(PauseGate, WithdrawGateBlocksWithdrawalsAndLeavesBalancesAlone) {
  SimDeployment d;
  d.FundHeld(100);
  d.Strategy().SetPause(SimAddresses::OWNER, PauseDirection::Withdraw, true);

  EXPECT_EQ(StrategyErrorCodeOf([&]{ d.Strategy().OnWithdraw(SimAddresses::USER, 10); }), ErrorCode::WithdrawBlocked);
  EXPECT_EQ(d.Held(), 100u);
  EXPECT_EQ(d.WrappedBalance(SimAddresses::USER), 0u);
}

TEST(PauseGate, DirectionsAreIndependent) {
  SimDeployment d;
  d.FundHeld(100);
  d.Strategy().SetPause(SimAddresses::OWNER, PauseDirection::Withdraw, true);
  EXPECT_FALSE(d.Strategy().IsPaused(PauseDirection::Deposit));

  d.FundHeld(5);
  d.Strategy().OnDeposit(5);
  EXPECT_EQ(d.Shares(), 105u);

  d.Strategy().SetPause(SimAddresses::OWNER, PauseDirection::Withdraw, false);
  d.Strategy().SetPause(SimAddresses::OWNER, PauseDirection::Deposit, true);
  EXPECT_FALSE(d.Strategy().IsPaused(PauseDirection::Withdraw));
  d.Strategy().OnWithdraw(SimAddresses::USER, 5);
  EXPECT_EQ(d.WrappedBalance(SimAddresses::USER), 5u);
}

TEST(PauseGate, SignalCarriesPreviousAndNewValue) {
  RecordingEventSink sink;
  SimDeploymentOptions o;
  o.events = &sink;
  SimDeployment d(o);

  d.Strategy().SetPause(SimAddresses::OWNER, PauseDirection::Deposit, true);
  d.Strategy().SetPause(SimAddresses::OWNER, PauseDirection::Deposit, true);
  ASSERT_EQ(sink.Events().size(), 2u);
  EXPECT_EQ(sink.Events()[0].direction, PauseDirection::Deposit);
  EXPECT_FALSE(sink.Events()[0].before);
  EXPECT_TRUE(sink.Events()[0].after);
  // setting the same value again is allowed and still signalled
  EXPECT_TRUE(sink.Events()[1].before);
  EXPECT_TRUE(sink.Events()[1].after);
}

TEST(Authorization, PauserRoleComesFromClusterRegistry) {
  SimDeployment d;
  EXPECT_EQ(StrategyErrorCodeOf([&]{ d.Strategy().SetPause(SimAddresses::PAUSER, PauseDirection::Deposit, true); }),
            ErrorCode::PauserNotAuthorized);
  EXPECT_FALSE(d.Strategy().IsPaused(PauseDirection::Deposit));

  d.Chain().GrantRole(SimAddresses::REGISTRY, SimAddresses::PAUSER, Roles::Pauser());
  d.Strategy().SetPause(SimAddresses::PAUSER, PauseDirection::Deposit, true);
  EXPECT_TRUE(d.Strategy().IsPaused(PauseDirection::Deposit));

  d.Chain().RevokeRole(SimAddresses::REGISTRY, SimAddresses::PAUSER, Roles::Pauser());
  EXPECT_EQ(StrategyErrorCodeOf([&]{ d.Strategy().SetPause(SimAddresses::PAUSER, PauseDirection::Deposit, false); }),
            ErrorCode::PauserNotAuthorized);
  EXPECT_TRUE(d.Strategy().IsPaused(PauseDirection::Deposit));
}

TEST(Authorization, CooldownAdminRoleDoesNotGrantPause) {
  SimDeployment d;
  d.Chain().GrantRole(SimAddresses::REGISTRY, SimAddresses::COOLDOWN_ADMIN, Roles::CooldownAdmin());
  EXPECT_EQ(StrategyErrorCodeOf([&]{ d.Strategy().SetPause(SimAddresses::COOLDOWN_ADMIN, PauseDirection::Withdraw, true); }),
            ErrorCode::PauserNotAuthorized);
}

TEST(Authorization, CooldownRequestsNeedOwnerOrCooldownAdmin) {
  RecordingEventSink sink;
  SimDeploymentOptions o;
  o.cooldown_duration = kDay;
  o.events = &sink;
  SimDeployment d(o);
  d.SeedStaked(100);

  EXPECT_EQ(StrategyErrorCodeOf([&]{ d.Strategy().CooldownAssets(kStranger, 10); }), ErrorCode::CooldownNotAuthorized);
  EXPECT_EQ(StrategyErrorCodeOf([&]{ d.Strategy().CooldownShares(SimAddresses::PAUSER, 10); }), ErrorCode::CooldownNotAuthorized);
  EXPECT_EQ(d.Strategy().PendingCooldownAmount(), 0u);

  d.Chain().GrantRole(SimAddresses::REGISTRY, SimAddresses::COOLDOWN_ADMIN, Roles::CooldownAdmin());
  d.Strategy().CooldownAssets(SimAddresses::COOLDOWN_ADMIN, 10);
  d.Strategy().CooldownShares(SimAddresses::OWNER, 20);
  EXPECT_EQ(d.Strategy().PendingCooldownAmount(), 30u);
  EXPECT_EQ(d.Shares(), 70u);

  ASSERT_EQ(sink.Events().size(), 2u);
  EXPECT_EQ(sink.Events()[0].kind, StrategyEventKind::CooldownRequested);
  EXPECT_EQ(sink.Events()[0].detail, "assets");
  EXPECT_EQ(sink.Events()[1].detail, "shares");
  EXPECT_EQ(sink.Events()[1].amount, 20u);
}

TEST(Authorization, CooldownRequestPassesVaultRejectionThrough) {
  SimDeployment d;  // cooldown off
  d.SeedStaked(100);
  EXPECT_THROW(d.Strategy().CooldownAssets(SimAddresses::OWNER, 10), ProtocolError);
}

TEST(Authorization, OwnerOnlyOperations) {
  SimDeployment d;
  SimClusterRegistry other(d.Chain(), "0x00000000000000000000000000000000000000d2");

  EXPECT_EQ(StrategyErrorCodeOf([&]{ d.Strategy().SetDepositThreshold(kStranger, 1); }), ErrorCode::NotOwner);
  EXPECT_EQ(StrategyErrorCodeOf([&]{ d.Strategy().SetCluster(kStranger, &other); }), ErrorCode::NotOwner);
  EXPECT_EQ(StrategyErrorCodeOf([&]{ d.Strategy().EmergencyWithdraw(kStranger); }), ErrorCode::NotOwner);
  EXPECT_EQ(StrategyErrorCodeOf([&]{ d.Strategy().RescueEth(kStranger, kStranger, 0); }), ErrorCode::NotOwner);
  EXPECT_EQ(StrategyErrorCodeOf([&]{ d.Strategy().TransferOwnership(kStranger, kStranger); }), ErrorCode::NotOwner);

  // the pauser role grants nothing beyond pausing
  d.Chain().GrantRole(SimAddresses::REGISTRY, SimAddresses::PAUSER, Roles::Pauser());
  EXPECT_EQ(StrategyErrorCodeOf([&]{ d.Strategy().EmergencyWithdraw(SimAddresses::PAUSER); }), ErrorCode::NotOwner);
  EXPECT_FALSE(d.Strategy().IsPaused(PauseDirection::Withdraw));
}

TEST(Authorization, OwnerComparisonIgnoresHexCase) {
  SimDeployment d;
  d.Strategy().SetDepositThreshold("0x00000000000000000000000000000000000000A1", 7);
  EXPECT_EQ(d.Strategy().DepositThreshold(), 7u);
}

TEST(Administration, ThresholdUpdateSignalsOldAndNew) {
  RecordingEventSink sink;
  SimDeploymentOptions o;
  o.deposit_threshold = 10;
  o.events = &sink;
  SimDeployment d(o);

  d.Strategy().SetDepositThreshold(SimAddresses::OWNER, 25);
  EXPECT_EQ(d.Strategy().DepositThreshold(), 25u);
  ASSERT_EQ(sink.Events().size(), 1u);
  EXPECT_EQ(sink.Events()[0].kind, StrategyEventKind::DepositThresholdUpdated);
  EXPECT_EQ(sink.Events()[0].previous_amount, 10u);
  EXPECT_EQ(sink.Events()[0].amount, 25u);
}

TEST(Administration, SwappingClusterMovesRoleLookups) {
  RecordingEventSink sink;
  SimDeploymentOptions o;
  o.events = &sink;
  SimDeployment d(o);
  const Address other_address = "0x00000000000000000000000000000000000000d2";
  SimClusterRegistry other(d.Chain(), other_address);
  d.Chain().GrantRole(SimAddresses::REGISTRY, SimAddresses::PAUSER, Roles::Pauser());

  EXPECT_EQ(StrategyErrorCodeOf([&]{ d.Strategy().SetCluster(SimAddresses::OWNER, nullptr); }), ErrorCode::InvalidConfiguration);
  EXPECT_EQ(d.Strategy().ClusterAddress(), SimAddresses::REGISTRY);

  d.Strategy().SetCluster(SimAddresses::OWNER, &other);
  EXPECT_EQ(d.Strategy().ClusterAddress(), other_address);
  ASSERT_EQ(sink.Events().size(), 1u);
  EXPECT_EQ(sink.Events()[0].kind, StrategyEventKind::ClusterUpdated);
  EXPECT_EQ(sink.Events()[0].previous_account, SimAddresses::REGISTRY);
  EXPECT_EQ(sink.Events()[0].account, other_address);

  EXPECT_EQ(StrategyErrorCodeOf([&]{ d.Strategy().SetPause(SimAddresses::PAUSER, PauseDirection::Deposit, true); }),
            ErrorCode::PauserNotAuthorized);
  d.Chain().GrantRole(other_address, SimAddresses::PAUSER, Roles::Pauser());
  d.Strategy().SetPause(SimAddresses::PAUSER, PauseDirection::Deposit, true);
  EXPECT_TRUE(d.Strategy().IsPaused(PauseDirection::Deposit));
}

TEST(Administration, OwnershipTransferHandsOverOwnerOperations) {
  SimDeployment d;
  d.Strategy().TransferOwnership(SimAddresses::OWNER, SimAddresses::AGGREGATOR);
  EXPECT_EQ(d.Strategy().Owner(), SimAddresses::AGGREGATOR);
  EXPECT_EQ(StrategyErrorCodeOf([&]{ d.Strategy().SetDepositThreshold(SimAddresses::OWNER, 1); }), ErrorCode::NotOwner);
  d.Strategy().SetDepositThreshold(SimAddresses::AGGREGATOR, 1);
  EXPECT_EQ(StrategyErrorCodeOf([&]{ d.Strategy().TransferOwnership(SimAddresses::AGGREGATOR, ""); }),
            ErrorCode::InvalidConfiguration);
  EXPECT_EQ(d.Strategy().Owner(), SimAddresses::AGGREGATOR);
}

TEST(Administration, StatusReportsConfigurationAndBalances) {
  SimDeploymentOptions o;
  o.deposit_threshold = 500;
  SimDeployment d(o);
  d.FundHeld(12);
  d.SeedStaked(30);
  d.Strategy().SetPause(SimAddresses::OWNER, PauseDirection::Withdraw, true);

  StrategyStatus s = d.Strategy().Status();
  EXPECT_EQ(s.owner, SimAddresses::OWNER);
  EXPECT_EQ(s.cluster, SimAddresses::REGISTRY);
  EXPECT_EQ(s.deposit_threshold, 500u);
  EXPECT_FALSE(s.deposit_paused);
  EXPECT_TRUE(s.withdraw_paused);
  EXPECT_EQ(s.mode, RedemptionMode::Immediate);
  EXPECT_EQ(s.held, 12u);
  EXPECT_EQ(s.pool, 30u);
  EXPECT_EQ(s.current_balance, 42u);
}

TEST(RoleIds, AreKeccakOfRoleNames) {
  EXPECT_EQ(Roles::Pauser(), "0x65d7a28e3265b37a6474929f336521b332c1681b933f6cb9f3376673440d862a");
  EXPECT_EQ(Roles::CooldownAdmin().size(), 66u);
  EXPECT_NE(Roles::CooldownAdmin(), Roles::Pauser());
}

// ---------------------------------------------------------------------------
// Construction

class StrategyConstruction : public ::testing::Test {
protected:
  SimChain chain_;
  SimStakingVault vault_{chain_, SimAddresses::STAKING, SimAddresses::STRATEGY};
  SimWrapAdapter wrap_{chain_, SimAddresses::WRAPPED, SimAddresses::UNDERLYING, SimAddresses::STRATEGY};
  SimTokenLedger held_{chain_, SimAddresses::WRAPPED, SimAddresses::STRATEGY};
  SimNativeWallet native_{chain_, SimAddresses::STRATEGY};
  SimClusterRegistry registry_{chain_, SimAddresses::REGISTRY};
  StrategyParams params_;
  StrategyDependencies deps_;

  void SetUp() override {
    chain_.CreateVault(SimAddresses::STAKING, SimAddresses::UNDERLYING, SimAddresses::SILO, 0);
    params_.name = "construction";
    params_.self = SimAddresses::STRATEGY;
    params_.owner = SimAddresses::OWNER;
    deps_.staking_vault = &vault_;
    deps_.wrap_adapter = &wrap_;
    deps_.held_asset = &held_;
    deps_.native_wallet = &native_;
    deps_.cluster = &registry_;
  }

  ErrorCode Construct() {
    return StrategyErrorCodeOf([&]{ CooldownStrategy s(params_, deps_); });
  }
};

TEST_F(StrategyConstruction, AcceptsCompleteWiringWithoutEventSink) {
  EXPECT_NO_THROW({ CooldownStrategy s(params_, deps_); });
}

TEST_F(StrategyConstruction, RejectsMissingCollaborators) {
  deps_.cluster = nullptr;
  EXPECT_EQ(Construct(), ErrorCode::InvalidConfiguration);
  deps_.cluster = &registry_;
  deps_.staking_vault = nullptr;
  EXPECT_EQ(Construct(), ErrorCode::InvalidConfiguration);
  deps_.staking_vault = &vault_;
  deps_.native_wallet = nullptr;
  EXPECT_EQ(Construct(), ErrorCode::InvalidConfiguration);
}

TEST_F(StrategyConstruction, RejectsEmptyOwner) {
  params_.owner.clear();
  EXPECT_EQ(Construct(), ErrorCode::InvalidConfiguration);
}

TEST_F(StrategyConstruction, RejectsWrapperOverDifferentAsset) {
  SimWrapAdapter foreign(chain_, SimAddresses::WRAPPED, "0x00000000000000000000000000000000000000c9", SimAddresses::STRATEGY);
  deps_.wrap_adapter = &foreign;
  EXPECT_EQ(Construct(), ErrorCode::InvalidConfiguration);
}
