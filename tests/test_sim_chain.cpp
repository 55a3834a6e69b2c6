#include <gtest/gtest.h>
#include "sim/sim_chain.hpp"
#include "sim/sim_protocols.hpp"
#include "common/errors.hpp"

namespace {

const Address kToken = "0x00000000000000000000000000000000000000f1";
const Address kAlice = "0x00000000000000000000000000000000000000aa";
const Address kBob = "0x00000000000000000000000000000000000000bb";
const Address kVault = "0x00000000000000000000000000000000000000f2";
const Address kSilo = "0x00000000000000000000000000000000000000f3";

}  // namespace

TEST(SimChain, LedgerMovesAndSupply) {
  SimChain chain;
  chain.Mint(kToken, kAlice, 100);
  chain.Move(kToken, kAlice, kBob, 30);
  EXPECT_EQ(chain.BalanceOf(kToken, kAlice), 70u);
  EXPECT_EQ(chain.BalanceOf(kToken, kBob), 30u);
  EXPECT_EQ(chain.TotalSupply(kToken), 100u);

  chain.Burn(kToken, kBob, 10);
  EXPECT_EQ(chain.TotalSupply(kToken), 90u);
  EXPECT_THROW(chain.Move(kToken, kBob, kAlice, 21), ProtocolError);
  EXPECT_THROW(chain.Burn(kToken, kBob, 21), ProtocolError);
}

TEST(SimChain, AddressesAreCaseInsensitive) {
  SimChain chain;
  chain.Mint(kToken, "0x00000000000000000000000000000000000000AA", 5);
  EXPECT_EQ(chain.BalanceOf(kToken, kAlice), 5u);
}

TEST(SimChain, TransactRestoresEverythingOnFailure) {
  SimChain chain;
  chain.Mint(kToken, kAlice, 10);
  chain.SetNativeBalance(kAlice, 3);

  EXPECT_THROW(chain.Transact([&]{
    chain.Move(kToken, kAlice, kBob, 10);
    chain.SetNativeBalance(kAlice, 0);
    chain.AdvanceTime(60);
    chain.GrantRole(kVault, kBob, "0x01");
    throw ProtocolError("boom");
  }), ProtocolError);

  EXPECT_EQ(chain.BalanceOf(kToken, kAlice), 10u);
  EXPECT_EQ(chain.BalanceOf(kToken, kBob), 0u);
  EXPECT_EQ(chain.NativeBalance(kAlice), 3u);
  EXPECT_EQ(chain.Now(), 1700000000ULL);
  EXPECT_FALSE(chain.HasRole(kVault, kBob, "0x01"));

  EXPECT_EQ(chain.Transact([&]{ return chain.BalanceOf(kToken, kAlice) * 2; }), 20u);
}

TEST(SimChain, NativeTransfersHonourRefusal) {
  SimChain chain;
  chain.SetNativeBalance(kAlice, 10);
  EXPECT_FALSE(chain.SendNative(kAlice, kBob, 11));
  chain.SetRefusesNative(kBob, true);
  EXPECT_FALSE(chain.SendNative(kAlice, kBob, 1));
  chain.SetRefusesNative(kBob, false);
  EXPECT_TRUE(chain.SendNative(kAlice, kBob, 4));
  EXPECT_EQ(chain.NativeBalance(kAlice), 6u);
  EXPECT_EQ(chain.NativeBalance(kBob), 4u);
}

TEST(SimChain, RolesAreScopedByRegistry) {
  SimChain chain;
  chain.GrantRole(kVault, kAlice, "0xAB");
  EXPECT_TRUE(chain.HasRole(kVault, kAlice, "0xab"));
  EXPECT_FALSE(chain.HasRole(kSilo, kAlice, "0xab"));
  chain.RevokeRole(kVault, kAlice, "0xab");
  EXPECT_FALSE(chain.HasRole(kVault, kAlice, "0xab"));
}

TEST(SimChain, MissingVaultIsAProtocolError) {
  SimChain chain;
  EXPECT_THROW(chain.Vault(kVault), ProtocolError);
  EXPECT_THROW(chain.SetCooldownDuration(kVault, 1), ProtocolError);
}

class SimVaultTest : public ::testing::Test {
protected:
  SimChain chain_;
  SimStakingVault vault_{chain_, kVault, kAlice};

  void SetUp() override {
    chain_.CreateVault(kVault, kToken, kSilo, 0);
    chain_.Mint(kToken, kAlice, 1000);
  }
};

TEST_F(SimVaultTest, ShareMathRoundsAgainstTheCaller) {
  vault_.Deposit(300, kAlice);
  EXPECT_EQ(vault_.SharesOf(kAlice), 300u);
  chain_.Mint(kToken, kVault, 100);  // yield

  EXPECT_EQ(vault_.TotalAssets(), 400u);
  EXPECT_EQ(vault_.ConvertToShares(100), 75u);
  EXPECT_EQ(vault_.ConvertToAssets(1), 1u);
  EXPECT_EQ(vault_.MaxWithdraw(kAlice), 400u);
  // 10 assets need 7.5 shares: rounds up
  EXPECT_EQ(vault_.PreviewWithdraw(10), 8u);

  vault_.Withdraw(10, kBob, kAlice);
  EXPECT_EQ(vault_.SharesOf(kAlice), 292u);
  EXPECT_EQ(chain_.BalanceOf(kToken, kBob), 10u);
}

TEST_F(SimVaultTest, RejectsZeroDepositAndForeignOwner) {
  EXPECT_THROW(vault_.Deposit(0, kAlice), ProtocolError);
  vault_.Deposit(10, kAlice);
  EXPECT_THROW(vault_.Withdraw(1, kAlice, kBob), ProtocolError);
  EXPECT_THROW(vault_.Withdraw(11, kAlice, kAlice), ProtocolError);
}

TEST_F(SimVaultTest, ModesGateWithdrawAndCooldown) {
  vault_.Deposit(100, kAlice);
  EXPECT_THROW(vault_.CooldownAssets(10), ProtocolError);

  chain_.SetCooldownDuration(kVault, 3600);
  EXPECT_THROW(vault_.Withdraw(10, kAlice, kAlice), ProtocolError);
  EXPECT_THROW(vault_.CooldownAssets(101), ProtocolError);
  EXPECT_THROW(vault_.CooldownShares(101), ProtocolError);
}

TEST_F(SimVaultTest, CooldownAccumulatesAndRestartsClock) {
  vault_.Deposit(100, kAlice);
  chain_.SetCooldownDuration(kVault, 3600);
  const unsigned long long start = chain_.Now();

  vault_.CooldownAssets(20);
  EXPECT_EQ(vault_.Cooldowns(kAlice).underlying_amount, 20u);
  EXPECT_EQ(vault_.Cooldowns(kAlice).cooldown_end, start + 3600);
  EXPECT_EQ(chain_.BalanceOf(kToken, kSilo), 20u);

  chain_.AdvanceTime(1800);
  vault_.CooldownShares(10);
  EXPECT_EQ(vault_.Cooldowns(kAlice).underlying_amount, 30u);
  EXPECT_EQ(vault_.Cooldowns(kAlice).cooldown_end, start + 1800 + 3600);
  EXPECT_EQ(vault_.SharesOf(kAlice), 70u);

  chain_.AdvanceTime(1800);
  EXPECT_THROW(vault_.Unstake(kBob), ProtocolError);
  chain_.AdvanceTime(1800);
  vault_.Unstake(kBob);
  EXPECT_EQ(chain_.BalanceOf(kToken, kBob), 30u);
  EXPECT_EQ(vault_.Cooldowns(kAlice).underlying_amount, 0u);

  // nothing cooling: pays out zero
  vault_.Unstake(kBob);
  EXPECT_EQ(chain_.BalanceOf(kToken, kBob), 30u);
}

TEST_F(SimVaultTest, SwitchingCooldownOffReleasesImmediately) {
  vault_.Deposit(100, kAlice);
  chain_.SetCooldownDuration(kVault, 3600);
  vault_.CooldownAssets(40);
  chain_.SetCooldownDuration(kVault, 0);
  vault_.Unstake(kAlice);
  EXPECT_EQ(chain_.BalanceOf(kToken, kAlice), 940u);
}

TEST(SimWrapAdapter, WrapsOneToOneAgainstBacking) {
  SimChain chain;
  const Address underlying = kToken;
  const Address wrapped = "0x00000000000000000000000000000000000000f4";
  SimWrapAdapter wrap(chain, wrapped, underlying, kAlice);
  chain.Mint(underlying, kAlice, 50);

  wrap.Wrap(kAlice, kBob, 20);
  EXPECT_EQ(chain.BalanceOf(wrapped, kBob), 20u);
  EXPECT_EQ(chain.BalanceOf(underlying, wrapped), 20u);
  EXPECT_THROW(wrap.Wrap(kBob, kBob, 1), ProtocolError);

  EXPECT_THROW(wrap.Unwrap(kAlice, 1), ProtocolError);
}
