#include <sharevault/contracts/constants.hpp>
#include <sharevault/contracts/vault.hpp>
#include <sharevault/ledger/share_ledger.hpp>
#include <sharevault/testing/host_fixture.hpp>
#include <gtest/gtest.h>

#include <memory>
#include <optional>
#include <string>

using namespace sharevault::schema;
using namespace sharevault::testing;
namespace contracts = sharevault::contracts;
namespace runtime = sharevault::runtime;

namespace {

const auto kVault = account_id_t{"art.registry.test"};
const auto kMallory = account_id_t{"mallory.test"};
const auto kMarket = account_id_t{"market.test"};

/// Share receiver that keeps part of every `ft_transfer_call`.
class market final : public runtime::component {
 public:
  explicit market(amount_t unused) : unused_{std::move(unused)} {}

  component_kind_t kind() const override { return component_kind_t::registry; }

  runtime::call_outcome invoke(runtime::call_context&,
                               const method_call_t& call,
                               bytes_t&) override {
    if (!std::holds_alternative<ft_on_transfer_t>(call)) {
      return runtime::make_failure(error_code::method_not_found);
    }
    return runtime::make_success_value(unused_);
  }

 private:
  amount_t unused_;
};

host_settings make_settings(const runtime::settlement_mode_t settlement,
                            const runtime::remote_failure_policy_t policy =
                                runtime::remote_failure_policy_t::propagate) {
  auto settings = host_settings{};
  settings.settlement_mode = settlement;
  settings.failure_policy = policy;
  return settings;
}

class vault_test : public ::testing::Test {
 protected:
  explicit vault_test(host_settings settings = make_settings(
                          runtime::settlement_mode_t::confirmed))
      : fixture{std::move(settings)} {}

  void SetUp() override {
    ASSERT_EQ(fixture.create_vault(kAssets, "ART"), kVault);
  }

  /// Mint `token` to `owner`, approve the vault and deposit it.
  receipt_outcome_t deposit_token(const account_id_t& owner,
                                  const asset_id_t& token) {
    fixture.mint(token, owner);
    fixture.approve(owner, token, kVault);
    return fixture.call(owner, kVault, deposit_t{.asset_id = token});
  }

  /// Re-approve an asset `owner` already holds and deposit it.
  receipt_outcome_t deposit_token_again(const account_id_t& owner,
                                        const asset_id_t& token) {
    fixture.approve(owner, token, kVault);
    return fixture.call(owner, kVault, deposit_t{.asset_id = token});
  }

  vault_state_t vault_state() const {
    return fixture.state_of<vault_state_t>(kVault);
  }

  host_fixture fixture;
};

class optimistic_vault_test : public vault_test {
 protected:
  optimistic_vault_test()
      : vault_test{make_settings(runtime::settlement_mode_t::optimistic)} {}
};

class abort_vault_test : public vault_test {
 protected:
  abort_vault_test()
      : vault_test{make_settings(runtime::settlement_mode_t::confirmed,
                                 runtime::remote_failure_policy_t::abort)} {}
};

TEST_F(vault_test, init_mints_one_seed_unit_to_the_vault) {
  auto state = vault_state();
  EXPECT_TRUE(state.initialized);
  EXPECT_EQ(state.origin, kAssets);
  EXPECT_EQ(state.registry, kRegistry);
  EXPECT_EQ(state.unit_value, contracts::kDefaultUnitValue);
  EXPECT_EQ(state.ledger.total_supply, contracts::kDefaultUnitValue);
  EXPECT_EQ(fixture.shares_of(kVault, kVault), contracts::kDefaultUnitValue);
  EXPECT_EQ(state.metadata.symbol, "ART");
  EXPECT_EQ(state.metadata.decimals, kShareDecimals);

  auto info = public_vault_info_t{};
  ASSERT_EQ(contracts::make_public_info(state, info), error_code::ok);
  EXPECT_EQ(info.reported_supply, 0);
  EXPECT_EQ(info.symbol, "ART");
  EXPECT_EQ(info.media, "ipfs://ART");
  EXPECT_EQ(fixture.balance_of(kVault), contracts::kDefaultVaultFunding);
}

TEST_F(vault_test, init_cannot_run_twice) {
  auto outcome =
      fixture.call(kAlice, kVault, init_vault_t{.origin = kAlice,
                                                .name = "x",
                                                .symbol = "X"});
  EXPECT_EQ(outcome.code,
            static_cast<uint32_t>(error_code::already_initialized));
}

TEST_F(vault_test, confirmed_deposit_mints_only_after_transfer_settles) {
  auto outcome = deposit_token(kAlice, "t1");
  ASSERT_EQ(outcome.code, 0u) << outcome.log;
  EXPECT_EQ(decode_as<uint64_t>(outcome.data), 0u);
  EXPECT_EQ(fixture.shares_of(kVault, kAlice), 0);
  ASSERT_EQ(vault_state().intents.size(), 1u);
  EXPECT_EQ(vault_state().intents.at(0).status, intent_status_t::pending);

  fixture.settle();
  EXPECT_EQ(fixture.owner_of("t1"), kVault);
  EXPECT_EQ(fixture.shares_of(kVault, kAlice), contracts::kDefaultUnitValue);
  auto state = vault_state();
  EXPECT_TRUE(state.intents.empty());
  EXPECT_EQ(state.ledger.total_supply, 2 * contracts::kDefaultUnitValue);
  EXPECT_TRUE(sharevault::ledger::share_ledger{state.ledger}.is_consistent());

  auto info = public_vault_info_t{};
  ASSERT_EQ(contracts::make_public_info(state, info), error_code::ok);
  EXPECT_EQ(info.reported_supply, 1);
}

TEST_F(vault_test, confirmed_deposit_failure_mints_nothing) {
  fixture.mint("t1", kAlice);
  // No approval for the vault, so the asset registry refuses the transfer.
  auto outcome = fixture.call(kAlice, kVault, deposit_t{.asset_id = "t1"});
  ASSERT_EQ(outcome.code, 0u) << outcome.log;
  auto produced = fixture.settle();

  auto transfer = find_outcome(produced, "nft_transfer");
  ASSERT_TRUE(transfer.has_value());
  EXPECT_EQ(transfer->code, static_cast<uint32_t>(error_code::asset_not_owned));
  auto settled = find_outcome(produced, "on_transfer_settled");
  ASSERT_TRUE(settled.has_value());
  EXPECT_EQ(settled->code,
            static_cast<uint32_t>(error_code::remote_step_failed));

  EXPECT_EQ(fixture.owner_of("t1"), kAlice);
  EXPECT_EQ(fixture.shares_of(kVault, kAlice), 0);
  auto state = vault_state();
  ASSERT_EQ(state.intents.size(), 1u);
  EXPECT_EQ(state.intents.at(0).status, intent_status_t::failed);
  EXPECT_EQ(state.intents.at(0).legs.front().status, intent_status_t::failed);
  EXPECT_EQ(state.ledger.total_supply, contracts::kDefaultUnitValue);
}

TEST_F(optimistic_vault_test, deposit_mints_before_the_transfer_resolves) {
  fixture.mint("t1", kAlice);
  auto outcome = fixture.call(kAlice, kVault, deposit_t{.asset_id = "t1"});
  ASSERT_EQ(outcome.code, 0u) << outcome.log;
  EXPECT_EQ(fixture.shares_of(kVault, kAlice), contracts::kDefaultUnitValue);

  // The transfer fails and nothing reconciles the minted shares.
  fixture.settle();
  EXPECT_EQ(fixture.owner_of("t1"), kAlice);
  EXPECT_EQ(fixture.shares_of(kVault, kAlice), contracts::kDefaultUnitValue);
  EXPECT_TRUE(vault_state().intents.empty());
}

TEST_F(optimistic_vault_test, withdraw_burns_immediately) {
  fixture.mint("t1", kAlice);
  fixture.approve(kAlice, "t1", kVault);
  ASSERT_EQ(fixture.call(kAlice, kVault, deposit_t{.asset_id = "t1"}).code,
            0u);
  fixture.settle();

  auto outcome = fixture.call(kAlice, kVault, withdraw_t{.asset_id = "t1"});
  ASSERT_EQ(outcome.code, 0u) << outcome.log;
  EXPECT_EQ(fixture.shares_of(kVault, kAlice), 0);
  fixture.settle();
  EXPECT_EQ(fixture.owner_of("t1"), kAlice);
  EXPECT_EQ(vault_state().ledger.total_supply, contracts::kDefaultUnitValue);
}

TEST_F(vault_test, batches_reject_empty_and_duplicate_assets) {
  auto empty = fixture.call(kAlice, kVault, batch_deposit_t{});
  EXPECT_EQ(empty.code, static_cast<uint32_t>(error_code::empty_batch));
  auto duplicate = fixture.call(
      kAlice, kVault, batch_deposit_t{.asset_ids = {"t1", "t1"}});
  EXPECT_EQ(duplicate.code, static_cast<uint32_t>(error_code::duplicate_asset));
  auto withdraw_duplicate = fixture.call(
      kAlice, kVault, batch_withdraw_t{.asset_ids = {"t1", "t1"}});
  EXPECT_EQ(withdraw_duplicate.code,
            static_cast<uint32_t>(error_code::duplicate_asset));
  EXPECT_TRUE(fixture.host().pending_receipts().empty());
}

TEST_F(vault_test, batch_deposit_mints_per_settled_leg) {
  fixture.mint("t1", kAlice);
  fixture.mint("t2", kAlice);
  fixture.approve(kAlice, "t1", kVault);
  // t2 is not approved; only the first leg settles.
  auto outcome = fixture.call(kAlice, kVault,
                              batch_deposit_t{.asset_ids = {"t1", "t2"}});
  ASSERT_EQ(outcome.code, 0u) << outcome.log;
  fixture.settle();

  EXPECT_EQ(fixture.owner_of("t1"), kVault);
  EXPECT_EQ(fixture.owner_of("t2"), kAlice);
  EXPECT_EQ(fixture.shares_of(kVault, kAlice), contracts::kDefaultUnitValue);
  auto state = vault_state();
  ASSERT_EQ(state.intents.size(), 1u);
  EXPECT_EQ(state.intents.begin()->second.status,
            intent_status_t::partially_failed);
}

TEST_F(vault_test, batch_deposit_of_three_assets_mints_three_units) {
  for (const auto* token : {"t1", "t2", "t3"}) {
    fixture.mint(token, kAlice);
    fixture.approve(kAlice, token, kVault);
  }
  auto supply_before = vault_state().ledger.total_supply;
  auto outcome = fixture.call(
      kAlice, kVault, batch_deposit_t{.asset_ids = {"t1", "t2", "t3"}});
  ASSERT_EQ(outcome.code, 0u) << outcome.log;
  EXPECT_EQ(fixture.shares_of(kVault, kAlice), 0);
  fixture.settle();

  for (const auto* token : {"t1", "t2", "t3"}) {
    EXPECT_EQ(fixture.owner_of(token), kVault);
  }
  auto state = vault_state();
  EXPECT_EQ(fixture.shares_of(kVault, kAlice), 3 * contracts::kDefaultUnitValue);
  EXPECT_EQ(state.ledger.total_supply,
            supply_before + 3 * contracts::kDefaultUnitValue);
  EXPECT_TRUE(state.intents.empty());
  EXPECT_TRUE(sharevault::ledger::share_ledger{state.ledger}.is_consistent());
}

TEST_F(optimistic_vault_test, batch_deposit_of_three_assets_mints_three_units) {
  for (const auto* token : {"t1", "t2", "t3"}) {
    fixture.mint(token, kAlice);
    fixture.approve(kAlice, token, kVault);
  }
  auto supply_before = vault_state().ledger.total_supply;
  auto outcome = fixture.call(
      kAlice, kVault, batch_deposit_t{.asset_ids = {"t1", "t2", "t3"}});
  ASSERT_EQ(outcome.code, 0u) << outcome.log;
  EXPECT_EQ(fixture.shares_of(kVault, kAlice), 3 * contracts::kDefaultUnitValue);
  fixture.settle();

  for (const auto* token : {"t1", "t2", "t3"}) {
    EXPECT_EQ(fixture.owner_of(token), kVault);
  }
  auto state = vault_state();
  EXPECT_EQ(fixture.shares_of(kVault, kAlice), 3 * contracts::kDefaultUnitValue);
  EXPECT_EQ(state.ledger.total_supply,
            supply_before + 3 * contracts::kDefaultUnitValue);
  EXPECT_TRUE(sharevault::ledger::share_ledger{state.ledger}.is_consistent());
}

TEST_F(vault_test, deposit_of_an_asset_approved_by_someone_else_mints_nothing) {
  fixture.add_account(kMallory, whole_units(100),
                      component_kind_t::none);
  fixture.mint("t1", kBob);
  fixture.approve(kBob, "t1", kVault);

  // Mallory asks the vault to pull Bob's approved asset.
  auto outcome = fixture.call(kMallory, kVault, deposit_t{.asset_id = "t1"});
  ASSERT_EQ(outcome.code, 0u) << outcome.log;
  auto produced = fixture.settle();

  auto settled = find_outcome(produced, "on_transfer_settled");
  ASSERT_TRUE(settled.has_value());
  EXPECT_EQ(settled->code, static_cast<uint32_t>(error_code::asset_not_owned));
  EXPECT_EQ(fixture.owner_of("t1"), kBob);
  EXPECT_EQ(fixture.shares_of(kVault, kMallory), 0);
  EXPECT_EQ(fixture.shares_of(kVault, kBob), 0);
  auto state = vault_state();
  EXPECT_EQ(state.ledger.total_supply, contracts::kDefaultUnitValue);
  ASSERT_EQ(state.intents.size(), 1u);
  const auto& intent = state.intents.begin()->second;
  EXPECT_EQ(intent.status, intent_status_t::failed);
  EXPECT_EQ(intent.legs.front().failure, "asset was held by bob.test");

  // Bob can still deposit the returned asset himself.
  auto own = deposit_token_again(kBob, "t1");
  ASSERT_EQ(own.code, 0u) << own.log;
  fixture.settle();
  EXPECT_EQ(fixture.owner_of("t1"), kVault);
  EXPECT_EQ(fixture.shares_of(kVault, kBob), contracts::kDefaultUnitValue);
  EXPECT_EQ(fixture.shares_of(kVault, kMallory), 0);
}

TEST_F(vault_test, confirmed_withdraw_escrows_then_burns) {
  ASSERT_EQ(deposit_token(kAlice, "t1").code, 0u);
  fixture.settle();

  auto outcome = fixture.call(kAlice, kVault, withdraw_t{.asset_id = "t1"});
  ASSERT_EQ(outcome.code, 0u) << outcome.log;
  EXPECT_EQ(fixture.shares_of(kVault, kAlice), 0);
  EXPECT_EQ(vault_state().ledger.locked, contracts::kDefaultUnitValue);

  fixture.settle();
  EXPECT_EQ(fixture.owner_of("t1"), kAlice);
  auto state = vault_state();
  EXPECT_EQ(state.ledger.locked, 0);
  EXPECT_EQ(state.ledger.total_supply, contracts::kDefaultUnitValue);
  EXPECT_TRUE(state.intents.empty());
}

TEST_F(vault_test, withdraw_requires_enough_shares) {
  auto outcome = fixture.call(kAlice, kVault, withdraw_t{.asset_id = "t1"});
  EXPECT_EQ(outcome.code,
            static_cast<uint32_t>(error_code::insufficient_balance));
  EXPECT_EQ(outcome.log, "Token balance is smaller than the asset value");

  ASSERT_EQ(deposit_token(kAlice, "t1").code, 0u);
  fixture.settle();
  auto batch = fixture.call(kAlice, kVault,
                            batch_withdraw_t{.asset_ids = {"t1", "t2"}});
  EXPECT_EQ(batch.code, static_cast<uint32_t>(error_code::insufficient_balance));
  EXPECT_EQ(batch.log, "Token balance is smaller than the asset batch value");
}

TEST_F(vault_test, failed_withdraw_returns_escrowed_shares) {
  ASSERT_EQ(deposit_token(kAlice, "t1").code, 0u);
  fixture.settle();

  // The vault never held "ghost", so the transfer fails.
  auto outcome = fixture.call(kAlice, kVault, withdraw_t{.asset_id = "ghost"});
  ASSERT_EQ(outcome.code, 0u) << outcome.log;
  fixture.settle();
  auto state = vault_state();
  EXPECT_EQ(fixture.shares_of(kVault, kAlice), contracts::kDefaultUnitValue);
  EXPECT_EQ(state.ledger.locked, 0);
  EXPECT_TRUE(sharevault::ledger::share_ledger{state.ledger}.is_consistent());
}

TEST_F(abort_vault_test, aborted_callback_leaves_shares_escrowed) {
  ASSERT_EQ(deposit_token(kAlice, "t1").code, 0u);
  fixture.settle();

  ASSERT_EQ(fixture.call(kAlice, kVault, withdraw_t{.asset_id = "ghost"}).code,
            0u);
  auto produced = fixture.settle();
  auto settled = find_outcome(produced, "on_transfer_settled");
  ASSERT_TRUE(settled.has_value());
  EXPECT_EQ(settled->code,
            static_cast<uint32_t>(error_code::remote_step_failed));

  auto state = vault_state();
  EXPECT_EQ(fixture.shares_of(kVault, kAlice), 0);
  EXPECT_EQ(state.ledger.locked, contracts::kDefaultUnitValue);
  ASSERT_EQ(state.intents.size(), 1u);
  EXPECT_EQ(state.intents.begin()->second.status, intent_status_t::pending);
}

TEST_F(vault_test, swap_exchanges_assets_without_touching_shares) {
  ASSERT_EQ(deposit_token(kAlice, "t1").code, 0u);
  fixture.settle();
  fixture.mint("t2", kBob);
  fixture.approve(kBob, "t2", kVault);

  auto outcome =
      fixture.call(kBob, kVault, swap_t{.asset_in = "t2", .asset_out = "t1"});
  ASSERT_EQ(outcome.code, 0u) << outcome.log;
  fixture.settle();

  EXPECT_EQ(fixture.owner_of("t1"), kBob);
  EXPECT_EQ(fixture.owner_of("t2"), kVault);
  EXPECT_EQ(fixture.shares_of(kVault, kBob), 0);
  EXPECT_EQ(fixture.shares_of(kVault, kAlice), contracts::kDefaultUnitValue);
  EXPECT_TRUE(vault_state().intents.empty());

  auto same = fixture.call(kBob, kVault,
                           swap_t{.asset_in = "t2", .asset_out = "t2"});
  EXPECT_EQ(same.code, static_cast<uint32_t>(error_code::duplicate_asset));
}

TEST_F(vault_test, swap_with_an_asset_the_caller_does_not_own_releases_nothing) {
  ASSERT_EQ(deposit_token(kAlice, "t1").code, 0u);
  fixture.settle();
  fixture.add_account(kMallory, whole_units(100),
                      component_kind_t::none);
  fixture.mint("t2", kBob);
  fixture.approve(kBob, "t2", kVault);

  auto outcome = fixture.call(kMallory, kVault,
                              swap_t{.asset_in = "t2", .asset_out = "t1"});
  ASSERT_EQ(outcome.code, 0u) << outcome.log;
  auto produced = fixture.settle();

  auto settled = find_outcome(produced, "on_transfer_settled");
  ASSERT_TRUE(settled.has_value());
  EXPECT_EQ(settled->code, static_cast<uint32_t>(error_code::asset_not_owned));
  EXPECT_EQ(fixture.owner_of("t1"), kVault);
  EXPECT_EQ(fixture.owner_of("t2"), kBob);
  auto state = vault_state();
  ASSERT_EQ(state.intents.size(), 1u);
  const auto& intent = state.intents.begin()->second;
  EXPECT_EQ(intent.status, intent_status_t::failed);
  ASSERT_EQ(intent.legs.size(), 2u);
  EXPECT_EQ(intent.legs[0].status, intent_status_t::failed);
  EXPECT_EQ(intent.legs[1].status, intent_status_t::failed);
  EXPECT_EQ(fixture.shares_of(kVault, kAlice), contracts::kDefaultUnitValue);
}

TEST_F(vault_test, ft_transfer_needs_one_unit_and_a_registered_receiver) {
  ASSERT_EQ(deposit_token(kAlice, "t1").code, 0u);
  fixture.settle();
  auto amount = contracts::kDefaultUnitValue / 4;

  auto no_deposit = fixture.call(
      kAlice, kVault, ft_transfer_t{.receiver = kBob, .amount = amount});
  EXPECT_EQ(no_deposit.code,
            static_cast<uint32_t>(error_code::deposit_required));

  auto unregistered = fixture.call(
      kAlice, kVault, ft_transfer_t{.receiver = kBob, .amount = amount},
      contracts::kOneUnitDeposit);
  EXPECT_EQ(unregistered.code,
            static_cast<uint32_t>(error_code::account_not_registered));

  auto registered = fixture.call(kBob, kVault, storage_deposit_t{});
  ASSERT_EQ(registered.code, 0u) << registered.log;
  EXPECT_TRUE(decode_as<bool>(registered.data));

  auto transfer = fixture.call(
      kAlice, kVault,
      ft_transfer_t{.receiver = kBob, .amount = amount, .memo = "rent"},
      contracts::kOneUnitDeposit);
  ASSERT_EQ(transfer.code, 0u) << transfer.log;
  EXPECT_EQ(fixture.shares_of(kVault, kBob), amount);
  EXPECT_EQ(fixture.shares_of(kVault, kAlice),
            contracts::kDefaultUnitValue - amount);
  ASSERT_EQ(transfer.events.size(), 1u);
  EXPECT_EQ(transfer.events.front().type, "ft_transfer");
}

TEST_F(vault_test, ft_transfer_call_refunds_everything_a_plain_account_rejects) {
  ASSERT_EQ(deposit_token(kAlice, "t1").code, 0u);
  fixture.settle();
  ASSERT_EQ(fixture.call(kBob, kVault, storage_deposit_t{}).code, 0u);
  auto amount = contracts::kDefaultUnitValue / 4;

  auto no_deposit = fixture.call(
      kAlice, kVault, ft_transfer_call_t{.receiver = kBob, .amount = amount});
  EXPECT_EQ(no_deposit.code,
            static_cast<uint32_t>(error_code::deposit_required));

  auto outcome = fixture.call(
      kAlice, kVault,
      ft_transfer_call_t{.receiver = kBob, .amount = amount, .msg = "list"},
      contracts::kOneUnitDeposit);
  ASSERT_EQ(outcome.code, 0u) << outcome.log;
  auto produced = fixture.settle();

  auto notified = find_outcome(produced, "ft_on_transfer");
  ASSERT_TRUE(notified.has_value());
  EXPECT_EQ(notified->code,
            static_cast<uint32_t>(error_code::component_missing));
  auto resolved = find_outcome(produced, "ft_resolve_transfer");
  ASSERT_TRUE(resolved.has_value());
  ASSERT_EQ(resolved->code, 0u) << resolved->log;
  EXPECT_EQ(decode_as<amount_t>(resolved->data), 0);
  EXPECT_EQ(fixture.shares_of(kVault, kAlice), contracts::kDefaultUnitValue);
  EXPECT_EQ(fixture.shares_of(kVault, kBob), 0);
  EXPECT_TRUE(
      sharevault::ledger::share_ledger{vault_state().ledger}.is_consistent());
}

TEST_F(vault_test, ft_transfer_call_refunds_the_unused_amount) {
  ASSERT_EQ(deposit_token(kAlice, "t1").code, 0u);
  fixture.settle();
  auto amount = contracts::kDefaultUnitValue / 2;
  auto unused = contracts::kDefaultUnitValue / 8;
  fixture.host().install(std::make_unique<market>(unused));
  fixture.add_account(kMarket, {}, component_kind_t::registry);
  ASSERT_EQ(
      fixture.call(kAlice, kVault, storage_deposit_t{.account = kMarket}).code,
      0u);

  auto outcome = fixture.call(
      kAlice, kVault,
      ft_transfer_call_t{.receiver = kMarket, .amount = amount},
      contracts::kOneUnitDeposit);
  ASSERT_EQ(outcome.code, 0u) << outcome.log;
  auto produced = fixture.settle();

  auto resolved = find_outcome(produced, "ft_resolve_transfer");
  ASSERT_TRUE(resolved.has_value());
  ASSERT_EQ(resolved->code, 0u) << resolved->log;
  EXPECT_EQ(decode_as<amount_t>(resolved->data), amount - unused);
  EXPECT_EQ(fixture.shares_of(kVault, kMarket), amount - unused);
  EXPECT_EQ(fixture.shares_of(kVault, kAlice),
            contracts::kDefaultUnitValue - amount + unused);

  // The resolution is private to the vault.
  auto direct = fixture.call(
      kAlice, kVault,
      ft_resolve_transfer_t{
          .sender = kAlice, .receiver = kMarket, .amount = amount});
  EXPECT_EQ(direct.code, static_cast<uint32_t>(error_code::unauthorized));
}

TEST_F(vault_test, storage_views_and_withdraw_report_a_free_registration) {
  auto bounds = contracts::make_storage_balance_bounds();
  EXPECT_EQ(bounds.min, 0);
  ASSERT_TRUE(bounds.max.has_value());
  EXPECT_EQ(*bounds.max, 0);
  EXPECT_FALSE(contracts::make_storage_balance(vault_state(), kBob).has_value());

  auto unregistered = fixture.call(kBob, kVault, storage_withdraw_t{},
                                   contracts::kOneUnitDeposit);
  EXPECT_EQ(unregistered.code,
            static_cast<uint32_t>(error_code::account_not_registered));

  ASSERT_EQ(fixture.call(kBob, kVault, storage_deposit_t{}).code, 0u);
  auto balance = contracts::make_storage_balance(vault_state(), kBob);
  ASSERT_TRUE(balance.has_value());
  EXPECT_EQ(balance->total, 0);
  EXPECT_EQ(balance->available, 0);

  auto no_deposit = fixture.call(kBob, kVault, storage_withdraw_t{});
  EXPECT_EQ(no_deposit.code,
            static_cast<uint32_t>(error_code::deposit_required));
  auto too_much = fixture.call(kBob, kVault,
                               storage_withdraw_t{.amount = amount_t{1}},
                               contracts::kOneUnitDeposit);
  EXPECT_EQ(too_much.code, static_cast<uint32_t>(error_code::invalid_amount));
  auto withdrawn = fixture.call(kBob, kVault, storage_withdraw_t{},
                                contracts::kOneUnitDeposit);
  ASSERT_EQ(withdrawn.code, 0u) << withdrawn.log;
  EXPECT_EQ(decode_as<storage_balance_t>(withdrawn.data).total, 0);
}

TEST_F(vault_test, storage_deposit_is_idempotent) {
  auto first = fixture.call(kBob, kVault, storage_deposit_t{});
  auto second = fixture.call(kAlice, kVault, storage_deposit_t{.account = kBob});
  ASSERT_EQ(first.code, 0u);
  ASSERT_EQ(second.code, 0u);
  EXPECT_TRUE(decode_as<bool>(first.data));
  EXPECT_FALSE(decode_as<bool>(second.data));
}

TEST_F(vault_test, storage_unregister_burns_only_when_forced) {
  ASSERT_EQ(deposit_token(kAlice, "t1").code, 0u);
  fixture.settle();

  auto refused = fixture.call(kAlice, kVault, storage_unregister_t{},
                              contracts::kOneUnitDeposit);
  EXPECT_EQ(refused.code, static_cast<uint32_t>(error_code::nonzero_balance));

  auto forced = fixture.call(kAlice, kVault,
                             storage_unregister_t{.force = true},
                             contracts::kOneUnitDeposit);
  ASSERT_EQ(forced.code, 0u) << forced.log;
  EXPECT_TRUE(decode_as<bool>(forced.data));
  auto state = vault_state();
  EXPECT_FALSE(state.ledger.balances.contains(kAlice));
  EXPECT_EQ(state.ledger.total_supply, contracts::kDefaultUnitValue);

  auto again = fixture.call(kAlice, kVault, storage_unregister_t{},
                            contracts::kOneUnitDeposit);
  ASSERT_EQ(again.code, 0u);
  EXPECT_FALSE(decode_as<bool>(again.data));
}

TEST_F(vault_test, set_params_only_from_the_registry) {
  auto direct = fixture.call(kAlice, kVault,
                             set_params_t{.name = "n",
                                          .symbol = "S",
                                          .unit_value = 5});
  EXPECT_EQ(direct.code, static_cast<uint32_t>(error_code::unauthorized));
  auto unchanged = vault_state();
  EXPECT_EQ(unchanged.name, "ART vault");
  EXPECT_EQ(unchanged.symbol, "ART");
  EXPECT_EQ(unchanged.unit_value, contracts::kDefaultUnitValue);

  auto forwarded = fixture.call(
      kAdmin, kRegistry,
      set_vault_params_t{.vault = kVault,
                         .name = "Renamed",
                         .symbol = "REN",
                         .unit_value = whole_units(10),
                         .media = "ipfs://ren"});
  ASSERT_EQ(forwarded.code, 0u) << forwarded.log;
  fixture.settle();
  auto state = vault_state();
  EXPECT_EQ(state.name, "Renamed");
  EXPECT_EQ(state.symbol, "REN");
  EXPECT_EQ(state.unit_value, whole_units(10));
  EXPECT_EQ(state.metadata.symbol, "REN");
  auto info = public_vault_info_t{};
  ASSERT_EQ(contracts::make_public_info(state, info), error_code::ok);
  EXPECT_EQ(info.name, "Renamed");
  EXPECT_EQ(info.symbol, "REN");
}

TEST(vault_info, reports_supply_underflow) {
  auto state = vault_state_t{};
  auto info = public_vault_info_t{};
  EXPECT_EQ(contracts::make_public_info(state, info),
            error_code::not_initialized);
  state.initialized = true;
  state.unit_value = 10;
  state.ledger.total_supply = 9;
  EXPECT_EQ(contracts::make_public_info(state, info),
            error_code::supply_underflow);
  state.ledger.total_supply = 35;
  ASSERT_EQ(contracts::make_public_info(state, info), error_code::ok);
  EXPECT_EQ(info.reported_supply, 2);
}

}  // namespace
