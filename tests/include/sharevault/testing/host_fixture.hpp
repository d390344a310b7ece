#pragma once

#include <sharevault/contracts/constants.hpp>
#include <sharevault/contracts/nft_registry.hpp>
#include <sharevault/contracts/registry.hpp>
#include <sharevault/contracts/vault.hpp>
#include <sharevault/runtime/host.hpp>
#include <sharevault/schema/nft_registry_state.hpp>
#include <sharevault/schema/registry_state.hpp>
#include <sharevault/schema/vault_state.hpp>
#include <sharevault/testing/common.hpp>

#include <gtest/gtest.h>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace sharevault::testing {

inline const auto kAdmin = sharevault::schema::account_id_t{"admin.test"};
inline const auto kRegistry = sharevault::schema::account_id_t{"registry.test"};
inline const auto kAssets = sharevault::schema::account_id_t{"assets.test"};
inline const auto kAlice = sharevault::schema::account_id_t{"alice.test"};
inline const auto kBob = sharevault::schema::account_id_t{"bob.test"};

struct host_settings final {
  runtime::host_options host;
  runtime::settlement_mode_t settlement_mode{
      runtime::settlement_mode_t::confirmed};
  runtime::remote_failure_policy_t failure_policy{
      runtime::remote_failure_policy_t::propagate};
  runtime::record_commit_mode_t record_commit_mode{
      runtime::record_commit_mode_t::confirmed};
  sharevault::schema::amount_t vault_funding{contracts::kDefaultVaultFunding};
};

/// In-memory world with a registry, one asset registry and two users,
/// driven block by block.
class host_fixture final {
 public:
  explicit host_fixture(host_settings settings = {})
      : settings_{std::move(settings)}, host_{settings_.host} {
    host_.install(std::make_unique<contracts::registry>(
        contracts::registry_options{
            .record_commit_mode = settings_.record_commit_mode,
            .failure_policy = settings_.failure_policy,
            .vault_funding = settings_.vault_funding}));
    host_.install(std::make_unique<contracts::vault>(
        contracts::vault_options{.settlement_mode = settings_.settlement_mode,
                                 .failure_policy = settings_.failure_policy}));
    host_.install(std::make_unique<contracts::nft_registry>());

    add_account(kAdmin, whole_units(1000), schema::component_kind_t::none);
    add_account(kAlice, whole_units(100), schema::component_kind_t::none);
    add_account(kBob, whole_units(100), schema::component_kind_t::none);
    add_account(kRegistry, whole_units(1000),
                schema::component_kind_t::registry);
    add_account(kAssets, {}, schema::component_kind_t::nft_registry);

    auto encoder = scale_encoder_t{};
    auto registry = schema::registry_state_t{};
    registry.initialized = true;
    registry.owner = kAdmin;
    host_.put_contract_state(kRegistry, encoder.encode(registry));
    auto assets = schema::nft_registry_state_t{};
    assets.owner = kAdmin;
    host_.put_contract_state(kAssets, encoder.encode(assets));
    static_cast<void>(host_.take_changes());
  }

  runtime::host& host() { return host_; }
  int64_t height() const { return height_; }

  void add_account(const schema::account_id_t& account,
                   const schema::amount_t& balance,
                   const schema::component_kind_t kind) {
    auto record = schema::account_record_t{};
    record.account_id = account;
    record.balance = balance;
    record.kind = kind;
    host_.put_account(std::move(record));
  }

  /// Run a transaction's first step in a new block.
  schema::receipt_outcome_t call(const schema::account_id_t& signer,
                                 const schema::account_id_t& receiver,
                                 schema::method_call_t method,
                                 const schema::amount_t& deposit = {},
                                 const schema::gas_t gas =
                                     300 * schema::kTeraGas) {
    ++height_;
    auto tx = schema::transaction_t{};
    tx.chain_id = schema::make_zero_hash();
    tx.nonce = ++nonce_;
    tx.signer = signer;
    tx.receiver = receiver;
    tx.call = std::move(method);
    tx.gas = gas;
    tx.deposit = deposit;
    auto outcome = host_.execute_transaction(tx, height_);
    auto ready = host_.execute_ready_receipts(height_);
    outcomes_.insert(std::end(outcomes_), std::begin(ready), std::end(ready));
    return outcome;
  }

  /// Execute the receipts that are ready in the next block.
  std::vector<schema::receipt_outcome_t> advance() {
    ++height_;
    auto ready = host_.execute_ready_receipts(height_);
    outcomes_.insert(std::end(outcomes_), std::begin(ready), std::end(ready));
    return ready;
  }

  /// Advance until no receipt is pending; returns every outcome produced.
  std::vector<schema::receipt_outcome_t> settle(const int max_blocks = 32) {
    auto produced = std::vector<schema::receipt_outcome_t>{};
    for (auto i = 0; i < max_blocks && !host_.pending_receipts().empty();
         ++i) {
      auto ready = advance();
      produced.insert(std::end(produced), std::begin(ready), std::end(ready));
    }
    EXPECT_TRUE(host_.pending_receipts().empty());
    return produced;
  }

  template <typename State>
  State state_of(const schema::account_id_t& account) const {
    const auto* bytes = host_.find_contract_state(account);
    EXPECT_NE(bytes, nullptr);
    if (bytes == nullptr) {
      return State{};
    }
    return decode_as<State>(*bytes);
  }

  schema::amount_t balance_of(const schema::account_id_t& account) const {
    const auto* record = host_.find_account(account);
    return record == nullptr ? schema::amount_t{} : record->balance;
  }

  schema::amount_t shares_of(const schema::account_id_t& vault,
                             const schema::account_id_t& account) const {
    auto state = state_of<schema::vault_state_t>(vault);
    auto it = state.ledger.balances.find(account);
    return it == std::end(state.ledger.balances) ? schema::amount_t{}
                                                 : it->second;
  }

  void mint(const schema::asset_id_t& token, const schema::account_id_t& owner) {
    auto outcome = call(kAdmin, kAssets,
                        schema::nft_mint_t{.token_id = token, .owner = owner});
    ASSERT_EQ(outcome.code, 0u) << outcome.log;
  }

  void approve(const schema::account_id_t& owner,
               const schema::asset_id_t& token,
               const schema::account_id_t& account) {
    auto outcome = call(owner, kAssets,
                        schema::nft_approve_t{.token_id = token,
                                              .account = account});
    ASSERT_EQ(outcome.code, 0u) << outcome.log;
  }

  /// Request a vault for `origin` and settle its provisioning.
  schema::account_id_t create_vault(const schema::account_id_t& origin,
                                    const std::string& symbol) {
    auto outcome = call(kAdmin, kRegistry,
                        schema::create_vault_t{.name = symbol + " vault",
                                               .origin = origin,
                                               .symbol = symbol,
                                               .media = "ipfs://" + symbol});
    EXPECT_EQ(outcome.code, 0u) << outcome.log;
    settle();
    return contracts::derive_vault_address(symbol, kRegistry);
  }

  schema::asset_id_t owner_of(const schema::asset_id_t& token) const {
    auto state = state_of<schema::nft_registry_state_t>(kAssets);
    auto it = state.tokens.find(token);
    return it == std::end(state.tokens) ? schema::account_id_t{}
                                        : it->second.owner;
  }

  const std::vector<schema::receipt_outcome_t>& outcomes() const {
    return outcomes_;
  }

 private:
  host_settings settings_;
  runtime::host host_;
  int64_t height_{};
  uint64_t nonce_{};
  std::vector<schema::receipt_outcome_t> outcomes_;
};

inline std::optional<schema::receipt_outcome_t> find_outcome(
    const std::vector<schema::receipt_outcome_t>& outcomes,
    const std::string& method) {
  for (auto it = outcomes.rbegin(); it != outcomes.rend(); ++it) {
    if (it->method == method) {
      return *it;
    }
  }
  return std::nullopt;
}

}  // namespace sharevault::testing
