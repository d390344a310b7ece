#pragma once

#include <sharevault/contracts/constants.hpp>
#include <sharevault/runtime/host.hpp>
#include <sharevault/runtime/modes.hpp>
#include <sharevault/schema/primitives.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace sharevault::execution {

/// Plain account funded at genesis. Only accounts with a public key can
/// sign transactions.
struct genesis_account final {
  sharevault::schema::account_id_t account_id;
  sharevault::schema::amount_t balance{};
  std::optional<sharevault::schema::ed25519_public_key_t> public_key;
};

/// Runtime options of the engine, filled from the command line and config
/// file by the daemon.
struct engine_options final {
  std::string db_path{"sharevault.db"};
  std::string chain_name{"sharevault-local"};
  runtime::host_options host;
  runtime::settlement_mode_t settlement_mode{
      runtime::settlement_mode_t::confirmed};
  runtime::remote_failure_policy_t failure_policy{
      runtime::remote_failure_policy_t::propagate};
  runtime::record_commit_mode_t record_commit_mode{
      runtime::record_commit_mode_t::confirmed};
  sharevault::schema::amount_t vault_funding{contracts::kDefaultVaultFunding};
  /// Verify every transaction's ed25519 signature against the signer's key.
  bool require_signatures{true};
  /// Receipt outcomes older than this many blocks are pruned; 0 keeps all.
  int64_t outcome_retention_blocks{10'000};

  sharevault::schema::account_id_t registry_account{"registry.sharevault"};
  sharevault::schema::amount_t registry_balance{
      1000 * sharevault::schema::kWholeUnit};
  sharevault::schema::account_id_t admin_account{"admin.sharevault"};
  sharevault::schema::amount_t admin_balance{
      1000 * sharevault::schema::kWholeUnit};
  std::optional<sharevault::schema::ed25519_public_key_t> admin_public_key;
  /// Each gets a reference asset registry owned by the admin.
  std::vector<sharevault::schema::account_id_t> asset_registry_accounts{
      "assets.sharevault"};
  std::vector<genesis_account> accounts;
};

/// The chain id transactions must carry: BLAKE3 of the chain name.
sharevault::schema::hash32_t make_chain_id(std::string_view chain_name);

/// Parse "account=amount" or "account=amount:public_key_hex".
std::optional<genesis_account> try_parse_genesis_account(
    std::string_view value);

}  // namespace sharevault::execution
