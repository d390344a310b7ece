#pragma once

#include <sharevault/execution/options.hpp>
#include <sharevault/execution/signature_verifier.hpp>
#include <sharevault/runtime/host.hpp>
#include <sharevault/schema/app_info.hpp>
#include <sharevault/schema/block_result.hpp>
#include <sharevault/schema/commit_result.hpp>
#include <sharevault/schema/component_kind.hpp>
#include <sharevault/schema/primitives.hpp>
#include <sharevault/schema/query_result.hpp>
#include <sharevault/schema/transaction.hpp>
#include <sharevault/schema/transaction_result.hpp>
#include <sharevault/storage/rocksdb/storage.hpp>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string_view>
#include <vector>

namespace sharevault::execution {

/// Deterministic vault registry state machine driven block by block.
///
/// The engine admits transactions, runs them and every receipt that became
/// ready through the host, folds each block's writes into a BLAKE3 state
/// root and persists them to RocksDB on commit. Queries read the latest
/// finalized state.
class engine final {
 public:
  /// Open (or create) the database at `options.db_path`. A fresh database is
  /// seeded with the genesis accounts and committed at height 0.
  explicit engine(engine_options options);

  /// Admit a transaction for mempool inclusion (CheckTx semantics).
  ///
  /// Performs decode + validation checks only; does not mutate state.
  sharevault::schema::transaction_result_t check_transaction(
      const sharevault::schema::bytes_view_t& raw_tx);

  /// Execute the block's transactions in order, then every receipt ready at
  /// `height`, and compute the resulting state root. A height at or below
  /// the last finalized one rejects every transaction and changes nothing.
  sharevault::schema::block_result_t finalize_block(
      int64_t height,
      const std::vector<sharevault::schema::bytes_t>& txs);

  /// Persist the latest finalized block atomically.
  sharevault::schema::commit_result_t commit();

  /// Return application metadata (latest committed height and state_root).
  sharevault::schema::app_info_t info() const;

  /// Execute a read-only query by route. `data` carries the SCALE-encoded
  /// route argument; the result value is SCALE-encoded.
  sharevault::schema::query_result_t query(
      std::string_view path,
      const sharevault::schema::bytes_view_t& data);

  const engine_options& options() const;

  /// Replace the ed25519 verifier used when signatures are required.
  void set_signature_verifier(signature_verifier_t verifier);

 private:
  /// Validate envelope, chain id, signer, signature, gas and nonce.
  sharevault::schema::transaction_result_t validate_transaction(
      const sharevault::schema::transaction_t& tx,
      std::string_view codespace) const;

  sharevault::schema::transaction_result_t execute_transaction(
      const sharevault::schema::transaction_t& tx,
      int64_t height);

  void install_components();
  void bootstrap_genesis();
  void load_persisted_state();
  void merge_changes(runtime::change_set changes);
  /// Queue erasure of the outcomes recorded `outcome_retention_blocks` ago.
  void prune_outcomes(int64_t height);
  storage::write_set make_write_set() const;
  sharevault::schema::app_info_t make_info() const;

  template <typename State>
  std::optional<State> load_state(
      const sharevault::schema::account_id_t& account,
      sharevault::schema::component_kind_t kind) const;

  mutable std::mutex mutex_;
  engine_options options_;
  sharevault::schema::hash32_t chain_id_{};
  storage::storage<storage::rocksdb_storage_tag> storage_;
  runtime::host host_;
  std::map<sharevault::schema::account_id_t, uint64_t> nonces_;
  std::set<sharevault::schema::account_id_t> dirty_nonces_;
  runtime::change_set pending_changes_;
  std::vector<sharevault::schema::bytes_t> pruned_keys_;
  signature_verifier_t signature_verifier_;
  int64_t last_committed_height_{};
  sharevault::schema::hash32_t last_committed_state_root_{};
  int64_t pending_height_{};
  sharevault::schema::hash32_t pending_state_root_{};
};

}  // namespace sharevault::execution
