#include <spdlog/spdlog.h>
#include <sharevault/blake3/hash.hpp>
#include <sharevault/common/critical.hpp>
#include <sharevault/contracts/nft_registry.hpp>
#include <sharevault/contracts/registry.hpp>
#include <sharevault/contracts/vault.hpp>
#include <sharevault/crypto/verify.hpp>
#include <sharevault/execution/engine.hpp>
#include <sharevault/ledger/share_ledger.hpp>
#include <sharevault/schema/encoding/scale/encoder.hpp>
#include <sharevault/schema/key/engine_keys.hpp>
#include <sharevault/schema/nft_registry_state.hpp>
#include <sharevault/schema/query_error_code.hpp>
#include <sharevault/schema/registry_state.hpp>
#include <sharevault/schema/vault_state.hpp>

#include <algorithm>
#include <iterator>
#include <memory>
#include <string>
#include <tuple>
#include <utility>

using namespace sharevault::schema;

namespace {

using encoder_t = sharevault::schema::encoding::encoder<
    sharevault::schema::encoding::scale_encoder_tag>;

constexpr auto kCheckTxCodespace = std::string_view{"sharevault.checktx"};
constexpr auto kFinalizeCodespace = std::string_view{"sharevault.finalize"};
constexpr auto kQueryCodespace = std::string_view{"sharevault.query"};

std::optional<transaction_t> decode_transaction(const bytes_view_t& raw_tx,
                                                std::string& error) {
  if (raw_tx.empty()) {
    error = "empty transaction";
    return std::nullopt;
  }
  auto encoder = encoder_t{};
  auto tx = encoder.try_decode<transaction_t>(raw_tx);
  if (!tx) {
    error = "malformed SCALE transaction";
  }
  return tx;
}

transaction_result_t make_error_result(const error_code code,
                                       const std::string_view codespace,
                                       std::string info = {}) {
  auto result = transaction_result_t{};
  result.code = static_cast<uint32_t>(code);
  result.log = std::string{describe(code)};
  result.info = std::move(info);
  result.codespace = std::string{codespace};
  return result;
}

/// Chain the previous root with every write of the block, in key order.
hash32_t fold_state_root(const hash32_t& previous,
                         const int64_t height,
                         const sharevault::storage::write_set& writes) {
  auto encoder = encoder_t{};
  auto hasher = sharevault::blake3::hasher{};
  hasher.update(bytes_view_t{previous});
  auto encoded_height = encoder.encode(height);
  hasher.update(bytes_view_t{encoded_height});
  for (const auto& [key, value] : writes.puts) {
    auto framed = encoder.encode(std::tuple{key, value});
    hasher.update(bytes_view_t{framed});
  }
  for (const auto& key : writes.erases) {
    auto framed = encoder.encode(key);
    hasher.update(bytes_view_t{framed});
  }
  return hasher.finalize();
}

std::optional<account_id_t> account_from_key(const bytes_t& key,
                                             const bytes_t& prefix) {
  if (key.size() < prefix.size()) {
    return std::nullopt;
  }
  auto encoder = encoder_t{};
  return encoder.try_decode<account_id_t>(
      bytes_view_t{key}.subspan(prefix.size()));
}

template <typename T>
std::optional<T> decode_argument(const bytes_view_t& data) {
  auto encoder = encoder_t{};
  return encoder.try_decode<T>(data);
}

}  // namespace

namespace sharevault::execution {

engine::engine(engine_options options)
    : options_{std::move(options)},
      chain_id_{make_chain_id(options_.chain_name)},
      host_{options_.host},
      signature_verifier_{sharevault::crypto::verify_signature} {
  auto lock = std::scoped_lock{mutex_};
  spdlog::info("Initializing execution engine with RocksDB path '{}'",
               options_.db_path);
  spdlog::info(
      "Settlement mode '{}', failure policy '{}', record commit mode '{}', "
      "delivery order '{}'",
      runtime::to_string(options_.settlement_mode),
      runtime::to_string(options_.failure_policy),
      runtime::to_string(options_.record_commit_mode),
      runtime::to_string(options_.host.delivery_order));
  if (options_.record_commit_mode == runtime::record_commit_mode_t::eager) {
    spdlog::warn(
        "Eager record commit appends vault records before provisioning is "
        "confirmed");
  }
  if (options_.settlement_mode == runtime::settlement_mode_t::optimistic) {
    spdlog::warn(
        "Optimistic settlement leaves funds at risk until remote "
        "confirmation");
  }
  if (!options_.require_signatures) {
    spdlog::warn("Transaction signatures are not verified");
  } else if (!sharevault::crypto::available()) {
    spdlog::error("OpenSSL does not provide ed25519");
    sharevault::common::critical("signature verification unavailable");
  }

  storage_ = storage::make_storage<storage::rocksdb_storage_tag>(
      options_.db_path);
  install_components();
  load_persisted_state();
  spdlog::info("Execution engine ready at height {} with {} pending receipt(s)",
               last_committed_height_, host_.pending_receipts().size());
}

const engine_options& engine::options() const {
  return options_;
}

void engine::set_signature_verifier(signature_verifier_t verifier) {
  auto lock = std::scoped_lock{mutex_};
  signature_verifier_ = std::move(verifier);
}

transaction_result_t engine::check_transaction(const bytes_view_t& raw_tx) {
  auto lock = std::scoped_lock{mutex_};
  auto decode_error = std::string{};
  auto maybe_tx = decode_transaction(raw_tx, decode_error);
  if (!maybe_tx) {
    return make_error_result(error_code::invalid_transaction,
                             kCheckTxCodespace, decode_error);
  }
  return validate_transaction(*maybe_tx, kCheckTxCodespace);
}

block_result_t engine::finalize_block(const int64_t height,
                                      const std::vector<bytes_t>& txs) {
  auto lock = std::scoped_lock{mutex_};
  auto result = block_result_t{};
  result.tx_results.reserve(txs.size());
  if (height <= pending_height_) {
    spdlog::error("Rejecting block {} at or below finalized height {}", height,
                  pending_height_);
    for (std::size_t i = 0; i < txs.size(); ++i) {
      result.tx_results.push_back(make_error_result(
          error_code::invalid_block_height, kFinalizeCodespace,
          "last finalized height is " + std::to_string(pending_height_)));
    }
    result.state_root = pending_state_root_;
    return result;
  }

  for (const auto& raw_tx : txs) {
    auto decode_error = std::string{};
    auto maybe_tx = decode_transaction(bytes_view_t{raw_tx}, decode_error);
    if (!maybe_tx) {
      result.tx_results.push_back(make_error_result(
          error_code::invalid_transaction, kFinalizeCodespace, decode_error));
      continue;
    }
    auto validation = validate_transaction(*maybe_tx, kFinalizeCodespace);
    if (validation.code != 0) {
      result.tx_results.push_back(std::move(validation));
      continue;
    }
    result.tx_results.push_back(execute_transaction(*maybe_tx, height));
  }
  result.receipt_outcomes = host_.execute_ready_receipts(height);
  merge_changes(host_.take_changes());
  prune_outcomes(height);

  pending_height_ = height;
  pending_state_root_ =
      fold_state_root(pending_state_root_, height, make_write_set());
  result.state_root = pending_state_root_;
  spdlog::debug("Finalized height {} with {} tx(s) and {} receipt(s)", height,
                result.tx_results.size(), result.receipt_outcomes.size());
  return result;
}

commit_result_t engine::commit() {
  auto lock = std::scoped_lock{mutex_};
  if (pending_height_ > last_committed_height_) {
    storage_.commit(make_write_set(),
                    storage::committed_state{.height = pending_height_,
                                             .state_root = pending_state_root_});
    last_committed_height_ = pending_height_;
    last_committed_state_root_ = pending_state_root_;
    pending_changes_ = runtime::change_set{};
    pruned_keys_.clear();
    dirty_nonces_.clear();
    spdlog::debug("Committed height {}", last_committed_height_);
  }

  auto result = commit_result_t{};
  result.retain_height = 0;
  result.committed_height = last_committed_height_;
  result.state_root = last_committed_state_root_;
  return result;
}

app_info_t engine::info() const {
  auto lock = std::scoped_lock{mutex_};
  return make_info();
}

app_info_t engine::make_info() const {
  auto result = app_info_t{};
  result.last_block_height = last_committed_height_;
  result.last_block_state_root = last_committed_state_root_;
  return result;
}

query_result_t engine::query(const std::string_view path,
                             const bytes_view_t& data) {
  auto lock = std::scoped_lock{mutex_};
  auto encoder = encoder_t{};
  auto result = query_result_t{};
  result.key = make_bytes(data);
  result.height = pending_height_;
  result.codespace = std::string{kQueryCodespace};

  auto reject = [&](const query_error_code code, std::string log) {
    result.code = static_cast<uint32_t>(code);
    result.log = std::move(log);
    return result;
  };
  auto respond = [&](const auto& value) {
    result.value = encoder.encode(value);
    return result;
  };

  if (path == "/engine/info") {
    return respond(make_info());
  }
  if (path == "/engine/pending_receipts") {
    auto receipts = std::vector<receipt_t>{};
    for (const auto& [receipt_id, receipt] : host_.pending_receipts()) {
      static_cast<void>(receipt_id);
      receipts.push_back(receipt);
    }
    return respond(receipts);
  }
  if (path == "/receipt/outcome") {
    auto receipt_id = decode_argument<uint64_t>(data);
    if (!receipt_id) {
      return reject(query_error_code::invalid_key, "expected receipt id");
    }
    auto pending = std::find_if(
        std::rbegin(pending_changes_.outcomes),
        std::rend(pending_changes_.outcomes),
        [&](const auto& outcome) { return outcome.receipt_id == *receipt_id; });
    if (pending != std::rend(pending_changes_.outcomes)) {
      return respond(*pending);
    }
    auto key = key::make_outcome_key(encoder, *receipt_id);
    auto stored = storage_.get<encoder_t, receipt_outcome_t>(
        encoder, bytes_view_t{key});
    if (!stored) {
      return reject(query_error_code::not_found, "outcome not found");
    }
    return respond(*stored);
  }
  if (path == "/account") {
    auto account = decode_argument<account_id_t>(data);
    if (!account) {
      return reject(query_error_code::invalid_key, "expected account id");
    }
    const auto* record = host_.find_account(*account);
    if (record == nullptr) {
      return reject(query_error_code::not_found, "account not found");
    }
    return respond(*record);
  }

  if (path.starts_with("/vault/")) {
    auto vault_account = account_id_t{};
    auto holder = account_id_t{};
    if (path == "/vault/ft_balance_of" ||
        path == "/vault/storage_balance_of") {
      auto args = decode_argument<std::tuple<account_id_t, account_id_t>>(data);
      if (!args) {
        return reject(query_error_code::invalid_key,
                      "expected (vault, account)");
      }
      std::tie(vault_account, holder) = std::move(*args);
    } else {
      auto account = decode_argument<account_id_t>(data);
      if (!account) {
        return reject(query_error_code::invalid_key, "expected vault account");
      }
      vault_account = std::move(*account);
    }
    auto state = load_state<vault_state_t>(vault_account,
                                           component_kind_t::vault);
    if (!state || !state->initialized) {
      return reject(query_error_code::not_found, "vault not found");
    }
    auto shares = ledger::share_ledger{state->ledger};
    if (path == "/vault/info") {
      auto info = public_vault_info_t{};
      auto code = contracts::make_public_info(*state, info);
      if (code != error_code::ok) {
        return reject(query_error_code::rejected, std::string{describe(code)});
      }
      return respond(info);
    }
    if (path == "/vault/ft_total_supply") {
      return respond(shares.total_supply());
    }
    if (path == "/vault/ft_balance_of") {
      return respond(shares.balance_of(holder));
    }
    if (path == "/vault/ft_metadata") {
      return respond(state->metadata);
    }
    if (path == "/vault/storage_balance_of") {
      return respond(contracts::make_storage_balance(*state, holder));
    }
    if (path == "/vault/storage_balance_bounds") {
      return respond(contracts::make_storage_balance_bounds());
    }
    if (path == "/vault/intents") {
      auto intents = std::vector<settlement_intent_t>{};
      for (const auto& [intent_id, intent] : state->intents) {
        static_cast<void>(intent_id);
        intents.push_back(intent);
      }
      return respond(intents);
    }
    return reject(query_error_code::unsupported_path, "unsupported path");
  }

  if (path.starts_with("/registry/")) {
    auto state = load_state<registry_state_t>(options_.registry_account,
                                              component_kind_t::registry);
    if (!state) {
      return reject(query_error_code::not_found, "registry not found");
    }
    if (path == "/registry/vault_count") {
      return respond(state->counter);
    }
    if (path == "/registry/vault_address_by_index") {
      auto index = decode_argument<uint64_t>(data);
      if (!index) {
        return reject(query_error_code::invalid_key, "expected vault index");
      }
      auto address = contracts::vault_address_by_index(*state, *index);
      if (!address) {
        return reject(query_error_code::not_found, "not found");
      }
      return respond(*address);
    }
    if (path == "/registry/cached_info") {
      return respond(state->info_cache);
    }
    if (path == "/registry/info_failures") {
      return respond(state->info_failures);
    }
    if (path == "/registry/pending_creations") {
      auto creations = std::vector<pending_creation_t>{};
      for (const auto& [origin, creation] : state->pending_creations) {
        static_cast<void>(origin);
        creations.push_back(creation);
      }
      return respond(creations);
    }
    if (path == "/registry/fee") {
      return respond(state->fee);
    }
    return reject(query_error_code::unsupported_path, "unsupported path");
  }

  if (path == "/asset/token") {
    auto args = decode_argument<std::tuple<account_id_t, asset_id_t>>(data);
    if (!args) {
      return reject(query_error_code::invalid_key,
                    "expected (asset registry, token id)");
    }
    auto state = load_state<nft_registry_state_t>(
        std::get<0>(*args), component_kind_t::nft_registry);
    if (!state) {
      return reject(query_error_code::not_found, "asset registry not found");
    }
    auto token = state->tokens.find(std::get<1>(*args));
    if (token == std::end(state->tokens)) {
      return reject(query_error_code::not_found, "token not found");
    }
    return respond(token->second);
  }

  return reject(query_error_code::unsupported_path, "unsupported path");
}

transaction_result_t engine::validate_transaction(
    const transaction_t& tx,
    const std::string_view codespace) const {
  if (tx.version != 1) {
    return make_error_result(error_code::unsupported_transaction_version,
                             codespace, "expected version 1");
  }
  if (tx.chain_id != chain_id_) {
    return make_error_result(error_code::invalid_chain_id, codespace);
  }
  if (!is_valid_account_id(tx.signer) || !is_valid_account_id(tx.receiver)) {
    return make_error_result(error_code::invalid_account_id, codespace);
  }
  const auto* signer = host_.find_account(tx.signer);
  if (signer == nullptr) {
    return make_error_result(error_code::account_missing, codespace,
                             "signer '" + tx.signer + "' does not exist");
  }
  if (options_.require_signatures) {
    if (!signer->public_key) {
      return make_error_result(error_code::signer_key_missing, codespace,
                               "signer '" + tx.signer + "' has no key");
    }
    auto message = make_signing_bytes(tx);
    if (!signature_verifier_(bytes_view_t{message}, *signer->public_key,
                             tx.signature)) {
      return make_error_result(error_code::invalid_signature, codespace);
    }
  }
  if (tx.gas == 0 || tx.gas > host_.options().max_prepaid_gas) {
    return make_error_result(
        error_code::gas_exhausted, codespace,
        "gas must be positive and at most " +
            std::to_string(host_.options().max_prepaid_gas));
  }
  auto expected_nonce = uint64_t{1};
  if (auto nonce = nonces_.find(tx.signer); nonce != std::end(nonces_)) {
    expected_nonce = nonce->second + 1;
  }
  if (tx.nonce != expected_nonce) {
    return make_error_result(error_code::invalid_nonce, codespace,
                             "expected nonce " + std::to_string(expected_nonce));
  }

  auto result = transaction_result_t{};
  result.gas_wanted = static_cast<int64_t>(tx.gas);
  return result;
}

transaction_result_t engine::execute_transaction(const transaction_t& tx,
                                                 const int64_t height) {
  nonces_[tx.signer] = tx.nonce;
  dirty_nonces_.insert(tx.signer);

  auto outcome = host_.execute_transaction(tx, height);
  auto result = transaction_result_t{};
  result.code = outcome.code;
  result.data = std::move(outcome.data);
  result.log = std::move(outcome.log);
  result.info = "receipt " + std::to_string(outcome.receipt_id);
  result.gas_wanted = static_cast<int64_t>(tx.gas);
  result.gas_used = static_cast<int64_t>(outcome.gas_used);
  if (result.code != 0) {
    result.codespace = std::string{kFinalizeCodespace};
  }
  result.events = std::move(outcome.events);
  return result;
}

void engine::install_components() {
  host_.install(std::make_unique<contracts::registry>(
      contracts::registry_options{
          .record_commit_mode = options_.record_commit_mode,
          .failure_policy = options_.failure_policy,
          .vault_funding = options_.vault_funding}));
  host_.install(std::make_unique<contracts::vault>(
      contracts::vault_options{.settlement_mode = options_.settlement_mode,
                               .failure_policy = options_.failure_policy}));
  host_.install(std::make_unique<contracts::nft_registry>());
}

void engine::bootstrap_genesis() {
  spdlog::info("Bootstrapping genesis state for chain '{}'",
               options_.chain_name);
  auto encoder = encoder_t{};
  auto add_account = [&](const account_id_t& account, const amount_t& balance,
                         const component_kind_t kind,
                         const std::optional<ed25519_public_key_t>&
                             public_key = std::nullopt) {
    if (!is_valid_account_id(account)) {
      spdlog::error("Invalid genesis account '{}'", account);
      sharevault::common::critical("invalid genesis account id");
    }
    if (host_.find_account(account) != nullptr) {
      spdlog::error("Duplicate genesis account '{}'", account);
      sharevault::common::critical("duplicate genesis account");
    }
    auto record = account_record_t{};
    record.account_id = account;
    record.balance = balance;
    record.kind = kind;
    record.public_key = public_key;
    host_.put_account(std::move(record));
  };

  add_account(options_.admin_account, options_.admin_balance,
              component_kind_t::none, options_.admin_public_key);
  add_account(options_.registry_account, options_.registry_balance,
              component_kind_t::registry);
  auto registry = registry_state_t{};
  registry.initialized = true;
  registry.owner = options_.admin_account;
  host_.put_contract_state(options_.registry_account,
                           encoder.encode(registry));

  for (const auto& asset_registry : options_.asset_registry_accounts) {
    add_account(asset_registry, amount_t{}, component_kind_t::nft_registry);
    auto tokens = nft_registry_state_t{};
    tokens.owner = options_.admin_account;
    host_.put_contract_state(asset_registry, encoder.encode(tokens));
  }
  for (const auto& account : options_.accounts) {
    add_account(account.account_id, account.balance, component_kind_t::none,
                account.public_key);
  }

  merge_changes(host_.take_changes());
  auto writes = make_write_set();
  last_committed_height_ = 0;
  last_committed_state_root_ =
      fold_state_root(make_zero_hash(), last_committed_height_, writes);
  storage_.commit(writes, storage::committed_state{
                              .height = last_committed_height_,
                              .state_root = last_committed_state_root_});
  pending_height_ = last_committed_height_;
  pending_state_root_ = last_committed_state_root_;
  pending_changes_ = runtime::change_set{};
}

void engine::load_persisted_state() {
  spdlog::debug("Loading persisted engine state");
  auto committed = storage_.load_committed_state();
  if (!committed) {
    bootstrap_genesis();
    return;
  }
  last_committed_height_ = committed->height;
  last_committed_state_root_ = committed->state_root;
  pending_height_ = committed->height;
  pending_state_root_ = committed->state_root;

  auto encoder = encoder_t{};
  auto account_prefix = key::make_prefix_key(encoder, key::kAccountKeyPrefix);
  for (const auto& [key, value] :
       storage_.list_by_prefix(bytes_view_t{account_prefix})) {
    static_cast<void>(key);
    auto record = encoder.try_decode<account_record_t>(bytes_view_t{value});
    if (!record) {
      sharevault::common::critical("corrupt persisted account record");
    }
    host_.put_account(std::move(record.value()));
  }

  auto contract_prefix = key::make_prefix_key(encoder, key::kContractKeyPrefix);
  for (const auto& [key, value] :
       storage_.list_by_prefix(bytes_view_t{contract_prefix})) {
    auto account = account_from_key(key, contract_prefix);
    if (!account) {
      sharevault::common::critical("corrupt persisted contract key");
    }
    host_.put_contract_state(*account, value);
  }

  auto nonce_prefix = key::make_prefix_key(encoder, key::kNonceKeyPrefix);
  for (const auto& [key, value] :
       storage_.list_by_prefix(bytes_view_t{nonce_prefix})) {
    auto account = account_from_key(key, nonce_prefix);
    auto nonce = encoder.try_decode<uint64_t>(bytes_view_t{value});
    if (!account || !nonce) {
      sharevault::common::critical("corrupt persisted nonce");
    }
    nonces_[*account] = *nonce;
  }

  auto receipt_prefix = key::make_prefix_key(encoder, key::kReceiptKeyPrefix);
  for (const auto& [key, value] :
       storage_.list_by_prefix(bytes_view_t{receipt_prefix})) {
    static_cast<void>(key);
    auto receipt = encoder.try_decode<receipt_t>(bytes_view_t{value});
    if (!receipt) {
      sharevault::common::critical("corrupt persisted receipt");
    }
    host_.put_receipt(std::move(receipt.value()));
  }

  auto sequence_key = key::make_receipt_sequence_key(encoder);
  if (auto next_receipt_id = storage_.get<encoder_t, uint64_t>(
          encoder, bytes_view_t{sequence_key})) {
    host_.set_next_receipt_id(*next_receipt_id);
  }

  // Loaded records are already durable.
  static_cast<void>(host_.take_changes());
}

void engine::merge_changes(runtime::change_set changes) {
  pending_changes_.accounts.merge(changes.accounts);
  pending_changes_.contracts.merge(changes.contracts);
  for (const auto receipt_id : changes.receipts_added) {
    pending_changes_.receipts_added.insert(receipt_id);
  }
  for (const auto receipt_id : changes.receipts_removed) {
    if (pending_changes_.receipts_added.erase(receipt_id) == 0) {
      pending_changes_.receipts_removed.insert(receipt_id);
    }
  }
  std::move(std::begin(changes.outcomes), std::end(changes.outcomes),
            std::back_inserter(pending_changes_.outcomes));
}

storage::write_set engine::make_write_set() const {
  auto encoder = encoder_t{};
  auto writes = storage::write_set{};

  for (const auto& account : pending_changes_.accounts) {
    auto key = key::make_account_key(encoder, account);
    if (const auto* record = host_.find_account(account)) {
      writes.puts.emplace_back(std::move(key), encoder.encode(*record));
    } else {
      writes.erases.push_back(std::move(key));
    }
  }
  for (const auto& account : pending_changes_.contracts) {
    auto key = key::make_contract_key(encoder, account);
    if (const auto* state = host_.find_contract_state(account)) {
      writes.puts.emplace_back(std::move(key), *state);
    } else {
      writes.erases.push_back(std::move(key));
    }
  }
  for (const auto& account : dirty_nonces_) {
    writes.puts.emplace_back(key::make_nonce_key(encoder, account),
                             encoder.encode(nonces_.at(account)));
  }

  const auto& receipts = host_.pending_receipts();
  for (const auto receipt_id : pending_changes_.receipts_added) {
    auto receipt = receipts.find(receipt_id);
    if (receipt == std::end(receipts)) {
      continue;
    }
    writes.puts.emplace_back(key::make_receipt_key(encoder, receipt_id),
                             encoder.encode(receipt->second));
  }
  for (const auto receipt_id : pending_changes_.receipts_removed) {
    writes.erases.push_back(key::make_receipt_key(encoder, receipt_id));
  }
  for (const auto& outcome : pending_changes_.outcomes) {
    writes.puts.emplace_back(key::make_outcome_key(encoder, outcome.receipt_id),
                             encoder.encode(outcome));
    if (options_.outcome_retention_blocks > 0) {
      writes.puts.emplace_back(
          key::make_outcome_height_key(encoder, outcome.height,
                                       outcome.receipt_id),
          encoder.encode(outcome.receipt_id));
    }
  }
  writes.erases.insert(std::end(writes.erases), std::begin(pruned_keys_),
                       std::end(pruned_keys_));
  writes.puts.emplace_back(key::make_receipt_sequence_key(encoder),
                           encoder.encode(host_.next_receipt_id()));
  return writes;
}

void engine::prune_outcomes(const int64_t height) {
  if (options_.outcome_retention_blocks <= 0 ||
      height <= options_.outcome_retention_blocks) {
    return;
  }
  auto expired = height - options_.outcome_retention_blocks;
  auto encoder = encoder_t{};
  auto prefix = key::make_outcome_height_prefix(encoder, expired);
  auto pruned = std::size_t{};
  for (const auto& [index_key, value] :
       storage_.list_by_prefix(bytes_view_t{prefix})) {
    auto receipt_id = encoder.try_decode<uint64_t>(bytes_view_t{value});
    if (!receipt_id) {
      sharevault::common::critical("corrupt outcome height index");
    }
    pruned_keys_.push_back(key::make_outcome_key(encoder, *receipt_id));
    pruned_keys_.push_back(index_key);
    ++pruned;
  }
  if (pruned > 0) {
    spdlog::debug("Pruning {} outcome(s) recorded at height {}", pruned,
                  expired);
  }
}

template <typename State>
std::optional<State> engine::load_state(const account_id_t& account,
                                        const component_kind_t kind) const {
  const auto* record = host_.find_account(account);
  if (record == nullptr || record->kind != kind) {
    return std::nullopt;
  }
  const auto* state = host_.find_contract_state(account);
  if (state == nullptr || state->empty()) {
    return std::nullopt;
  }
  auto encoder = encoder_t{};
  auto decoded = encoder.try_decode<State>(bytes_view_t{*state});
  if (!decoded) {
    spdlog::error("Corrupt state for account '{}'", account);
    sharevault::common::critical("corrupt component state");
  }
  return decoded;
}

}  // namespace sharevault::execution
