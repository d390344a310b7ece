#include <sharevault/runtime/modes.hpp>
#include <sharevault/service/config.hpp>

#include <array>
#include <string_view>
#include <utility>
#include <vector>

namespace po = boost::program_options;

using namespace sharevault::schema;

namespace {

template <typename Enum, std::size_t N>
bool read_mode(const po::variables_map& vm,
               const std::string& name,
               const std::array<std::pair<std::string_view, Enum>, N>& mappings,
               Enum& out,
               std::string& error) {
  auto value = vm[name].as<std::string>();
  auto parsed = try_from_string<Enum>(value);
  if (!parsed) {
    error = "--" + name + " must be " + names_of(mappings);
    return false;
  }
  out = *parsed;
  return true;
}

bool read_amount(const po::variables_map& vm,
                 const std::string& name,
                 amount_t& out,
                 std::string& error) {
  auto value = vm[name].as<std::string>();
  auto parsed = try_parse_amount(value);
  if (!parsed) {
    error = "--" + name + " must be a decimal amount, got '" + value + "'";
    return false;
  }
  out = *parsed;
  return true;
}

bool read_account(const po::variables_map& vm,
                  const std::string& name,
                  account_id_t& out,
                  std::string& error) {
  auto value = vm[name].as<std::string>();
  if (!is_valid_account_id(value)) {
    error = "--" + name + " is not a valid account id: '" + value + "'";
    return false;
  }
  out = value;
  return true;
}

}  // namespace

namespace sharevault::service {

po::options_description make_engine_options_description() {
  auto defaults = sharevault::execution::engine_options{};
  auto description = po::options_description{"Engine"};
  description.add_options()(
      "grpc-address,g",
      po::value<std::string>()->default_value("0.0.0.0:26658"),
      "IP:Port for the host service")(
      "db-path", po::value<std::string>()->default_value(defaults.db_path),
      "RocksDB directory")(
      "chain-name",
      po::value<std::string>()->default_value(defaults.chain_name),
      "chain name; the chain id is its BLAKE3 hash")(
      "log-level", po::value<std::string>()->default_value("info"),
      "trace|debug|info|warn|error|critical|off")(
      "log-file", po::value<std::string>()->default_value("sharevault.log"),
      "log file path")(
      "receipt-delay",
      po::value<int64_t>()->default_value(defaults.host.receipt_delay),
      "blocks between scheduling and executing a receipt")(
      "delivery-order", po::value<std::string>()->default_value("fifo"),
      "fifo|lifo|shuffled")(
      "shuffle-seed", po::value<uint64_t>()->default_value(0),
      "seed for shuffled delivery")(
      "settlement-mode", po::value<std::string>()->default_value("confirmed"),
      "confirmed|optimistic")(
      "record-commit-mode",
      po::value<std::string>()->default_value("confirmed"),
      "confirmed|eager")(
      "failure-policy", po::value<std::string>()->default_value("propagate"),
      "propagate|abort")(
      "vault-funding",
      po::value<std::string>()->default_value(defaults.vault_funding.str()),
      "native units granted to each new vault")(
      "registry-account",
      po::value<std::string>()->default_value(defaults.registry_account),
      "genesis registry account")(
      "registry-balance",
      po::value<std::string>()->default_value(defaults.registry_balance.str()),
      "genesis registry balance")(
      "admin-account",
      po::value<std::string>()->default_value(defaults.admin_account),
      "registry administrator")(
      "admin-balance",
      po::value<std::string>()->default_value(defaults.admin_balance.str()),
      "genesis administrator balance")(
      "admin-public-key", po::value<std::string>(),
      "administrator ed25519 public key hex")(
      "require-signatures",
      po::value<bool>()->default_value(defaults.require_signatures),
      "verify transaction signatures")(
      "outcome-retention-blocks",
      po::value<int64_t>()->default_value(defaults.outcome_retention_blocks),
      "blocks a receipt outcome stays queryable; 0 keeps all")(
      "asset-registry", po::value<std::vector<std::string>>()->composing(),
      "genesis asset registry account (repeatable)")(
      "genesis-account", po::value<std::vector<std::string>>()->composing(),
      "genesis account as name=amount[:public_key_hex] (repeatable)");
  return description;
}

std::optional<sharevault::execution::engine_options> try_make_engine_options(
    const po::variables_map& vm,
    std::string& error) {
  auto options = sharevault::execution::engine_options{};
  options.db_path = vm["db-path"].as<std::string>();
  options.chain_name = vm["chain-name"].as<std::string>();
  options.host.receipt_delay = vm["receipt-delay"].as<int64_t>();
  options.host.shuffle_seed = vm["shuffle-seed"].as<uint64_t>();
  if (options.host.receipt_delay < 1) {
    error = "--receipt-delay must be at least 1";
    return std::nullopt;
  }
  options.require_signatures = vm["require-signatures"].as<bool>();
  options.outcome_retention_blocks =
      vm["outcome-retention-blocks"].as<int64_t>();
  if (options.outcome_retention_blocks < 0) {
    error = "--outcome-retention-blocks must not be negative";
    return std::nullopt;
  }
  if (vm.contains("admin-public-key")) {
    options.admin_public_key = sharevault::schema::try_make_public_key(
        vm["admin-public-key"].as<std::string>());
    if (!options.admin_public_key) {
      error = "--admin-public-key must be 32 bytes of hex";
      return std::nullopt;
    }
  }

  if (!read_mode(vm, "delivery-order", runtime::kDeliveryOrderMappings,
                 options.host.delivery_order, error) ||
      !read_mode(vm, "settlement-mode", runtime::kSettlementModeMappings,
                 options.settlement_mode, error) ||
      !read_mode(vm, "record-commit-mode", runtime::kRecordCommitModeMappings,
                 options.record_commit_mode, error) ||
      !read_mode(vm, "failure-policy", runtime::kRemoteFailurePolicyMappings,
                 options.failure_policy, error)) {
    return std::nullopt;
  }
  if (!read_amount(vm, "vault-funding", options.vault_funding, error) ||
      !read_amount(vm, "registry-balance", options.registry_balance, error) ||
      !read_amount(vm, "admin-balance", options.admin_balance, error)) {
    return std::nullopt;
  }
  if (!read_account(vm, "registry-account", options.registry_account,
                    error) ||
      !read_account(vm, "admin-account", options.admin_account, error)) {
    return std::nullopt;
  }

  if (vm.contains("asset-registry")) {
    options.asset_registry_accounts.clear();
    for (const auto& account :
         vm["asset-registry"].as<std::vector<std::string>>()) {
      if (!is_valid_account_id(account)) {
        error = "--asset-registry is not a valid account id: '" + account + "'";
        return std::nullopt;
      }
      options.asset_registry_accounts.push_back(account);
    }
  }
  if (vm.contains("genesis-account")) {
    for (const auto& value :
         vm["genesis-account"].as<std::vector<std::string>>()) {
      auto account = sharevault::execution::try_parse_genesis_account(value);
      if (!account) {
        error = "--genesis-account must be name=amount[:public_key_hex], got '" +
                value + "'";
        return std::nullopt;
      }
      options.accounts.push_back(std::move(*account));
    }
  }
  return options;
}

}  // namespace sharevault::service
