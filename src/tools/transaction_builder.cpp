#include <boost/program_options.hpp>
#include <sharevault/common/critical.hpp>
#include <sharevault/execution/options.hpp>
#include <sharevault/schema/encoding/scale/encoder.hpp>
#include <sharevault/schema/error_code.hpp>
#include <sharevault/schema/receipt_outcome.hpp>
#include <sharevault/schema/transaction.hpp>

#include <cstdint>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <tuple>
#include <vector>

namespace {

using encoder_t = sharevault::schema::encoding::encoder<
    sharevault::schema::encoding::scale_encoder_tag>;
namespace po = boost::program_options;
namespace schema = sharevault::schema;

std::string get_string(const po::variables_map& vm, const std::string& name) {
  if (!vm.contains(name)) {
    sharevault::common::critical("missing required --" + name);
  }
  return vm[name].as<std::string>();
}

schema::account_id_t get_account(const po::variables_map& vm,
                                 const std::string& name) {
  auto account = get_string(vm, name);
  if (!schema::is_valid_account_id(account)) {
    sharevault::common::critical("--" + name + " is not a valid account id");
  }
  return account;
}

schema::amount_t get_amount(const po::variables_map& vm,
                            const std::string& name) {
  auto amount = schema::try_parse_amount(get_string(vm, name));
  if (!amount) {
    sharevault::common::critical("--" + name +
                                 " must be a decimal integer amount");
  }
  return *amount;
}

std::optional<std::string> get_optional_string(const po::variables_map& vm,
                                               const std::string& name) {
  if (!vm.contains(name)) {
    return std::nullopt;
  }
  return vm[name].as<std::string>();
}

std::vector<schema::asset_id_t> get_assets(const po::variables_map& vm) {
  if (!vm.contains("asset")) {
    sharevault::common::critical("missing required --asset");
  }
  return vm["asset"].as<std::vector<std::string>>();
}

schema::asset_id_t get_single_asset(const po::variables_map& vm) {
  auto assets = get_assets(vm);
  if (assets.size() != 1) {
    sharevault::common::critical("exactly one --asset is required");
  }
  return assets.front();
}

schema::hash32_t get_chain_id(const po::variables_map& vm) {
  if (vm.contains("chain-id")) {
    auto chain_id = schema::try_make_hash32(vm["chain-id"].as<std::string>());
    if (!chain_id) {
      sharevault::common::critical("--chain-id must be 32 bytes of hex");
    }
    return *chain_id;
  }
  return sharevault::execution::make_chain_id(
      vm["chain-name"].as<std::string>());
}

schema::method_call_t build_call(const po::variables_map& vm) {
  auto method = get_string(vm, "method");
  if (method == "create_vault") {
    return schema::create_vault_t{.name = get_string(vm, "name"),
                                  .origin = get_account(vm, "origin"),
                                  .symbol = get_string(vm, "symbol"),
                                  .media = vm["media"].as<std::string>()};
  }
  if (method == "get_vault_info_by_index") {
    return schema::get_vault_info_by_index_t{.index =
                                                 vm["index"].as<uint64_t>()};
  }
  if (method == "refresh_all") {
    return schema::refresh_all_t{};
  }
  if (method == "set_vault_params") {
    return schema::set_vault_params_t{
        .vault = get_account(vm, "vault"),
        .name = get_string(vm, "name"),
        .symbol = get_string(vm, "symbol"),
        .unit_value = get_amount(vm, "unit-value"),
        .media = vm["media"].as<std::string>()};
  }
  if (method == "set_fee") {
    return schema::set_fee_t{.fee = get_amount(vm, "fee")};
  }
  if (method == "deposit") {
    return schema::deposit_t{.asset_id = get_single_asset(vm)};
  }
  if (method == "batch_deposit") {
    return schema::batch_deposit_t{.asset_ids = get_assets(vm)};
  }
  if (method == "withdraw") {
    return schema::withdraw_t{.asset_id = get_single_asset(vm)};
  }
  if (method == "batch_withdraw") {
    return schema::batch_withdraw_t{.asset_ids = get_assets(vm)};
  }
  if (method == "swap") {
    return schema::swap_t{.asset_in = get_string(vm, "asset-in"),
                          .asset_out = get_string(vm, "asset-out")};
  }
  if (method == "set_params") {
    return schema::set_params_t{.name = get_string(vm, "name"),
                                .symbol = get_string(vm, "symbol"),
                                .unit_value = get_amount(vm, "unit-value"),
                                .media = vm["media"].as<std::string>()};
  }
  if (method == "ft_transfer") {
    return schema::ft_transfer_t{.receiver = get_account(vm, "to"),
                                 .amount = get_amount(vm, "amount"),
                                 .memo = get_optional_string(vm, "memo")};
  }
  if (method == "storage_deposit") {
    auto account = std::optional<schema::account_id_t>{};
    if (vm.contains("account")) {
      account = get_account(vm, "account");
    }
    return schema::storage_deposit_t{.account = account};
  }
  if (method == "ft_transfer_call") {
    return schema::ft_transfer_call_t{.receiver = get_account(vm, "to"),
                                      .amount = get_amount(vm, "amount"),
                                      .memo = get_optional_string(vm, "memo"),
                                      .msg = vm["msg"].as<std::string>()};
  }
  if (method == "storage_withdraw") {
    auto amount = std::optional<schema::amount_t>{};
    if (vm.contains("amount")) {
      amount = get_amount(vm, "amount");
    }
    return schema::storage_withdraw_t{.amount = amount};
  }
  if (method == "storage_unregister") {
    return schema::storage_unregister_t{.force = vm["force"].as<bool>()};
  }
  if (method == "nft_mint") {
    return schema::nft_mint_t{.token_id = get_single_asset(vm),
                              .owner = get_account(vm, "owner")};
  }
  if (method == "nft_approve") {
    return schema::nft_approve_t{.token_id = get_single_asset(vm),
                                 .account = get_account(vm, "account")};
  }
  if (method == "nft_transfer") {
    auto approval_id = std::optional<uint64_t>{};
    if (vm.contains("approval-id")) {
      approval_id = vm["approval-id"].as<uint64_t>();
    }
    return schema::nft_transfer_t{.receiver = get_account(vm, "to"),
                                  .token_id = get_single_asset(vm),
                                  .approval_id = approval_id,
                                  .memo = get_optional_string(vm, "memo")};
  }
  sharevault::common::critical("unsupported method '" + method + "'");
}

schema::bytes_t build_query_data(const po::variables_map& vm) {
  auto encoder = encoder_t{};
  auto path = get_string(vm, "path");
  if (path == "/registry/vault_address_by_index") {
    return encoder.encode(vm["index"].as<uint64_t>());
  }
  if (path == "/engine/info" || path == "/engine/pending_receipts" ||
      path.starts_with("/registry/")) {
    return {};
  }
  if (path == "/receipt/outcome") {
    return encoder.encode(vm["receipt-id"].as<uint64_t>());
  }
  if (path == "/account") {
    return encoder.encode(get_account(vm, "account"));
  }
  if (path == "/vault/ft_balance_of" || path == "/vault/storage_balance_of") {
    return encoder.encode(
        std::tuple{get_account(vm, "vault"), get_account(vm, "account")});
  }
  if (path.starts_with("/vault/")) {
    return encoder.encode(get_account(vm, "vault"));
  }
  if (path == "/asset/token") {
    return encoder.encode(
        std::tuple{get_account(vm, "receiver"), get_single_asset(vm)});
  }
  sharevault::common::critical("unsupported query path '" + path + "'");
}

void print_outcome(const schema::bytes_t& bytes) {
  auto outcome = encoder_t{}.try_decode<schema::receipt_outcome_t>(
      schema::bytes_view_t{bytes});
  if (!outcome) {
    sharevault::common::critical("value is not a SCALE receipt outcome");
  }
  std::cout << "receipt " << outcome->receipt_id << " " << outcome->method
            << " on " << outcome->receiver << ": code "
            << outcome->code << " ("
            << schema::describe(static_cast<schema::error_code>(outcome->code))
            << ")\n";
}

void print_help(const po::options_description& options) {
  std::cout << "Usage:\n"
            << "  transaction_builder transaction --method <name> [options]\n"
            << "  transaction_builder signing-payload --method <name> "
               "[options]\n"
            << "  transaction_builder query-key --path <path> [options]\n"
            << "  transaction_builder decode-outcome --value <base64>\n"
            << "  transaction_builder chain-id [--chain-name <name>]\n\n";
  std::cout << options << '\n';
}

}  // namespace

int main(int argc, const char** argv) {
  auto command = std::string{};
  auto options = po::options_description{"transaction_builder options"};
  options.add_options()("help,h", "show help")(
      "command", po::value<std::string>(&command),
      "transaction|signing-payload|query-key|decode-outcome|chain-id")(
      "method", po::value<std::string>(), "method invoked by the transaction")(
      "path", po::value<std::string>(), "query path")(
      "value", po::value<std::string>(), "base64 query value to decode")(
      "chain-name", po::value<std::string>()->default_value("sharevault-local"),
      "chain name hashed into the chain id")(
      "chain-id", po::value<std::string>(), "32-byte chain id hex")(
      "nonce", po::value<uint64_t>()->default_value(1), "transaction nonce")(
      "signer", po::value<std::string>(), "signing account")(
      "receiver", po::value<std::string>(),
      "account whose component receives the call")(
      "gas", po::value<uint64_t>()->default_value(
                 300 * sharevault::schema::kTeraGas),
      "prepaid gas")("deposit", po::value<std::string>()->default_value("0"),
                     "attached deposit in base units")(
      "signature", po::value<std::string>(),
      "ed25519 signature hex over the signing payload")(
      "name", po::value<std::string>(), "vault or share name")(
      "symbol", po::value<std::string>(), "share symbol")(
      "media", po::value<std::string>()->default_value(""), "media reference")(
      "origin", po::value<std::string>(), "asset registry backing the vault")(
      "vault", po::value<std::string>(), "vault account")(
      "index", po::value<uint64_t>()->default_value(0), "vault index")(
      "unit-value", po::value<std::string>(), "shares minted per asset")(
      "fee", po::value<std::string>(), "registry fee")(
      "asset", po::value<std::vector<std::string>>()->multitoken(),
      "asset ids")("asset-in", po::value<std::string>(), "asset deposited")(
      "asset-out", po::value<std::string>(), "asset released")(
      "to", po::value<std::string>(), "transfer receiver")(
      "amount", po::value<std::string>(), "share amount")(
      "memo", po::value<std::string>(), "transfer memo")(
      "msg", po::value<std::string>()->default_value(""),
      "message passed to the share receiver")(
      "account", po::value<std::string>(), "account argument")(
      "owner", po::value<std::string>(), "token owner")(
      "approval-id", po::value<uint64_t>(), "approval id")(
      "force", po::value<bool>()->default_value(false),
      "unregister with a positive balance")(
      "receipt-id", po::value<uint64_t>()->default_value(0), "receipt id");

  auto positional = po::positional_options_description{};
  positional.add("command", 1);
  auto vm = po::variables_map{};
  try {
    po::store(po::command_line_parser(argc, argv)
                  .options(options)
                  .positional(positional)
                  .run(),
              vm);
    po::notify(vm);
  } catch (const po::error& ex) {
    sharevault::common::critical(ex.what());
  }

  if (vm.contains("help") || command.empty()) {
    print_help(options);
    return 0;
  }

  if (command == "transaction" || command == "tx" ||
      command == "signing-payload") {
    auto deposit = get_amount(vm, "deposit");
    auto transaction =
        schema::transaction_t{.version = 1,
                              .chain_id = get_chain_id(vm),
                              .nonce = vm["nonce"].as<uint64_t>(),
                              .signer = get_account(vm, "signer"),
                              .receiver = get_account(vm, "receiver"),
                              .call = build_call(vm),
                              .gas = vm["gas"].as<uint64_t>(),
                              .deposit = deposit};
    if (command == "signing-payload") {
      auto payload = schema::make_signing_bytes(transaction);
      std::cout << schema::to_hex(schema::bytes_view_t{payload}) << '\n';
      return 0;
    }
    if (vm.contains("signature")) {
      auto signature =
          schema::try_make_signature(vm["signature"].as<std::string>());
      if (!signature) {
        sharevault::common::critical("--signature must be 64 bytes of hex");
      }
      transaction.signature = *signature;
    }
    auto encoded = encoder_t{}.encode(transaction);
    std::cout << schema::to_base64(schema::bytes_view_t{encoded}) << '\n';
    return 0;
  }

  if (command == "query-key") {
    auto data = build_query_data(vm);
    std::cout << schema::to_base64(schema::bytes_view_t{data}) << '\n';
    return 0;
  }

  if (command == "decode-outcome") {
    auto bytes = schema::try_from_base64(get_string(vm, "value"));
    if (!bytes) {
      sharevault::common::critical("--value must be base64");
    }
    print_outcome(*bytes);
    return 0;
  }

  if (command == "chain-id") {
    auto chain_id = get_chain_id(vm);
    std::cout << schema::to_hex(schema::bytes_view_t{chain_id}) << '\n';
    return 0;
  }

  sharevault::common::critical(
      "command must be "
      "transaction|signing-payload|query-key|decode-outcome|chain-id");
}
