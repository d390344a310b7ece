#include <sharevault/service/config.hpp>
#include <gtest/gtest.h>

#include <string>
#include <vector>

namespace po = boost::program_options;
namespace execution = sharevault::execution;
namespace runtime = sharevault::runtime;
using sharevault::schema::amount_t;
using sharevault::schema::kWholeUnit;

namespace {

po::variables_map parse(const std::vector<std::string>& args) {
  auto vm = po::variables_map{};
  po::store(po::command_line_parser(args)
                .options(sharevault::service::make_engine_options_description())
                .run(),
            vm);
  po::notify(vm);
  return vm;
}

}  // namespace

TEST(config, defaults_match_engine_options) {
  auto error = std::string{};
  auto options = sharevault::service::try_make_engine_options(parse({}), error);
  ASSERT_TRUE(options.has_value()) << error;
  auto defaults = execution::engine_options{};
  EXPECT_EQ(options->db_path, defaults.db_path);
  EXPECT_EQ(options->chain_name, "sharevault-local");
  EXPECT_EQ(options->host.receipt_delay, defaults.host.receipt_delay);
  EXPECT_EQ(options->host.delivery_order, runtime::delivery_order_t::fifo);
  EXPECT_EQ(options->settlement_mode, runtime::settlement_mode_t::confirmed);
  EXPECT_EQ(options->vault_funding, defaults.vault_funding);
  EXPECT_EQ(options->registry_account, "registry.sharevault");
  ASSERT_EQ(options->asset_registry_accounts.size(), 1u);
  EXPECT_TRUE(options->accounts.empty());
  EXPECT_TRUE(options->require_signatures);
  EXPECT_FALSE(options->admin_public_key.has_value());
  EXPECT_EQ(options->outcome_retention_blocks,
            defaults.outcome_retention_blocks);
}

TEST(config, reads_signing_keys_and_retention) {
  const auto key_hex = std::string(64, 'a');
  auto error = std::string{};
  auto options = sharevault::service::try_make_engine_options(
      parse({"--require-signatures", "false", "--admin-public-key", key_hex,
             "--outcome-retention-blocks", "0", "--genesis-account",
             "bob.test=5:" + key_hex}),
      error);
  ASSERT_TRUE(options.has_value()) << error;
  EXPECT_FALSE(options->require_signatures);
  ASSERT_TRUE(options->admin_public_key.has_value());
  EXPECT_EQ(options->admin_public_key->front(), 0xAA);
  EXPECT_EQ(options->outcome_retention_blocks, 0);
  ASSERT_EQ(options->accounts.size(), 1u);
  ASSERT_TRUE(options->accounts.front().public_key.has_value());
  EXPECT_EQ(options->accounts.front().balance, amount_t{5});

  EXPECT_FALSE(sharevault::service::try_make_engine_options(
                   parse({"--admin-public-key", "abcd"}), error)
                   .has_value());
  EXPECT_EQ(error, "--admin-public-key must be 32 bytes of hex");
  EXPECT_FALSE(sharevault::service::try_make_engine_options(
                   parse({"--outcome-retention-blocks", "-1"}), error)
                   .has_value());
}

TEST(config, reads_modes_and_genesis_accounts) {
  auto error = std::string{};
  auto options = sharevault::service::try_make_engine_options(
      parse({"--delivery-order", "shuffled", "--shuffle-seed", "9",
             "--settlement-mode", "optimistic", "--record-commit-mode",
             "eager", "--failure-policy", "abort", "--receipt-delay", "2",
             "--asset-registry", "art.test", "--asset-registry", "music.test",
             "--genesis-account", "alice.test=1000000000000000000000000"}),
      error);
  ASSERT_TRUE(options.has_value()) << error;
  EXPECT_EQ(options->host.delivery_order, runtime::delivery_order_t::shuffled);
  EXPECT_EQ(options->host.shuffle_seed, 9u);
  EXPECT_EQ(options->host.receipt_delay, 2);
  EXPECT_EQ(options->settlement_mode, runtime::settlement_mode_t::optimistic);
  EXPECT_EQ(options->record_commit_mode, runtime::record_commit_mode_t::eager);
  EXPECT_EQ(options->failure_policy, runtime::remote_failure_policy_t::abort);
  EXPECT_EQ(options->asset_registry_accounts,
            (std::vector<std::string>{"art.test", "music.test"}));
  ASSERT_EQ(options->accounts.size(), 1u);
  EXPECT_EQ(options->accounts.front().account_id, "alice.test");
  EXPECT_EQ(options->accounts.front().balance, kWholeUnit);
}

TEST(config, rejects_unknown_mode_names) {
  auto error = std::string{};
  auto options = sharevault::service::try_make_engine_options(
      parse({"--delivery-order", "random"}), error);
  EXPECT_FALSE(options.has_value());
  EXPECT_EQ(error, "--delivery-order must be fifo|lifo|shuffled");
}

TEST(config, rejects_malformed_amounts_and_accounts) {
  auto error = std::string{};
  EXPECT_FALSE(sharevault::service::try_make_engine_options(
                   parse({"--vault-funding", "12.5"}), error)
                   .has_value());
  EXPECT_NE(error.find("--vault-funding"), std::string::npos);

  EXPECT_FALSE(sharevault::service::try_make_engine_options(
                   parse({"--admin-account", "Admin"}), error)
                   .has_value());
  EXPECT_NE(error.find("--admin-account"), std::string::npos);

  EXPECT_FALSE(sharevault::service::try_make_engine_options(
                   parse({"--genesis-account", "alice.test"}), error)
                   .has_value());
  EXPECT_NE(error.find("--genesis-account"), std::string::npos);

  EXPECT_FALSE(sharevault::service::try_make_engine_options(
                   parse({"--receipt-delay", "0"}), error)
                   .has_value());
  EXPECT_EQ(error, "--receipt-delay must be at least 1");
}

TEST(config, parses_genesis_account_pairs) {
  auto parsed = execution::try_parse_genesis_account("bob.test=42");
  ASSERT_TRUE(parsed.has_value());
  EXPECT_EQ(parsed->account_id, "bob.test");
  EXPECT_EQ(parsed->balance, amount_t{42});
  EXPECT_FALSE(execution::try_parse_genesis_account("=42").has_value());
  EXPECT_FALSE(execution::try_parse_genesis_account("bob.test=").has_value());
  EXPECT_FALSE(execution::try_parse_genesis_account("bob.test=x").has_value());
  EXPECT_FALSE(parsed->public_key.has_value());
  EXPECT_FALSE(
      execution::try_parse_genesis_account("bob.test=42:zz").has_value());
}
