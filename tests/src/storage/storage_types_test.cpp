#include <sharevault/schema/account_record.hpp>
#include <sharevault/schema/key/engine_keys.hpp>
#include <sharevault/storage/rocksdb/storage.hpp>
#include <sharevault/storage/storage.hpp>
#include <sharevault/testing/common.hpp>
#include <gtest/gtest.h>

#include <optional>
#include <string>

namespace {

using storage_t =
    sharevault::storage::storage<sharevault::storage::rocksdb_storage_tag>;
using sharevault::testing::scale_encoder_t;
namespace key = sharevault::schema::key;
namespace schema = sharevault::schema;

schema::hash32_t make_hash(const uint8_t seed) {
  auto out = schema::hash32_t{};
  for (std::size_t i = 0; i < out.size(); ++i) {
    out[i] = static_cast<uint8_t>(seed + static_cast<uint8_t>(i));
  }
  return out;
}

schema::account_record_t make_account(const std::string& id,
                                      const uint64_t units) {
  auto record = schema::account_record_t{};
  record.account_id = id;
  record.balance = sharevault::testing::whole_units(units);
  record.kind = schema::component_kind_t::vault;
  return record;
}

class storage_types : public ::testing::Test {
 protected:
  void SetUp() override {
    path_ = sharevault::testing::make_db_path("sharevault_storage");
  }
  void TearDown() override { sharevault::testing::remove_path(path_); }

  storage_t open() const {
    return sharevault::storage::make_storage<
        sharevault::storage::rocksdb_storage_tag>(path_);
  }

  std::string path_;
};

}  // namespace

TEST(storage_defaults, defaults_are_stable) {
  auto committed = sharevault::storage::committed_state{};
  EXPECT_EQ(committed.height, 0);
  EXPECT_EQ(committed.state_root, schema::make_zero_hash());

  auto writes = sharevault::storage::write_set{};
  EXPECT_TRUE(writes.puts.empty());
  EXPECT_TRUE(writes.erases.empty());
}

TEST_F(storage_types, committed_account_records_can_be_read_back) {
  auto storage = open();
  auto encoder = scale_encoder_t{};
  auto account_key = key::make_account_key(encoder, "art.registry.test");

  EXPECT_FALSE((storage.get<scale_encoder_t, schema::account_record_t>(
                    encoder, account_key))
                   .has_value());

  auto record = make_account("art.registry.test", 25);
  auto writes = sharevault::storage::write_set{};
  writes.puts.emplace_back(account_key, encoder.encode(record));
  storage.commit(writes, sharevault::storage::committed_state{.height = 1});
  auto loaded =
      storage.get<scale_encoder_t, schema::account_record_t>(encoder,
                                                             account_key);
  ASSERT_TRUE(loaded.has_value());
  EXPECT_EQ(loaded->account_id, record.account_id);
  EXPECT_EQ(loaded->balance, record.balance);
  EXPECT_EQ(loaded->kind, schema::component_kind_t::vault);

  // Erasing a missing key in a later batch is harmless.
  auto erases = sharevault::storage::write_set{};
  erases.erases.push_back(account_key);
  erases.erases.push_back(key::make_account_key(encoder, "ghost.test"));
  storage.commit(erases, sharevault::storage::committed_state{.height = 2});
  EXPECT_FALSE((storage.get<scale_encoder_t, schema::account_record_t>(
                    encoder, account_key))
                   .has_value());
}

TEST_F(storage_types, missing_committed_state_is_empty) {
  auto storage = open();
  EXPECT_FALSE(storage.load_committed_state().has_value());
}

TEST_F(storage_types, committed_state_survives_reopen) {
  {
    auto storage = open();
    storage.commit(sharevault::storage::write_set{},
                   sharevault::storage::committed_state{
                       .height = 42, .state_root = make_hash(10)});
  }
  auto storage = open();
  auto loaded = storage.load_committed_state();
  ASSERT_TRUE(loaded.has_value());
  EXPECT_EQ(loaded->height, 42);
  EXPECT_EQ(loaded->state_root, make_hash(10));
}

TEST_F(storage_types, commit_applies_puts_and_erases_with_the_checkpoint) {
  auto storage = open();
  auto encoder = scale_encoder_t{};
  auto stale_key = key::make_account_key(encoder, "stale.test");
  auto seed = sharevault::storage::write_set{};
  seed.puts.emplace_back(stale_key,
                         encoder.encode(make_account("stale.test", 1)));
  storage.commit(seed, sharevault::storage::committed_state{.height = 6});

  auto writes = sharevault::storage::write_set{};
  writes.puts.emplace_back(key::make_account_key(encoder, "alice.test"),
                           encoder.encode(make_account("alice.test", 5)));
  writes.puts.emplace_back(key::make_nonce_key(encoder, "alice.test"),
                           encoder.encode(uint64_t{3}));
  writes.erases.push_back(stale_key);
  storage.commit(writes, sharevault::storage::committed_state{
                             .height = 7, .state_root = make_hash(1)});

  EXPECT_FALSE((storage.get<scale_encoder_t, schema::account_record_t>(
                    encoder, stale_key))
                   .has_value());
  auto nonce = storage.get<scale_encoder_t, uint64_t>(
      encoder, key::make_nonce_key(encoder, "alice.test"));
  ASSERT_TRUE(nonce.has_value());
  EXPECT_EQ(*nonce, 3u);
  auto committed = storage.load_committed_state();
  ASSERT_TRUE(committed.has_value());
  EXPECT_EQ(committed->height, 7);
}

TEST_F(storage_types, list_by_prefix_stays_inside_one_keyspace) {
  auto storage = open();
  auto encoder = scale_encoder_t{};
  auto writes = sharevault::storage::write_set{};
  writes.puts.emplace_back(key::make_account_key(encoder, "alice.test"),
                           encoder.encode(make_account("alice.test", 1)));
  writes.puts.emplace_back(key::make_account_key(encoder, "bob.test"),
                           encoder.encode(make_account("bob.test", 2)));
  writes.puts.emplace_back(key::make_nonce_key(encoder, "alice.test"),
                           encoder.encode(uint64_t{1}));
  storage.commit(writes, sharevault::storage::committed_state{.height = 1});

  auto accounts = storage.list_by_prefix(
      key::make_prefix_key(encoder, key::kAccountKeyPrefix));
  ASSERT_EQ(accounts.size(), 2u);
  for (const auto& [entry_key, value] : accounts) {
    static_cast<void>(entry_key);
    auto record = encoder.decode<schema::account_record_t>(value);
    EXPECT_TRUE(record.account_id == "alice.test" ||
                record.account_id == "bob.test");
  }
  EXPECT_TRUE(storage
                  .list_by_prefix(
                      key::make_prefix_key(encoder, key::kReceiptKeyPrefix))
                  .empty());
}
