#include <consign/encoding/scale/encoder.hpp>
#include <consign/model/anchor.hpp>
#include <consign/model/key/stash_keys.hpp>
#include <consign/storage/batch.hpp>
#include <consign/storage/memory/storage.hpp>
#include <consign/storage/rocksdb/storage.hpp>
#include <consign/testing/contract_fixture.hpp>
#include <gtest/gtest.h>

#include <string>
#include <vector>

namespace {

using encoder_t = consign::encoding::scale_encoder_t;

template <typename Library>
class stash_storage : public ::testing::Test {
 protected:
  void SetUp() override {
    path_ = consign::testing::make_db_path("consign_stash_storage");
    store_ = consign::storage::make_storage<Library>(path_);
  }

  void TearDown() override {
    store_ = {};
    consign::testing::remove_path(path_);
  }

  std::string path_;
  consign::storage::storage<Library> store_;
  encoder_t encoder_;
};

using backends = ::testing::Types<consign::storage::rocksdb_storage_tag,
                                  consign::storage::memory_storage_tag>;
TYPED_TEST_SUITE(stash_storage, backends);

consign::model::bytes_t make_key(const std::string_view value) {
  return consign::model::make_bytes(value);
}

}  // namespace

TYPED_TEST(stash_storage, get_returns_what_put_stored) {
  auto key = make_key("A|one");
  auto view = consign::model::make_bytes_view(key);
  EXPECT_FALSE(this->store_.template get<uint64_t>(this->encoder_, view));

  this->store_.put(this->encoder_, view, uint64_t{17});
  auto loaded = this->store_.template get<uint64_t>(this->encoder_, view);
  ASSERT_TRUE(loaded.has_value());
  EXPECT_EQ(*loaded, 17u);

  this->store_.put(this->encoder_, view, uint64_t{18});
  EXPECT_EQ(this->store_.template get<uint64_t>(this->encoder_, view), 18u);
}

TYPED_TEST(stash_storage, list_by_prefix_is_ordered_and_bounded) {
  for (const auto* key : {"B|two", "A|one", "B|one", "C|one"}) {
    auto bytes = make_key(key);
    this->store_.put(this->encoder_, consign::model::make_bytes_view(bytes),
                     std::string{key});
  }
  auto prefix = make_key("B|");
  auto rows = this->store_.list_by_prefix(consign::model::make_bytes_view(prefix));
  ASSERT_EQ(rows.size(), 2u);
  EXPECT_EQ(rows[0].first, make_key("B|one"));
  EXPECT_EQ(rows[1].first, make_key("B|two"));

  auto all = this->store_.list_by_prefix({});
  EXPECT_EQ(all.size(), 4u);
}

TYPED_TEST(stash_storage, write_lands_every_entry) {
  auto entries = std::vector<consign::storage::key_value_entry_t>{
      {make_key("X|1"), this->encoder_.encode(uint32_t{1})},
      {make_key("X|2"), this->encoder_.encode(uint32_t{2})}};
  this->store_.write(entries);

  auto prefix = make_key("X|");
  EXPECT_EQ(
      this->store_.list_by_prefix(consign::model::make_bytes_view(prefix)).size(),
      2u);
  auto key = make_key("X|2");
  EXPECT_EQ(this->store_.template get<uint32_t>(
                this->encoder_, consign::model::make_bytes_view(key)),
            2u);
}

TYPED_TEST(stash_storage, batch_reads_its_own_writes_and_commits_atomically) {
  auto batch =
      consign::storage::stash_batch<TypeParam, encoder_t>{this->store_,
                                                          this->encoder_};
  auto key = make_key("S|set");
  auto view = consign::model::make_bytes_view(key);
  batch.insert_into_set(view, consign::testing::make_hash(3));
  batch.insert_into_set(view, consign::testing::make_hash(1));
  batch.insert_into_set(view, consign::testing::make_hash(3));

  auto staged =
      batch.template retrieve<std::vector<consign::model::hash32_t>>(view);
  ASSERT_TRUE(staged.has_value());
  ASSERT_EQ(staged->size(), 2u);
  EXPECT_EQ((*staged)[0], consign::testing::make_hash(1));
  EXPECT_EQ((*staged)[1], consign::testing::make_hash(3));
  EXPECT_FALSE(this->store_.template get<std::vector<consign::model::hash32_t>>(
      this->encoder_, view));

  batch.commit();
  EXPECT_EQ(this->store_.template get<std::vector<consign::model::hash32_t>>(
                this->encoder_, view),
            staged);
}

TYPED_TEST(stash_storage, dropped_batch_writes_nothing) {
  {
    auto batch = consign::storage::stash_batch<TypeParam, encoder_t>{
        this->store_, this->encoder_};
    auto key = make_key("D|1");
    batch.store(consign::model::make_bytes_view(key), uint8_t{1});
    EXPECT_EQ(batch.size(), 1u);
  }
  EXPECT_TRUE(this->store_.list_by_prefix({}).empty());
}

TYPED_TEST(stash_storage, store_merge_unions_or_reports_conflict) {
  auto contract = consign::testing::chain_contract{};
  auto stored = contract.t1;
  stored.owned_rights = consign::model::conceal_seals(stored.owned_rights);

  auto key = consign::model::key::make_transition_key(this->encoder_,
                                                      contract.t1_id);
  auto view = consign::model::make_bytes_view(key);
  this->store_.put(this->encoder_, view, stored);

  auto batch = consign::storage::stash_batch<TypeParam, encoder_t>{
      this->store_, this->encoder_};
  ASSERT_TRUE(batch.store_merge(view, contract.t1));
  EXPECT_FALSE(batch.store_merge(view, contract.t2));
  batch.commit();

  EXPECT_EQ(this->store_.template get<consign::model::transition_t>(
                this->encoder_, view),
            contract.t1);
}

TEST(stash_keys, contract_state_key_round_trips_contract_id) {
  auto encoder = encoder_t{};
  auto id = consign::testing::make_hash(77);
  auto key = consign::model::key::make_contract_state_key(encoder, id);
  EXPECT_EQ(consign::model::key::parse_contract_state_key(
                encoder, consign::model::make_bytes_view(key)),
            id);

  auto genesis_key = consign::model::key::make_genesis_key(encoder, id);
  EXPECT_FALSE(consign::model::key::parse_contract_state_key(
      encoder, consign::model::make_bytes_view(genesis_key)));
}
