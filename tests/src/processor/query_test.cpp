#include <consign/model/identity.hpp>
#include <consign/testing/stash_fixture.hpp>
#include <gtest/gtest.h>

using namespace consign::testing;
using consign::model::make_bytes_view;
using consign::model::query_error_code;

namespace {

class query : public stash_fixture {
 protected:
  void SetUp() override {
    ASSERT_TRUE(
        ingest(contract_.consignment(), {contract_.x1, contract_.x2}).stored);
  }

  chain_contract contract_;
};

}  // namespace

TEST_F(query, lists_contracts) {
  auto result = processor_.query("/contracts", {});
  EXPECT_EQ(result.code, 0u);
  EXPECT_EQ(result.codespace, "consign.query");
  auto contracts = encoder_.decode<std::vector<consign::model::contract_id_t>>(
      make_bytes_view(result.value));
  EXPECT_EQ(contracts,
            std::vector<consign::model::contract_id_t>{contract_.contract_id});
}

TEST_F(query, contract_routes_return_encoded_records) {
  auto key = make_bytes_view(contract_.contract_id);

  auto state = processor_.query("/contract/state", key);
  ASSERT_EQ(state.code, 0u);
  EXPECT_EQ(state.key, consign::model::make_bytes(key));
  EXPECT_EQ(encoder_.decode<consign::model::contract_state_t>(
                make_bytes_view(state.value)),
            processor_.contract_state(contract_.contract_id).value());

  auto genesis = processor_.query("/contract/genesis", key);
  ASSERT_EQ(genesis.code, 0u);
  EXPECT_EQ(encoder_.decode<consign::model::genesis_t>(
                make_bytes_view(genesis.value)),
            contract_.genesis);

  auto schema = processor_.query("/contract/schema", key);
  ASSERT_EQ(schema.code, 0u);
  EXPECT_EQ(encoder_.decode<consign::model::schema_t>(
                make_bytes_view(schema.value)),
            contract_.schema);
}

TEST_F(query, bad_requests_carry_error_codes) {
  auto unknown = processor_.query("/contract/balance",
                                  make_bytes_view(contract_.contract_id));
  EXPECT_EQ(unknown.code,
            static_cast<uint32_t>(query_error_code::unsupported_path));

  auto short_key = consign::model::bytes_t{1, 2, 3};
  auto invalid =
      processor_.query("/contract/state", make_bytes_view(short_key));
  EXPECT_EQ(invalid.code,
            static_cast<uint32_t>(query_error_code::invalid_key));
  EXPECT_EQ(invalid.key, short_key);

  auto missing = make_hash(90);
  for (const auto* path :
       {"/contract/state", "/contract/genesis", "/contract/schema"}) {
    auto result = processor_.query(path, make_bytes_view(missing));
    EXPECT_EQ(result.code, static_cast<uint32_t>(query_error_code::not_found))
        << path;
    EXPECT_TRUE(result.value.empty()) << path;
  }
}
