#include <consign/model/anchor.hpp>
#include <consign/testing/common.hpp>
#include <gtest/gtest.h>

#include <variant>

namespace {

using consign::testing::make_hash;

consign::model::commitment_leaf_t make_leaf(const uint8_t protocol,
                                            const uint8_t message) {
  return consign::model::commitment_leaf_t{.protocol_id = make_hash(protocol),
                                           .message = make_hash(message)};
}

consign::model::anchor_merkle_block_t make_anchor(
    const std::vector<consign::model::commitment_leaf_t>& leaves) {
  auto block = consign::model::make_merkle_block(3, leaves, 42);
  EXPECT_TRUE(block.has_value());
  auto root = consign::model::merkle_root(*block);
  EXPECT_TRUE(root.has_value());
  return consign::model::anchor_merkle_block_t{
      .txid = make_hash(90), .mpc_root = *root, .commitment = *block};
}

}  // namespace

TEST(anchor, protocol_position_uses_little_endian_prefix) {
  auto id = consign::model::contract_id_t{};
  id[0] = 0x05;
  id[1] = 0x01;
  EXPECT_EQ(consign::model::protocol_position(id, 3), 5u);
  EXPECT_EQ(consign::model::protocol_position(id, 16), 0x0105u);
  EXPECT_EQ(consign::model::protocol_position(id, 0), 0u);
}

TEST(anchor, make_merkle_block_rejects_colliding_protocols) {
  // make_hash(0) and make_hash(8) both land on slot 0 of a depth 3 tree.
  auto block = consign::model::make_merkle_block(
      3, {make_leaf(0, 50), make_leaf(8, 51)}, 1);
  EXPECT_FALSE(block.has_value());
}

TEST(anchor, proof_commits_to_the_same_root_as_the_block) {
  auto anchor = make_anchor({make_leaf(0, 50), make_leaf(1, 51)});

  auto proof = consign::model::to_merkle_proof(anchor, make_hash(1));
  ASSERT_TRUE(proof.has_value());
  EXPECT_EQ(proof->txid, anchor.txid);
  EXPECT_EQ(proof->commitment.position, 1u);
  EXPECT_EQ(proof->commitment.path.size(), 3u);
  EXPECT_EQ(consign::model::merkle_root(proof->commitment, make_leaf(1, 51)),
            anchor.mpc_root);
}

TEST(anchor, narrowing_fails_for_absent_protocol) {
  auto anchor = make_anchor({make_leaf(0, 50)});
  EXPECT_FALSE(consign::model::to_merkle_proof(anchor, make_hash(1)));
}

TEST(anchor, proof_expands_only_for_the_committed_bundle) {
  auto anchor = make_anchor({make_leaf(0, 50), make_leaf(1, 51)});
  auto proof = consign::model::to_merkle_proof(anchor, make_hash(0));
  ASSERT_TRUE(proof.has_value());

  auto block =
      consign::model::into_merkle_block(*proof, make_hash(0), make_hash(50));
  ASSERT_TRUE(block.has_value());
  EXPECT_EQ(consign::model::merkle_root(block->commitment), anchor.mpc_root);
  // One leaf plus one concealed sibling per level.
  EXPECT_EQ(block->commitment.cross_section.size(), 4u);

  EXPECT_FALSE(
      consign::model::into_merkle_block(*proof, make_hash(0), make_hash(51)));
  EXPECT_FALSE(
      consign::model::into_merkle_block(*proof, make_hash(1), make_hash(50)));
}

TEST(anchor, merge_reveals_leaves_of_both_blocks) {
  auto anchor = make_anchor({make_leaf(0, 50), make_leaf(1, 51)});
  auto first = consign::model::into_merkle_block(
      consign::model::to_merkle_proof(anchor, make_hash(0)).value(),
      make_hash(0), make_hash(50));
  auto second = consign::model::into_merkle_block(
      consign::model::to_merkle_proof(anchor, make_hash(1)).value(),
      make_hash(1), make_hash(51));
  ASSERT_TRUE(first.has_value());
  ASSERT_TRUE(second.has_value());

  auto merged = *first;
  ASSERT_TRUE(consign::model::merge(merged, *second));
  EXPECT_EQ(consign::model::merkle_root(merged.commitment), anchor.mpc_root);
  EXPECT_TRUE(consign::model::to_merkle_proof(merged, make_hash(0)).has_value());
  EXPECT_TRUE(consign::model::to_merkle_proof(merged, make_hash(1)).has_value());

  auto leaves = std::size_t{0};
  for (const auto& node : merged.commitment.cross_section) {
    leaves += std::holds_alternative<consign::model::commitment_leaf_t>(node);
  }
  EXPECT_EQ(leaves, 2u);
}

TEST(anchor, merge_rejects_different_witness_or_root) {
  auto anchor = make_anchor({make_leaf(0, 50)});
  auto other_txid = anchor;
  other_txid.txid = make_hash(91);
  auto copy = anchor;
  EXPECT_FALSE(consign::model::merge(copy, other_txid));
  EXPECT_EQ(copy, anchor);

  auto other_root = make_anchor({make_leaf(0, 52)});
  EXPECT_FALSE(consign::model::merge(copy, other_root));
}

TEST(anchor, tampered_cross_section_has_no_root) {
  auto anchor = make_anchor({make_leaf(0, 50)});
  auto block = anchor.commitment;
  block.cross_section.pop_back();
  EXPECT_FALSE(consign::model::merkle_root(block));

  // Leaf moved away from its protocol slot.
  auto moved = anchor.commitment;
  std::swap(moved.cross_section[0], moved.cross_section[1]);
  EXPECT_FALSE(consign::model::merkle_root(moved));
}
