#pragma once
#include <consign/model/primitives.hpp>
#include <cstdint>
#include <optional>
#include <variant>
#include <vector>

// Multi-protocol commitment (MPC): one witness transaction output commits to
// a Merkle root whose leaves are (contract id, bundle id) pairs of any number
// of contracts. Each contract owns a fixed leaf position derived from its id.
namespace consign::model {

inline constexpr auto kMaxMpcDepth = uint8_t{32};
// make_merkle_block materializes every slot, so it is limited further.
inline constexpr auto kMaxMaterializedMpcDepth = uint8_t{16};

struct commitment_leaf_t final {
  contract_id_t protocol_id{};
  bundle_id_t message{};

  bool operator==(const commitment_leaf_t&) const = default;
};

struct concealed_node_t final {
  uint8_t depth{};
  hash32_t hash{};

  bool operator==(const concealed_node_t&) const = default;
};

using tree_node_t = std::variant<concealed_node_t, commitment_leaf_t>;

/// Left-to-right cross-section of the MPC tree. Leaves sit at `depth`;
/// concealed nodes stand for whole subtrees.
struct merkle_block_t final {
  uint8_t depth{};
  std::vector<tree_node_t> cross_section;

  bool operator==(const merkle_block_t&) const = default;
};

struct merkle_node_t final {
  bool on_right{};
  hash32_t hash{};

  bool operator==(const merkle_node_t&) const = default;
};

/// Path from one leaf to the root; `path[0]` is the leaf's sibling.
struct merkle_proof_t final {
  uint32_t position{};
  std::vector<merkle_node_t> path;

  bool operator==(const merkle_proof_t&) const = default;
};

template <typename Commitment>
struct anchor final {
  txid_t txid{};
  // Root committed to by the witness transaction.
  hash32_t mpc_root{};
  Commitment commitment;

  bool operator==(const anchor&) const = default;
};

using anchor_merkle_block_t = anchor<merkle_block_t>;
using anchor_merkle_proof_t = anchor<merkle_proof_t>;

uint32_t protocol_position(const contract_id_t& protocol_id, uint8_t depth);
hash32_t leaf_hash(const commitment_leaf_t& leaf);
hash32_t branch_hash(const hash32_t& left, const hash32_t& right);

/// Build a fully revealed block; empty slots are filled with entropy derived
/// concealed leaves. Fails when two protocols collide on one slot.
std::optional<merkle_block_t> make_merkle_block(
    uint8_t depth,
    const std::vector<commitment_leaf_t>& leaves,
    uint64_t entropy);

std::optional<hash32_t> merkle_root(const merkle_block_t& block);
hash32_t merkle_root(const merkle_proof_t& proof, const commitment_leaf_t& leaf);

/// Narrow a block to the proof of a single protocol leaf.
std::optional<merkle_proof_t> to_merkle_proof(const merkle_block_t& block,
                                              const contract_id_t& protocol_id);

/// Expand a proof into the block containing only `leaf` and the concealed
/// siblings along its path.
std::optional<merkle_block_t> to_merkle_block(const merkle_proof_t& proof,
                                              const commitment_leaf_t& leaf);

/// Union of two cross-sections of the same tree.
std::optional<merkle_block_t> merge_blocks(const merkle_block_t& lhs,
                                           const merkle_block_t& rhs);

std::optional<anchor_merkle_proof_t> to_merkle_proof(
    const anchor_merkle_block_t& value,
    const contract_id_t& contract_id);

/// Fails when the proof does not commit `bundle_id` for `contract_id` under
/// the anchor's root.
std::optional<anchor_merkle_block_t> into_merkle_block(
    const anchor_merkle_proof_t& value,
    const contract_id_t& contract_id,
    const bundle_id_t& bundle_id);

bool merge(anchor_merkle_block_t& existing,
           const anchor_merkle_block_t& incoming);

}  // namespace consign::model
