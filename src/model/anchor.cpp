#include <consign/blake3/hash.hpp>
#include <consign/encoding/scale/encoder.hpp>
#include <consign/model/anchor.hpp>

#include <iterator>
#include <map>
#include <tuple>

namespace consign::model {

namespace {

struct positioned_node final {
  uint64_t start{};
  uint8_t depth{};
  hash32_t hash{};
  const tree_node_t* node{nullptr};
};

uint64_t span(const uint8_t tree_depth, const uint8_t node_depth) {
  return uint64_t{1} << (tree_depth - node_depth);
}

uint8_t node_depth(const tree_node_t& node, const uint8_t tree_depth) {
  return std::visit(
      overloaded{[](const concealed_node_t& value) { return value.depth; },
                 [&](const commitment_leaf_t&) { return tree_depth; }},
      node);
}

hash32_t node_hash(const tree_node_t& node) {
  return std::visit(
      overloaded{[](const concealed_node_t& value) { return value.hash; },
                 [](const commitment_leaf_t& value) { return leaf_hash(value); }},
      node);
}

// Assign every cross-section node its leaf range; rejects sections that are
// misaligned, overlapping, incomplete or that place a protocol off its slot.
std::optional<std::map<uint64_t, positioned_node>> layout(
    const merkle_block_t& block) {
  if (block.depth > kMaxMpcDepth) {
    return std::nullopt;
  }
  auto width = uint64_t{1} << block.depth;
  auto nodes = std::map<uint64_t, positioned_node>{};
  auto offset = uint64_t{0};
  for (const auto& node : block.cross_section) {
    auto depth = node_depth(node, block.depth);
    if (depth > block.depth || offset >= width) {
      return std::nullopt;
    }
    auto node_span = span(block.depth, depth);
    if ((offset % node_span) != 0) {
      return std::nullopt;
    }
    if (const auto* leaf = std::get_if<commitment_leaf_t>(&node)) {
      if (protocol_position(leaf->protocol_id, block.depth) != offset) {
        return std::nullopt;
      }
    }
    nodes.emplace(offset, positioned_node{.start = offset,
                                          .depth = depth,
                                          .hash = node_hash(node),
                                          .node = &node});
    offset += node_span;
  }
  if (offset != width) {
    return std::nullopt;
  }
  return nodes;
}

// Hash of the subtree at `depth` starting at leaf `start`, combining finer
// nodes where the section reveals more than that subtree.
std::optional<hash32_t> subtree_hash(
    const std::map<uint64_t, positioned_node>& nodes,
    const uint8_t tree_depth,
    const uint8_t depth,
    const uint64_t start) {
  auto found = nodes.find(start);
  if (found == std::end(nodes) || found->second.depth < depth) {
    return std::nullopt;
  }
  if (found->second.depth == depth) {
    return found->second.hash;
  }
  auto half = span(tree_depth, static_cast<uint8_t>(depth + 1));
  auto left = subtree_hash(nodes, tree_depth, depth + 1, start);
  auto right = subtree_hash(nodes, tree_depth, depth + 1, start + half);
  if (!left || !right) {
    return std::nullopt;
  }
  return branch_hash(*left, *right);
}

}  // namespace

uint32_t protocol_position(const contract_id_t& protocol_id,
                           const uint8_t depth) {
  auto value = static_cast<uint32_t>(protocol_id[0]) |
               (static_cast<uint32_t>(protocol_id[1]) << 8u) |
               (static_cast<uint32_t>(protocol_id[2]) << 16u) |
               (static_cast<uint32_t>(protocol_id[3]) << 24u);
  if (depth >= kMaxMpcDepth) {
    return value;
  }
  return value % (uint32_t{1} << depth);
}

hash32_t leaf_hash(const commitment_leaf_t& leaf) {
  auto material = bytes_t{};
  material.reserve(leaf.protocol_id.size() + leaf.message.size());
  material.insert(std::end(material), std::begin(leaf.protocol_id),
                  std::end(leaf.protocol_id));
  material.insert(std::end(material), std::begin(leaf.message),
                  std::end(leaf.message));
  return consign::blake3::tagged_hash("consign mpc leaf",
                                      make_bytes_view(material));
}

hash32_t branch_hash(const hash32_t& left, const hash32_t& right) {
  auto material = bytes_t{};
  material.reserve(left.size() + right.size());
  material.insert(std::end(material), std::begin(left), std::end(left));
  material.insert(std::end(material), std::begin(right), std::end(right));
  return consign::blake3::tagged_hash("consign mpc branch",
                                      make_bytes_view(material));
}

std::optional<merkle_block_t> make_merkle_block(
    const uint8_t depth,
    const std::vector<commitment_leaf_t>& leaves,
    const uint64_t entropy) {
  if (depth > kMaxMaterializedMpcDepth) {
    return std::nullopt;
  }
  auto slots = std::map<uint64_t, commitment_leaf_t>{};
  for (const auto& leaf : leaves) {
    auto [_, inserted] =
        slots.emplace(protocol_position(leaf.protocol_id, depth), leaf);
    if (!inserted) {
      return std::nullopt;
    }
  }

  auto encoder = consign::encoding::scale_encoder_t{};
  auto block = merkle_block_t{.depth = depth};
  auto width = uint64_t{1} << depth;
  block.cross_section.reserve(width);
  for (auto position = uint64_t{0}; position < width; ++position) {
    if (auto found = slots.find(position); found != std::end(slots)) {
      block.cross_section.emplace_back(found->second);
      continue;
    }
    auto filler = encoder.encode(std::tuple{entropy, position});
    block.cross_section.emplace_back(concealed_node_t{
        .depth = depth,
        .hash = consign::blake3::tagged_hash("consign mpc entropy",
                                             make_bytes_view(filler))});
  }
  return block;
}

std::optional<hash32_t> merkle_root(const merkle_block_t& block) {
  auto nodes = layout(block);
  if (!nodes) {
    return std::nullopt;
  }
  auto stack = std::vector<std::pair<uint8_t, hash32_t>>{};
  for (const auto& [start, node] : *nodes) {
    stack.emplace_back(node.depth, node.hash);
    while (stack.size() >= 2 &&
           stack[stack.size() - 1].first == stack[stack.size() - 2].first) {
      auto right = stack.back();
      stack.pop_back();
      auto left = stack.back();
      stack.pop_back();
      stack.emplace_back(static_cast<uint8_t>(left.first - 1),
                         branch_hash(left.second, right.second));
    }
  }
  if (stack.size() != 1) {
    return std::nullopt;
  }
  return stack.front().second;
}

hash32_t merkle_root(const merkle_proof_t& proof,
                     const commitment_leaf_t& leaf) {
  auto hash = leaf_hash(leaf);
  for (const auto& node : proof.path) {
    hash = node.on_right ? branch_hash(hash, node.hash)
                         : branch_hash(node.hash, hash);
  }
  return hash;
}

std::optional<merkle_proof_t> to_merkle_proof(
    const merkle_block_t& block,
    const contract_id_t& protocol_id) {
  auto nodes = layout(block);
  if (!nodes) {
    return std::nullopt;
  }
  auto leaf_start = std::optional<uint64_t>{};
  for (const auto& [start, node] : *nodes) {
    const auto* leaf = std::get_if<commitment_leaf_t>(node.node);
    if (leaf != nullptr && leaf->protocol_id == protocol_id) {
      leaf_start = start;
      break;
    }
  }
  if (!leaf_start) {
    return std::nullopt;
  }

  auto proof = merkle_proof_t{.position = static_cast<uint32_t>(*leaf_start)};
  proof.path.reserve(block.depth);
  for (auto level = block.depth; level > 0; --level) {
    auto index = *leaf_start >> (block.depth - level);
    auto sibling_start = (index ^ 1u) << (block.depth - level);
    auto sibling = subtree_hash(*nodes, block.depth, level, sibling_start);
    if (!sibling) {
      return std::nullopt;
    }
    proof.path.push_back(
        merkle_node_t{.on_right = (index & 1u) == 0, .hash = *sibling});
  }
  return proof;
}

std::optional<merkle_block_t> to_merkle_block(const merkle_proof_t& proof,
                                              const commitment_leaf_t& leaf) {
  if (proof.path.size() > kMaxMpcDepth) {
    return std::nullopt;
  }
  auto depth = static_cast<uint8_t>(proof.path.size());
  if (protocol_position(leaf.protocol_id, depth) != proof.position) {
    return std::nullopt;
  }
  for (std::size_t i = 0; i < proof.path.size(); ++i) {
    auto left_child = ((proof.position >> i) & 1u) == 0;
    if (proof.path[i].on_right != left_child) {
      return std::nullopt;
    }
  }

  auto block = merkle_block_t{.depth = depth};
  block.cross_section.reserve(proof.path.size() + 1);
  for (auto i = proof.path.size(); i > 0; --i) {
    const auto& node = proof.path[i - 1];
    if (!node.on_right) {
      block.cross_section.emplace_back(concealed_node_t{
          .depth = static_cast<uint8_t>(depth - (i - 1)), .hash = node.hash});
    }
  }
  block.cross_section.emplace_back(leaf);
  for (std::size_t i = 0; i < proof.path.size(); ++i) {
    const auto& node = proof.path[i];
    if (node.on_right) {
      block.cross_section.emplace_back(concealed_node_t{
          .depth = static_cast<uint8_t>(depth - i), .hash = node.hash});
    }
  }
  return block;
}

std::optional<merkle_block_t> merge_blocks(const merkle_block_t& lhs,
                                           const merkle_block_t& rhs) {
  if (lhs.depth != rhs.depth) {
    return std::nullopt;
  }
  auto lhs_root = merkle_root(lhs);
  auto rhs_root = merkle_root(rhs);
  if (!lhs_root || !rhs_root || *lhs_root != *rhs_root) {
    return std::nullopt;
  }
  auto lhs_nodes = layout(lhs);
  auto rhs_nodes = layout(rhs);

  // At every boundary take the finer node; equally fine nodes cover the same
  // subtree, and a revealed leaf beats its concealed form.
  auto merged = merkle_block_t{.depth = lhs.depth};
  auto width = uint64_t{1} << lhs.depth;
  auto position = uint64_t{0};
  while (position < width) {
    const positioned_node* chosen = nullptr;
    for (const auto* nodes : {&*lhs_nodes, &*rhs_nodes}) {
      auto found = nodes->find(position);
      if (found == std::end(*nodes)) {
        continue;
      }
      const auto& candidate = found->second;
      if (chosen == nullptr || candidate.depth > chosen->depth ||
          (candidate.depth == chosen->depth &&
           std::holds_alternative<commitment_leaf_t>(*candidate.node))) {
        chosen = &candidate;
      }
    }
    if (chosen == nullptr) {
      return std::nullopt;
    }
    merged.cross_section.push_back(*chosen->node);
    position += span(lhs.depth, chosen->depth);
  }
  return merged;
}

std::optional<anchor_merkle_proof_t> to_merkle_proof(
    const anchor_merkle_block_t& value,
    const contract_id_t& contract_id) {
  auto root = merkle_root(value.commitment);
  if (!root || *root != value.mpc_root) {
    return std::nullopt;
  }
  auto proof = to_merkle_proof(value.commitment, contract_id);
  if (!proof) {
    return std::nullopt;
  }
  return anchor_merkle_proof_t{
      .txid = value.txid, .mpc_root = value.mpc_root, .commitment = *proof};
}

std::optional<anchor_merkle_block_t> into_merkle_block(
    const anchor_merkle_proof_t& value,
    const contract_id_t& contract_id,
    const bundle_id_t& bundle_id) {
  auto leaf = commitment_leaf_t{.protocol_id = contract_id, .message = bundle_id};
  if (merkle_root(value.commitment, leaf) != value.mpc_root) {
    return std::nullopt;
  }
  auto block = to_merkle_block(value.commitment, leaf);
  if (!block) {
    return std::nullopt;
  }
  return anchor_merkle_block_t{
      .txid = value.txid, .mpc_root = value.mpc_root, .commitment = *block};
}

bool merge(anchor_merkle_block_t& existing,
           const anchor_merkle_block_t& incoming) {
  if (existing.txid != incoming.txid || existing.mpc_root != incoming.mpc_root) {
    return false;
  }
  auto merged = merge_blocks(existing.commitment, incoming.commitment);
  if (!merged) {
    return false;
  }
  existing.commitment = std::move(*merged);
  return true;
}

}  // namespace consign::model
