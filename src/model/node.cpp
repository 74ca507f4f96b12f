#include <consign/model/extension.hpp>
#include <consign/model/genesis.hpp>
#include <consign/model/transition.hpp>

#include <algorithm>

namespace consign::model {

std::vector<node_id_t> parent_nodes(const transition_t& value) {
  auto nodes = std::vector<node_id_t>{};
  for (const auto& parent : value.parent_outputs) {
    if (std::ranges::find(nodes, parent.node_id) == std::end(nodes)) {
      nodes.push_back(parent.node_id);
    }
  }
  return nodes;
}

bool merge(genesis_t& existing, const genesis_t& incoming) {
  if (existing.schema_id != incoming.schema_id ||
      existing.chain != incoming.chain ||
      existing.metadata != incoming.metadata) {
    return false;
  }
  auto rights = existing.owned_rights;
  if (!merge_owned_rights(rights, incoming.owned_rights)) {
    return false;
  }
  existing.owned_rights = std::move(rights);
  return true;
}

bool merge(transition_t& existing, const transition_t& incoming) {
  if (existing.transition_type != incoming.transition_type ||
      existing.parent_outputs != incoming.parent_outputs ||
      existing.metadata != incoming.metadata) {
    return false;
  }
  auto rights = existing.owned_rights;
  if (!merge_owned_rights(rights, incoming.owned_rights)) {
    return false;
  }
  existing.owned_rights = std::move(rights);
  return true;
}

bool merge(extension_t& existing, const extension_t& incoming) {
  if (existing.extension_type != incoming.extension_type ||
      existing.contract_id != incoming.contract_id ||
      existing.metadata != incoming.metadata) {
    return false;
  }
  auto rights = existing.owned_rights;
  if (!merge_owned_rights(rights, incoming.owned_rights)) {
    return false;
  }
  existing.owned_rights = std::move(rights);
  return true;
}

}  // namespace consign::model
