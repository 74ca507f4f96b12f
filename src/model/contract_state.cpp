#include <consign/model/contract_state.hpp>
#include <consign/model/identity.hpp>

#include <algorithm>

namespace consign::model {

namespace {

template <typename T>
void insert_sorted(std::vector<T>& values, const T& value) {
  auto position = std::ranges::lower_bound(values, value);
  if (position == std::end(values) || *position != value) {
    values.insert(position, value);
  }
}

// A revealed seal replaces a concealed entry for the same origin; a concealed
// one never overwrites what is already known.
void insert_owned(contract_state_t& state, owned_state_entry_t entry) {
  auto position = std::ranges::lower_bound(state.owned, entry.origin, {},
                                           &owned_state_entry_t::origin);
  if (position == std::end(state.owned) || position->origin != entry.origin) {
    state.owned.insert(position, std::move(entry));
    return;
  }
  if (!position->seal.has_value() && entry.seal.has_value()) {
    *position = std::move(entry);
  }
}

void fold_rights(contract_state_t& state,
                 const node_id_t& node_id,
                 const owned_rights_t& rights,
                 const std::optional<txid_t>& witness_txid) {
  for_each_output(rights, [&](const uint16_t output,
                              const assignment_type_t assignment_type,
                              const assignment_t& assignment) {
    auto entry = owned_state_entry_t{
        .origin = node_outpoint_t{.node_id = node_id, .output = output},
        .assignment_type = assignment_type,
        .seal = std::nullopt,
        .state = assignment.state};
    if (const auto* seal = std::get_if<revealed_seal_t>(&assignment.seal)) {
      if (seal->txid.has_value()) {
        entry.seal = outpoint_t{.txid = *seal->txid, .vout = seal->vout};
      } else if (witness_txid.has_value()) {
        entry.seal = resolve_outpoint(*seal, *witness_txid);
      }
    }
    insert_owned(state, std::move(entry));
  });
  insert_sorted(state.nodes, node_id);
}

}  // namespace

contract_state_t make_contract_state(const contract_id_t& contract_id,
                                     const genesis_t& genesis) {
  auto state = contract_state_t{.contract_id = contract_id,
                                .schema_id = genesis.schema_id,
                                .chain = genesis.chain,
                                .metadata = genesis.metadata};
  fold_rights(state, contract_id, genesis.owned_rights, std::nullopt);
  return state;
}

void add_transition(contract_state_t& state,
                    const txid_t& witness_txid,
                    const transition_t& value) {
  for (const auto& parent : value.parent_outputs) {
    insert_sorted(state.spent, parent);
  }
  fold_rights(state, make_node_id(value), value.owned_rights, witness_txid);
}

void add_extension(contract_state_t& state, const extension_t& value) {
  fold_rights(state, make_node_id(value), value.owned_rights, std::nullopt);
}

std::vector<owned_state_entry_t> unspent(const contract_state_t& state) {
  auto result = std::vector<owned_state_entry_t>{};
  for (const auto& entry : state.owned) {
    if (!std::ranges::binary_search(state.spent, entry.origin)) {
      result.push_back(entry);
    }
  }
  return result;
}

}  // namespace consign::model
