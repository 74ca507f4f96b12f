#pragma once
#include <consign/model/assignment.hpp>
#include <consign/model/extension.hpp>
#include <consign/model/genesis.hpp>
#include <consign/model/outpoint.hpp>
#include <consign/model/primitives.hpp>
#include <consign/model/transition.hpp>
#include <cstdint>
#include <optional>
#include <vector>

namespace consign::model {

struct owned_state_entry_t final {
  node_outpoint_t origin{};
  assignment_type_t assignment_type{};
  // Unset while the seal is only known in concealed form.
  std::optional<outpoint_t> seal;
  owned_state_t state;

  bool operator==(const owned_state_entry_t&) const = default;
};

template <uint16_t Version>
struct contract_state;

/// Folded projection of a contract. Every collection is a sorted set and the
/// fold only ever unions into them, so folding order does not matter and
/// re-folding a node is a no-op.
template <>
struct contract_state<1> final {
  uint16_t version{1};
  contract_id_t contract_id{};
  schema_id_t schema_id{};
  hash32_t chain{};
  bytes_t metadata;
  // Sorted by origin, one entry per origin.
  std::vector<owned_state_entry_t> owned;
  std::vector<node_outpoint_t> spent;
  std::vector<node_id_t> nodes;

  bool operator==(const contract_state<1>&) const = default;
};

using contract_state_t = contract_state<1>;

contract_state_t make_contract_state(const contract_id_t& contract_id,
                                     const genesis_t& genesis);

void add_transition(contract_state_t& state,
                    const txid_t& witness_txid,
                    const transition_t& value);

void add_extension(contract_state_t& state, const extension_t& value);

/// Owned entries whose origin has not been spent by a folded transition.
std::vector<owned_state_entry_t> unspent(const contract_state_t& state);

}  // namespace consign::model
