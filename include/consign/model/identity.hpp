#pragma once
#include <consign/model/bundle.hpp>
#include <consign/model/extension.hpp>
#include <consign/model/genesis.hpp>
#include <consign/model/primitives.hpp>
#include <consign/model/schema.hpp>
#include <consign/model/transition.hpp>

// Content ids. Node ids commit to the concealed form of a node so that
// revealing seals never changes the id.
namespace consign::model {

template <uint16_t Version>
struct consignment;

schema_id_t make_schema_id(const schema_t& value);

node_id_t make_node_id(const genesis_t& value);
node_id_t make_node_id(const transition_t& value);
node_id_t make_node_id(const extension_t& value);

/// A contract is identified by its genesis.
contract_id_t make_contract_id(const genesis_t& value);

/// Commits to the (node id, inputs) pairs only.
bundle_id_t make_bundle_id(const transition_bundle_t& value);

hash32_t make_consignment_id(const consignment<1>& value);

}  // namespace consign::model
