#include <consign/blake3/hash.hpp>
#include <consign/encoding/scale/encoder.hpp>
#include <consign/model/consignment.hpp>
#include <consign/model/identity.hpp>

#include <tuple>

namespace consign::model {

namespace {

using encoder_t = consign::encoding::scale_encoder_t;

template <typename T>
hash32_t commit(const std::string_view context, const T& value) {
  auto encoder = encoder_t{};
  auto encoded = encoder.encode(value);
  return consign::blake3::tagged_hash(context, make_bytes_view(encoded));
}

}  // namespace

schema_id_t make_schema_id(const schema_t& value) {
  return commit("consign schema", value);
}

node_id_t make_node_id(const genesis_t& value) {
  auto concealed = value;
  concealed.owned_rights = conceal_seals(value.owned_rights);
  return commit("consign genesis", concealed);
}

node_id_t make_node_id(const transition_t& value) {
  auto concealed = value;
  concealed.owned_rights = conceal_seals(value.owned_rights);
  return commit("consign transition", concealed);
}

node_id_t make_node_id(const extension_t& value) {
  auto concealed = value;
  concealed.owned_rights = conceal_seals(value.owned_rights);
  return commit("consign extension", concealed);
}

contract_id_t make_contract_id(const genesis_t& value) {
  return make_node_id(value);
}

bundle_id_t make_bundle_id(const transition_bundle_t& value) {
  auto commitments = std::vector<std::tuple<node_id_t, std::vector<uint16_t>>>{};
  commitments.reserve(value.items.size());
  for (const auto& item : value.items) {
    commitments.emplace_back(item.node_id, item.inputs);
  }
  return commit("consign bundle", commitments);
}

hash32_t make_consignment_id(const consignment_t& value) {
  return commit("consign consignment", value);
}

}  // namespace consign::model
