#pragma once

#include <consign/model/primitives.hpp>
#include <algorithm>
#include <cstdint>
#include <optional>
#include <string_view>
#include <tuple>

// Key layout of the stash. Every key is the SCALE encoded table prefix
// followed by the SCALE encoded id.
namespace consign::model::key {

inline constexpr std::string_view kSchemaKeyPrefix{"SYS|STASH|SCHEMA|"};
inline constexpr std::string_view kGenesisKeyPrefix{"SYS|STASH|GENESIS|"};
inline constexpr std::string_view kAnchorKeyPrefix{"SYS|STASH|ANCHOR|"};
inline constexpr std::string_view kBundleKeyPrefix{"SYS|STASH|BUNDLE|"};
inline constexpr std::string_view kTransitionKeyPrefix{
    "SYS|STASH|TRANSITION|"};
inline constexpr std::string_view kTransitionTxidKeyPrefix{
    "SYS|STASH|TRANSITION_TXID|"};
inline constexpr std::string_view kExtensionKeyPrefix{"SYS|STASH|EXTENSION|"};
inline constexpr std::string_view kContractTransitionsKeyPrefix{
    "SYS|INDEX|CONTRACT_TRANSITIONS|"};
inline constexpr std::string_view kContractStateKeyPrefix{
    "SYS|STATE|CONTRACT|"};

template <typename Encoder, typename T>
bytes_t make_prefixed_key(Encoder& encoder,
                          const std::string_view prefix,
                          const T& id) {
  // SCALE product types are encoded as concatenated field bytes, so this is
  // the encoding of tuple{prefix, id}.
  auto key = encoder.encode(prefix);
  encoder.encode(id, key);
  return key;
}

template <typename Encoder>
bytes_t make_prefix_key(Encoder& encoder, const std::string_view prefix) {
  return encoder.encode(prefix);
}

template <typename Encoder>
bytes_t make_schema_key(Encoder& encoder, const schema_id_t& schema_id) {
  return make_prefixed_key(encoder, kSchemaKeyPrefix, schema_id);
}

template <typename Encoder>
bytes_t make_genesis_key(Encoder& encoder, const contract_id_t& contract_id) {
  return make_prefixed_key(encoder, kGenesisKeyPrefix, contract_id);
}

template <typename Encoder>
bytes_t make_anchor_key(Encoder& encoder, const txid_t& txid) {
  return make_prefixed_key(encoder, kAnchorKeyPrefix, txid);
}

template <typename Encoder>
bytes_t make_bundle_key(Encoder& encoder,
                        const contract_id_t& contract_id,
                        const txid_t& txid) {
  return make_prefixed_key(encoder, kBundleKeyPrefix,
                           std::tuple{contract_id, txid});
}

template <typename Encoder>
bytes_t make_transition_key(Encoder& encoder, const node_id_t& node_id) {
  return make_prefixed_key(encoder, kTransitionKeyPrefix, node_id);
}

template <typename Encoder>
bytes_t make_transition_txid_key(Encoder& encoder, const node_id_t& node_id) {
  return make_prefixed_key(encoder, kTransitionTxidKeyPrefix, node_id);
}

template <typename Encoder>
bytes_t make_extension_key(Encoder& encoder, const node_id_t& node_id) {
  return make_prefixed_key(encoder, kExtensionKeyPrefix, node_id);
}

template <typename Encoder>
bytes_t make_contract_transitions_key(Encoder& encoder,
                                      const contract_id_t& contract_id,
                                      const transition_type_t type) {
  return make_prefixed_key(encoder, kContractTransitionsKeyPrefix,
                           std::tuple{contract_id, type});
}

template <typename Encoder>
bytes_t make_contract_state_key(Encoder& encoder,
                                const contract_id_t& contract_id) {
  return make_prefixed_key(encoder, kContractStateKeyPrefix, contract_id);
}

/// Recover the contract id from a key produced by make_contract_state_key.
template <typename Encoder>
std::optional<contract_id_t> parse_contract_state_key(Encoder& encoder,
                                                      const bytes_view_t& key) {
  auto prefix = make_prefix_key(encoder, kContractStateKeyPrefix);
  if (key.size() != prefix.size() + contract_id_t{}.size() ||
      !std::equal(std::begin(prefix), std::end(prefix), std::begin(key))) {
    return std::nullopt;
  }
  return encoder.template try_decode<contract_id_t>(key.subspan(prefix.size()));
}

}  // namespace consign::model::key
