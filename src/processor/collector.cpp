#include <consign/model/identity.hpp>
#include <consign/model/key/stash_keys.hpp>
#include <consign/processor/collector.hpp>
#include <consign/storage/memory/storage.hpp>
#include <consign/storage/rocksdb/storage.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <string>
#include <utility>

using namespace consign::model;

namespace consign::processor {

template <typename Library>
collector<Library>::collector(const contract_id_t& contract_id,
                              const consign::storage::storage<Library>& store,
                              consign::encoding::scale_encoder_t& encoder)
    : contract_id_{contract_id}, store_{store}, encoder_{encoder} {}

template <typename Library>
std::optional<txid_t> collector<Library>::load_witness(
    const node_id_t& node_id,
    stash_error_t& error) const {
  auto witness_txid = store_.template get<txid_t>(
      encoder_,
      make_bytes_view(key::make_transition_txid_key(encoder_, node_id)));
  if (!witness_txid) {
    error = {.code = stash_error_code::transition_txid_absent,
             .info = to_hex(node_id)};
  }
  return witness_txid;
}

template <typename Library>
typename collector<Library>::cached_bundle* collector<Library>::resolve_bundle(
    const txid_t& witness_txid,
    stash_error_t& error) {
  auto cached = bundles_.find(witness_txid);
  if (cached != std::end(bundles_)) {
    return &cached->second;
  }

  auto anchor = store_.template get<anchor_merkle_block_t>(
      encoder_, make_bytes_view(key::make_anchor_key(encoder_, witness_txid)));
  if (!anchor) {
    error = {.code = stash_error_code::anchor_absent,
             .info = to_hex(witness_txid)};
    return nullptr;
  }
  auto bundle = store_.template get<transition_bundle_t>(
      encoder_, make_bytes_view(
                    key::make_bundle_key(encoder_, contract_id_, witness_txid)));
  if (!bundle) {
    error = {.code = stash_error_code::bundle_absent,
             .info = to_hex(witness_txid)};
    return nullptr;
  }
  auto proof = to_merkle_proof(*anchor, contract_id_);
  if (!proof) {
    error = {.code = stash_error_code::unrelated_anchor,
             .info = to_hex(witness_txid)};
    return nullptr;
  }

  // Only transitions actually walked are disclosed.
  auto concealed = conceal_transitions(*bundle);
  auto bundle_id = make_bundle_id(concealed);
  spdlog::trace("Loaded bundle {} anchored by {}", to_hex(bundle_id),
                to_hex(witness_txid));
  auto position =
      bundles_
          .emplace(witness_txid,
                   cached_bundle{
                       .bundle_id = bundle_id,
                       .anchored = anchored_bundle_t{
                           .anchor = std::move(*proof),
                           .bundle = std::move(concealed)}})
          .first;
  return &position->second;
}

template <typename Library>
void collector<Library>::enqueue_parents(const transition_t& transition) {
  for (const auto& parent : parent_nodes(transition)) {
    if (parent == contract_id_ || visited_.contains(parent)) {
      continue;
    }
    queue_.push_back(parent);
  }
}

template <typename Library>
std::optional<std::vector<node_outpoint_t>> collector<Library>::process(
    const std::vector<node_id_t>& node_ids,
    const outpoint_selection_t& selection,
    stash_error_t& error) {
  auto found = std::vector<node_outpoint_t>{};
  for (const auto& node_id : node_ids) {
    auto transition = store_.template get<transition_t>(
        encoder_, make_bytes_view(key::make_transition_key(encoder_, node_id)));
    if (!transition) {
      error = {.code = stash_error_code::transition_absent,
               .info = to_hex(node_id)};
      return std::nullopt;
    }
    auto witness_txid = load_witness(node_id, error);
    if (!witness_txid) {
      return std::nullopt;
    }
    auto* cached = resolve_bundle(*witness_txid, error);
    if (cached == nullptr) {
      return std::nullopt;
    }

    auto disclosed = false;
    for_each_output(
        transition->owned_rights,
        [&](const uint16_t output, const assignment_type_t,
            const assignment_t& assignment) {
          const auto* seal = std::get_if<revealed_seal_t>(&assignment.seal);
          if (seal == nullptr ||
              !includes(selection, resolve_outpoint(*seal, *witness_txid))) {
            return;
          }
          disclosed = true;
          auto tip = node_outpoint_t{.node_id = node_id, .output = output};
          if (std::ranges::find(tips_, tip) == std::end(tips_)) {
            tips_.push_back(tip);
            found.push_back(tip);
          }
          auto endpoint = endpoint_t{.bundle_id = cached->bundle_id,
                                     .seal_endpoint = make_seal_endpoint(*seal)};
          if (std::ranges::find(endpoints_, endpoint) == std::end(endpoints_)) {
            endpoints_.push_back(std::move(endpoint));
          }
        });
    if (disclosed) {
      enqueue_parents(*transition);
    }

    if (auto failure = reveal_transition(cached->anchored.bundle, *transition)) {
      error = {.code = stash_error_code::bundle_reveal,
               .info = to_hex(node_id) + ": " + std::string{to_string(*failure)}};
      return std::nullopt;
    }
  }
  spdlog::debug("Disclosure pass over {} transition(s) found {} tip(s)",
                node_ids.size(), found.size());
  return found;
}

template <typename Library>
bool collector<Library>::walk_ancestor(const node_id_t& node_id,
                                       stash_error_t& error) {
  auto transition = store_.template get<transition_t>(
      encoder_, make_bytes_view(key::make_transition_key(encoder_, node_id)));
  if (!transition) {
    // Extensions have no witness and travel beside the bundles.
    auto extension = store_.template get<extension_t>(
        encoder_, make_bytes_view(key::make_extension_key(encoder_, node_id)));
    if (extension) {
      extensions_.insert_or_assign(node_id, std::move(*extension));
      return true;
    }
    error = {.code = stash_error_code::transition_absent,
             .info = to_hex(node_id)};
    return false;
  }
  auto witness_txid = load_witness(node_id, error);
  if (!witness_txid) {
    return false;
  }
  auto* cached = resolve_bundle(*witness_txid, error);
  if (cached == nullptr) {
    return false;
  }
  if (auto failure = reveal_transition(cached->anchored.bundle, *transition)) {
    error = {.code = stash_error_code::bundle_reveal,
             .info = to_hex(node_id) + ": " + std::string{to_string(*failure)}};
    return false;
  }
  enqueue_parents(*transition);
  return true;
}

template <typename Library>
bool collector<Library>::iterate(stash_error_t& error) {
  auto rounds = std::size_t{0};
  while (!queue_.empty()) {
    auto pending = std::exchange(queue_, {});
    for (const auto& node_id : pending) {
      if (node_id == contract_id_ || !visited_.insert(node_id).second) {
        continue;
      }
      if (!walk_ancestor(node_id, error)) {
        return false;
      }
    }
    ++rounds;
  }
  spdlog::debug("Ancestry of contract {} closed after {} round(s), {} node(s)",
                to_hex(contract_id_), rounds, visited_.size());
  return true;
}

template <typename Library>
std::optional<consignment_t> collector<Library>::consignment(
    const consignment_purpose purpose,
    const schema_t& schema,
    const std::optional<schema_t>& root_schema,
    const genesis_t& genesis,
    const std::vector<node_outpoint_t>& tips,
    const std::size_t max_anchored_bundles,
    stash_error_t& error) const {
  if (bundles_.size() > std::min(max_anchored_bundles, kMaxAnchoredBundles)) {
    error = {.code = stash_error_code::oversized_bundle,
             .info = std::to_string(bundles_.size()) + " anchored bundles"};
    return std::nullopt;
  }

  auto result = consignment_t{.purpose = purpose,
                              .schema = schema,
                              .root_schema = root_schema,
                              .genesis = genesis,
                              .endpoint_transitions = tips,
                              .endpoints = endpoints_};
  result.anchored_bundles.reserve(bundles_.size());
  for (const auto& [witness_txid, cached] : bundles_) {
    result.anchored_bundles.push_back(cached.anchored);
  }
  for (const auto& [node_id, extension] : extensions_) {
    result.state_extensions.push_back(extension);
  }
  return result;
}

template class collector<consign::storage::rocksdb_storage_tag>;
template class collector<consign::storage::memory_storage_tag>;

}  // namespace consign::processor
