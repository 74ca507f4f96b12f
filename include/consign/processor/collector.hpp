#pragma once

#include <consign/encoding/scale/encoder.hpp>
#include <consign/model/consignment.hpp>
#include <consign/model/outpoint.hpp>
#include <consign/model/stash_error.hpp>
#include <consign/storage/storage.hpp>
#include <cstddef>
#include <map>
#include <optional>
#include <set>
#include <vector>

namespace consign::processor {

/// Walks a contract's transition graph out of the stash and accumulates
/// everything a consignment needs to prove a set of outputs.
///
/// `process` is the disclosure pass over seed transitions; `iterate` then
/// closes the ancestry of everything disclosed back to genesis. A collector
/// is single use and not thread safe.
template <typename Library>
class collector final {
 public:
  collector(const consign::model::contract_id_t& contract_id,
            const consign::storage::storage<Library>& store,
            consign::encoding::scale_encoder_t& encoder);

  /// Disclosure pass. Records a tip and an endpoint for every revealed seal
  /// of `node_ids` that resolves to a selected outpoint, and queues the
  /// parents of every transition that has one. Every transition passed in
  /// is revealed in its bundle. Returns the tips found by this call.
  std::optional<std::vector<consign::model::node_outpoint_t>> process(
      const std::vector<consign::model::node_id_t>& node_ids,
      const consign::model::outpoint_selection_t& selection,
      consign::model::stash_error_t& error);

  /// Backward closure. Reveals every queued ancestor until genesis is the
  /// only frontier left. Ancestors contribute no tips or endpoints.
  bool iterate(consign::model::stash_error_t& error);

  /// Assemble the consignment; bundles are ordered by witness txid.
  std::optional<consign::model::consignment_t> consignment(
      consign::model::consignment_purpose purpose,
      const consign::model::schema_t& schema,
      const std::optional<consign::model::schema_t>& root_schema,
      const consign::model::genesis_t& genesis,
      const std::vector<consign::model::node_outpoint_t>& tips,
      std::size_t max_anchored_bundles,
      consign::model::stash_error_t& error) const;

 private:
  struct cached_bundle final {
    consign::model::bundle_id_t bundle_id{};
    consign::model::anchored_bundle_t anchored;
  };

  std::optional<consign::model::txid_t> load_witness(
      const consign::model::node_id_t& node_id,
      consign::model::stash_error_t& error) const;

  /// Bundle anchored by `witness_txid`, loading it on first use.
  cached_bundle* resolve_bundle(const consign::model::txid_t& witness_txid,
                                consign::model::stash_error_t& error);

  bool walk_ancestor(const consign::model::node_id_t& node_id,
                     consign::model::stash_error_t& error);

  void enqueue_parents(const consign::model::transition_t& transition);

  consign::model::contract_id_t contract_id_;
  const consign::storage::storage<Library>& store_;
  consign::encoding::scale_encoder_t& encoder_;
  std::map<consign::model::txid_t, cached_bundle> bundles_;
  std::vector<consign::model::endpoint_t> endpoints_;
  std::vector<consign::model::node_outpoint_t> tips_;
  std::vector<consign::model::node_id_t> queue_;
  std::set<consign::model::node_id_t> visited_;
  std::map<consign::model::node_id_t, consign::model::extension_t> extensions_;
};

}  // namespace consign::processor
