#pragma once

#include <consign/encoding/scale/encoder.hpp>
#include <consign/model/compose_result.hpp>
#include <consign/model/consignment.hpp>
#include <consign/model/contract_state.hpp>
#include <consign/model/ingest_result.hpp>
#include <consign/model/outpoint.hpp>
#include <consign/model/query_result.hpp>
#include <consign/model/stash_error.hpp>
#include <consign/storage/storage.hpp>
#include <consign/validation/validator.hpp>
#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string_view>
#include <vector>

namespace consign::processor {

struct processor_options final {
  // Upper bound on anchored bundles in a composed consignment; values above
  // the consensus limit are clamped to it.
  std::size_t max_anchored_bundles{consign::model::kMaxAnchoredBundles};
};

/// Stash node core: merges incoming consignments into the stash and composes
/// outgoing ones from it.
///
/// Work on one contract is serialized; different contracts proceed in
/// parallel. Shared stash records (anchors, schemata) are only written while
/// holding the processor wide write lock.
template <typename Library>
class processor final {
 public:
  explicit processor(
      consign::encoding::scale_encoder_t& encoder,
      const consign::storage::storage<Library>& storage,
      consign::validation::validator_t validator =
          consign::validation::validate_structure,
      processor_options options = {});

  /// Validate `consignment` and, when accepted, merge it into the stash and
  /// the contract state in one atomic write.
  ///
  /// A consignment with unresolved witness transactions is only merged when
  /// `force` is set. Rejected consignments leave the stash untouched; the
  /// verdict is returned either way.
  consign::model::ingest_result_t process_consignment(
      const consign::model::consignment_t& consignment,
      const consign::validation::chain_access& chain,
      bool force);

  /// Compose a transfer consignment disclosing the outputs of transitions of
  /// the `include` kinds that match `selection`, plus their full ancestry.
  consign::model::compose_result_t compose_consignment(
      const consign::model::contract_id_t& contract_id,
      const std::vector<consign::model::transition_type_t>& include,
      const consign::model::outpoint_selection_t& selection);

  /// Compose the full contract history, every declared transition kind and
  /// every output.
  consign::model::compose_result_t export_contract(
      const consign::model::contract_id_t& contract_id);

  std::vector<consign::model::contract_id_t> list_contracts() const;

  std::optional<consign::model::contract_state_t> contract_state(
      const consign::model::contract_id_t& contract_id) const;

  /// Read-path query by route: `/contracts`, `/contract/state`,
  /// `/contract/genesis`, `/contract/schema`. Contract routes take the SCALE
  /// encoded contract id as `data`.
  consign::model::query_result_t query(
      std::string_view path,
      const consign::model::bytes_view_t& data) const;

  /// Contracts holding a serialization lock entry. Entries exist only for
  /// contracts that were ingested or found in the stash.
  std::size_t locked_contract_count() const;

 private:
  std::mutex& contract_mutex(const consign::model::contract_id_t& contract_id);

  std::optional<consign::model::genesis_t> load_genesis(
      const consign::model::contract_id_t& contract_id,
      consign::model::stash_error_t& error) const;

  /// Stage and commit every write of an accepted consignment.
  bool merge_consignment(const consign::model::consignment_t& consignment,
                         const consign::model::contract_id_t& contract_id,
                         consign::model::contract_state_t state,
                         consign::model::stash_error_t& error);

  std::optional<consign::model::consignment_t> compose(
      consign::model::consignment_purpose purpose,
      const consign::model::contract_id_t& contract_id,
      const consign::model::genesis_t& genesis,
      const std::optional<std::vector<consign::model::transition_type_t>>&
          include,
      const consign::model::outpoint_selection_t& selection,
      consign::model::stash_error_t& error);

  consign::encoding::scale_encoder_t& encoder_;
  const consign::storage::storage<Library>& storage_;
  consign::validation::validator_t validator_;
  processor_options options_;
  mutable std::mutex contracts_mutex_;
  std::map<consign::model::contract_id_t, std::unique_ptr<std::mutex>>
      contract_mutexes_;
  std::mutex write_mutex_;
};

}  // namespace consign::processor
