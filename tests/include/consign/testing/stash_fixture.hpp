#pragma once

#include <consign/encoding/scale/encoder.hpp>
#include <consign/processor/processor.hpp>
#include <consign/storage/memory/storage.hpp>
#include <consign/testing/contract_fixture.hpp>
#include <consign/validation/chain_access.hpp>
#include <gtest/gtest.h>

#include <vector>

namespace consign::testing {

using memory_processor_t =
    consign::processor::processor<consign::storage::memory_storage_tag>;

/// In-memory stash with a processor over it.
class stash_fixture : public ::testing::Test {
 protected:
  std::vector<consign::storage::key_value_entry_t> snapshot() const {
    return store_.list_by_prefix({});
  }

  consign::model::ingest_result_t ingest(
      const consign::model::consignment_t& consignment,
      const std::vector<consign::model::txid_t>& confirmed,
      const bool force = false) {
    return processor_.process_consignment(
        consignment, consign::validation::offline_chain_access{confirmed},
        force);
  }

  consign::encoding::scale_encoder_t encoder_;
  consign::storage::storage<consign::storage::memory_storage_tag> store_ =
      consign::storage::make_storage<consign::storage::memory_storage_tag>(
          "stash");
  memory_processor_t processor_{encoder_, store_};
};

inline consign::model::outpoint_selection_t select_outpoints(
    std::vector<consign::model::outpoint_t> outpoints) {
  return consign::model::outpoint_selection_t{std::move(outpoints)};
}

inline const consign::model::anchored_bundle_t* find_bundle(
    const consign::model::consignment_t& consignment,
    const consign::model::txid_t& witness_txid) {
  for (const auto& anchored : consignment.anchored_bundles) {
    if (anchored.anchor.txid == witness_txid) {
      return &anchored;
    }
  }
  return nullptr;
}

inline bool is_revealed(const consign::model::anchored_bundle_t& anchored,
                        const consign::model::node_id_t& node_id) {
  for (const auto& item : anchored.bundle.items) {
    if (item.node_id == node_id) {
      return item.transition.has_value();
    }
  }
  return false;
}

}  // namespace consign::testing
