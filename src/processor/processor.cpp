#include <consign/model/identity.hpp>
#include <consign/model/key/stash_keys.hpp>
#include <consign/processor/collector.hpp>
#include <consign/processor/processor.hpp>
#include <consign/storage/batch.hpp>
#include <consign/storage/memory/storage.hpp>
#include <consign/storage/rocksdb/storage.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <string>
#include <utility>

using namespace consign::model;

namespace consign::processor {

namespace {

inline constexpr auto kIngestCodespace = std::string_view{"consign.ingest"};
inline constexpr auto kComposeCodespace = std::string_view{"consign.compose"};
inline constexpr auto kQueryCodespace = std::string_view{"consign.query"};

bool accepts(const validation_status_t& status, const bool force) {
  switch (status.validity()) {
    case validity_t::valid:
      return true;
    case validity_t::unresolved_transactions:
      return force;
    case validity_t::invalid:
      return false;
  }
  return false;
}

compose_result_t make_compose_error(const stash_error_t& error) {
  auto result = compose_result_t{};
  result.code = static_cast<uint32_t>(error.code);
  result.log = std::string{to_string(error.code)};
  result.info = error.info;
  result.codespace = std::string{kComposeCodespace};
  return result;
}

query_result_t make_query_error(const query_error_code code,
                                const std::string_view log,
                                const bytes_view_t& key) {
  auto result = query_result_t{};
  result.code = static_cast<uint32_t>(code);
  result.log = std::string{log};
  result.key = make_bytes(key);
  result.codespace = std::string{kQueryCodespace};
  return result;
}

}  // namespace

template <typename Library>
processor<Library>::processor(consign::encoding::scale_encoder_t& encoder,
                              const consign::storage::storage<Library>& storage,
                              consign::validation::validator_t validator,
                              processor_options options)
    : encoder_{encoder},
      storage_{storage},
      validator_{std::move(validator)},
      options_{options} {
  if (!validator_) {
    validator_ = consign::validation::validate_structure;
  }
}

template <typename Library>
std::mutex& processor<Library>::contract_mutex(
    const contract_id_t& contract_id) {
  auto lock = std::scoped_lock{contracts_mutex_};
  auto& mutex = contract_mutexes_[contract_id];
  if (!mutex) {
    mutex = std::make_unique<std::mutex>();
  }
  return *mutex;
}

template <typename Library>
std::size_t processor<Library>::locked_contract_count() const {
  auto lock = std::scoped_lock{contracts_mutex_};
  return contract_mutexes_.size();
}

template <typename Library>
ingest_result_t processor<Library>::process_consignment(
    const consignment_t& consignment,
    const consign::validation::chain_access& chain,
    const bool force) {
  auto result = ingest_result_t{};
  result.codespace = std::string{kIngestCodespace};
  result.contract_id = make_contract_id(consignment.genesis);
  result.consignment_id = make_consignment_id(consignment);
  const auto& contract_id = result.contract_id;

  spdlog::info("Ingesting consignment {} for contract {}",
               to_hex(result.consignment_id), to_hex(contract_id));

  auto lock = std::scoped_lock{contract_mutex(contract_id)};

  auto state = storage_.template get<contract_state_t>(
      encoder_,
      make_bytes_view(key::make_contract_state_key(encoder_, contract_id)));
  if (!state) {
    spdlog::debug("Contract {} is new to the stash", to_hex(contract_id));
    state = make_contract_state(contract_id, consignment.genesis);
  }

  result.status = validator_(consignment, chain);
  auto validity = result.status.validity();
  if (!accepts(result.status, force)) {
    spdlog::warn("Consignment {} not merged: {}",
                 to_hex(result.consignment_id), to_string(validity));
    for (const auto& failure : result.status.failures) {
      spdlog::debug("  failure: {}", failure);
    }
    result.log = "consignment not merged";
    result.info = std::string{to_string(validity)};
    return result;
  }
  if (validity == validity_t::unresolved_transactions) {
    spdlog::warn("Forcing import of consignment {} with {} unresolved "
                 "witness transaction(s)",
                 to_hex(result.consignment_id),
                 result.status.unresolved_txids.size());
  }

  auto error = stash_error_t{};
  if (!merge_consignment(consignment, contract_id, std::move(*state), error)) {
    spdlog::error("Import of consignment {} aborted: {} ({})",
                  to_hex(result.consignment_id), to_string(error.code),
                  error.info);
    result.code = static_cast<uint32_t>(error.code);
    result.log = std::string{to_string(error.code)};
    result.info = error.info;
    return result;
  }

  result.stored = true;
  result.info = std::string{to_string(validity)};
  spdlog::info("Consignment {} merged into contract {}",
               to_hex(result.consignment_id), to_hex(contract_id));
  return result;
}

template <typename Library>
bool processor<Library>::merge_consignment(const consignment_t& consignment,
                                           const contract_id_t& contract_id,
                                           contract_state_t state,
                                           stash_error_t& error) {
  auto lock = std::scoped_lock{write_mutex_};
  auto batch = consign::storage::stash_batch<Library,
                                             consign::encoding::scale_encoder_t>{
      storage_, encoder_};

  batch.store(make_bytes_view(key::make_schema_key(
                  encoder_, make_schema_id(consignment.schema))),
              consignment.schema);
  if (consignment.root_schema.has_value()) {
    batch.store(make_bytes_view(key::make_schema_key(
                    encoder_, make_schema_id(*consignment.root_schema))),
                *consignment.root_schema);
  }
  if (!batch.store_merge(
          make_bytes_view(key::make_genesis_key(encoder_, contract_id)),
          consignment.genesis)) {
    error = {.code = stash_error_code::merge_conflict,
             .info = "genesis " + to_hex(contract_id)};
    return false;
  }

  for (const auto& anchored : consignment.anchored_bundles) {
    const auto& witness_txid = anchored.anchor.txid;
    auto bundle_id = make_bundle_id(anchored.bundle);
    auto block = into_merkle_block(anchored.anchor, contract_id, bundle_id);
    if (!block) {
      error = {.code = stash_error_code::unrelated_anchor,
               .info = to_hex(witness_txid)};
      return false;
    }
    if (!batch.store_merge(
            make_bytes_view(key::make_anchor_key(encoder_, witness_txid)),
            *block)) {
      error = {.code = stash_error_code::merge_conflict,
               .info = "anchor " + to_hex(witness_txid)};
      return false;
    }

    for (const auto& item : anchored.bundle.items) {
      if (!item.transition.has_value()) {
        continue;
      }
      const auto& transition = *item.transition;
      add_transition(state, witness_txid, transition);
      if (!batch.store_merge(make_bytes_view(key::make_transition_key(
                                 encoder_, item.node_id)),
                             transition)) {
        error = {.code = stash_error_code::merge_conflict,
                 .info = "transition " + to_hex(item.node_id)};
        return false;
      }
      batch.store(make_bytes_view(
                      key::make_transition_txid_key(encoder_, item.node_id)),
                  witness_txid);
      batch.insert_into_set(
          make_bytes_view(key::make_contract_transitions_key(
              encoder_, contract_id, transition.transition_type)),
          item.node_id);
    }

    if (!batch.store_merge(make_bytes_view(key::make_bundle_key(
                               encoder_, contract_id, witness_txid)),
                           anchored.bundle)) {
      error = {.code = stash_error_code::merge_conflict,
               .info = "bundle " + to_hex(bundle_id)};
      return false;
    }
  }

  for (const auto& extension : consignment.state_extensions) {
    auto node_id = make_node_id(extension);
    add_extension(state, extension);
    if (!batch.store_merge(
            make_bytes_view(key::make_extension_key(encoder_, node_id)),
            extension)) {
      error = {.code = stash_error_code::merge_conflict,
               .info = "extension " + to_hex(node_id)};
      return false;
    }
  }

  batch.store(
      make_bytes_view(key::make_contract_state_key(encoder_, contract_id)),
      state);
  spdlog::debug("Committing {} stash record(s) for contract {}", batch.size(),
                to_hex(contract_id));
  batch.commit();
  return true;
}

template <typename Library>
std::optional<genesis_t> processor<Library>::load_genesis(
    const contract_id_t& contract_id,
    stash_error_t& error) const {
  auto genesis = storage_.template get<genesis_t>(
      encoder_, make_bytes_view(key::make_genesis_key(encoder_, contract_id)));
  if (!genesis) {
    error = {.code = stash_error_code::genesis_absent,
             .info = to_hex(contract_id)};
  }
  return genesis;
}

template <typename Library>
std::optional<consignment_t> processor<Library>::compose(
    const consignment_purpose purpose,
    const contract_id_t& contract_id,
    const genesis_t& genesis,
    const std::optional<std::vector<transition_type_t>>& include,
    const outpoint_selection_t& selection,
    stash_error_t& error) {
  auto schema = storage_.template get<schema_t>(
      encoder_,
      make_bytes_view(key::make_schema_key(encoder_, genesis.schema_id)));
  if (!schema) {
    error = {.code = stash_error_code::schema_absent,
             .info = to_hex(genesis.schema_id)};
    return std::nullopt;
  }
  auto root_schema = std::optional<schema_t>{};
  if (schema->root_id.has_value()) {
    root_schema = storage_.template get<schema_t>(
        encoder_,
        make_bytes_view(key::make_schema_key(encoder_, *schema->root_id)));
    if (!root_schema) {
      error = {.code = stash_error_code::schema_absent,
               .info = to_hex(*schema->root_id)};
      return std::nullopt;
    }
  }

  auto types = include.value_or(schema->transition_types);
  std::ranges::sort(types);
  auto duplicates = std::ranges::unique(types);
  types.erase(std::begin(duplicates), std::end(duplicates));

  auto walker = collector<Library>{contract_id, storage_, encoder_};
  auto tips = std::vector<node_outpoint_t>{};
  for (const auto type : types) {
    auto node_ids = storage_.template get<std::vector<node_id_t>>(
        encoder_, make_bytes_view(key::make_contract_transitions_key(
                      encoder_, contract_id, type)));
    if (!node_ids) {
      spdlog::debug("Contract {} has no transitions of type {}",
                    to_hex(contract_id), type);
      continue;
    }
    auto found = walker.process(*node_ids, selection, error);
    if (!found) {
      return std::nullopt;
    }
    tips.insert(std::end(tips), std::begin(*found), std::end(*found));
  }
  if (!walker.iterate(error)) {
    return std::nullopt;
  }
  return walker.consignment(purpose, *schema, root_schema, genesis, tips,
                            options_.max_anchored_bundles, error);
}

template <typename Library>
compose_result_t processor<Library>::compose_consignment(
    const contract_id_t& contract_id,
    const std::vector<transition_type_t>& include,
    const outpoint_selection_t& selection) {
  spdlog::info("Composing transfer for contract {} over {} transition type(s)",
               to_hex(contract_id), include.size());
  auto error = stash_error_t{};
  // Unknown contracts never get a lock entry.
  auto genesis = load_genesis(contract_id, error);
  if (!genesis) {
    spdlog::error("Compose for contract {} failed: {} ({})",
                  to_hex(contract_id), to_string(error.code), error.info);
    return make_compose_error(error);
  }
  auto lock = std::scoped_lock{contract_mutex(contract_id)};
  auto consignment = compose(consignment_purpose::transfer, contract_id,
                             *genesis, include, selection, error);
  if (!consignment) {
    spdlog::error("Compose for contract {} failed: {} ({})",
                  to_hex(contract_id), to_string(error.code), error.info);
    return make_compose_error(error);
  }
  spdlog::info("Composed consignment with {} endpoint(s) and {} anchored "
               "bundle(s)",
               consignment->endpoints.size(),
               consignment->anchored_bundles.size());
  auto result = compose_result_t{};
  result.codespace = std::string{kComposeCodespace};
  result.consignment = std::move(consignment);
  return result;
}

template <typename Library>
compose_result_t processor<Library>::export_contract(
    const contract_id_t& contract_id) {
  spdlog::info("Exporting contract {}", to_hex(contract_id));
  auto error = stash_error_t{};
  auto genesis = load_genesis(contract_id, error);
  if (!genesis) {
    spdlog::error("Export of contract {} failed: {} ({})",
                  to_hex(contract_id), to_string(error.code), error.info);
    return make_compose_error(error);
  }
  auto lock = std::scoped_lock{contract_mutex(contract_id)};
  auto consignment = compose(consignment_purpose::contract, contract_id,
                             *genesis, std::nullopt, select_all_t{}, error);
  if (!consignment) {
    spdlog::error("Export of contract {} failed: {} ({})",
                  to_hex(contract_id), to_string(error.code), error.info);
    return make_compose_error(error);
  }
  auto result = compose_result_t{};
  result.codespace = std::string{kComposeCodespace};
  result.consignment = std::move(consignment);
  return result;
}

template <typename Library>
std::vector<contract_id_t> processor<Library>::list_contracts() const {
  auto contracts = std::vector<contract_id_t>{};
  auto prefix = key::make_prefix_key(encoder_, key::kContractStateKeyPrefix);
  for (const auto& [stored_key, value] :
       storage_.list_by_prefix(make_bytes_view(prefix))) {
    auto contract_id =
        key::parse_contract_state_key(encoder_, make_bytes_view(stored_key));
    if (!contract_id) {
      spdlog::warn("Skipping malformed contract state key {}",
                   to_hex(make_bytes_view(stored_key)));
      continue;
    }
    contracts.push_back(*contract_id);
  }
  return contracts;
}

template <typename Library>
std::optional<contract_state_t> processor<Library>::contract_state(
    const contract_id_t& contract_id) const {
  return storage_.template get<contract_state_t>(
      encoder_,
      make_bytes_view(key::make_contract_state_key(encoder_, contract_id)));
}

template <typename Library>
query_result_t processor<Library>::query(const std::string_view path,
                                         const bytes_view_t& data) const {
  if (path == "/contracts") {
    auto result = query_result_t{};
    result.key = make_bytes(data);
    result.value = encoder_.encode(list_contracts());
    result.codespace = std::string{kQueryCodespace};
    return result;
  }
  if (path != "/contract/state" && path != "/contract/genesis" &&
      path != "/contract/schema") {
    return make_query_error(query_error_code::unsupported_path,
                            "unsupported path", data);
  }

  auto contract_id = std::optional<contract_id_t>{};
  if (data.size() == contract_id_t{}.size()) {
    contract_id = encoder_.template try_decode<contract_id_t>(data);
  }
  if (!contract_id) {
    return make_query_error(query_error_code::invalid_key,
                            "expected a 32 byte contract id", data);
  }

  auto result = query_result_t{};
  result.key = make_bytes(data);
  result.codespace = std::string{kQueryCodespace};
  if (path == "/contract/state") {
    auto state = contract_state(*contract_id);
    if (!state) {
      return make_query_error(query_error_code::not_found,
                              "contract not found", data);
    }
    result.value = encoder_.encode(*state);
    return result;
  }

  auto genesis = storage_.template get<genesis_t>(
      encoder_, make_bytes_view(key::make_genesis_key(encoder_, *contract_id)));
  if (!genesis) {
    return make_query_error(query_error_code::not_found, "contract not found",
                            data);
  }
  if (path == "/contract/genesis") {
    result.value = encoder_.encode(*genesis);
    return result;
  }
  auto schema = storage_.template get<schema_t>(
      encoder_,
      make_bytes_view(key::make_schema_key(encoder_, genesis->schema_id)));
  if (!schema) {
    return make_query_error(query_error_code::not_found, "schema not found",
                            data);
  }
  result.value = encoder_.encode(*schema);
  return result;
}

template class processor<consign::storage::rocksdb_storage_tag>;
template class processor<consign::storage::memory_storage_tag>;

}  // namespace consign::processor
