#include <consign/model/identity.hpp>
#include <consign/validation/validator.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <map>
#include <set>
#include <string>
#include <vector>

using namespace consign::model;

namespace consign::validation {

namespace {

std::size_t output_count(const owned_rights_t& rights) {
  auto count = std::size_t{0};
  for (const auto& right : rights) {
    count += right.assignments.size();
  }
  return count;
}

void check_assignment_types(const schema_t& schema,
                            const owned_rights_t& rights,
                            const std::string& subject,
                            validation_status_t& status) {
  for (const auto& right : rights) {
    if (std::ranges::find(schema.assignment_types, right.assignment_type) ==
        std::end(schema.assignment_types)) {
      status.failures.push_back(subject + " uses undeclared assignment type " +
                                std::to_string(right.assignment_type));
    }
  }
}

void check_output_count(const owned_rights_t& rights,
                        const std::string& subject,
                        validation_status_t& status) {
  auto count = output_count(rights);
  if (count > kMaxNodeOutputs) {
    status.failures.push_back(subject + " produces " + std::to_string(count) +
                              " outputs");
  }
}

void check_schemata(const consignment_t& consignment,
                    validation_status_t& status) {
  auto schema_id = make_schema_id(consignment.schema);
  if (consignment.genesis.schema_id != schema_id) {
    status.failures.push_back("genesis commits to schema " +
                              to_hex(consignment.genesis.schema_id) +
                              " but consignment carries " + to_hex(schema_id));
  }
  const auto& root_id = consignment.schema.root_id;
  if (root_id.has_value()) {
    if (!consignment.root_schema.has_value()) {
      status.failures.push_back("root schema " + to_hex(*root_id) +
                                " is missing");
    } else if (make_schema_id(*consignment.root_schema) != *root_id) {
      status.failures.push_back("root schema does not match id " +
                                to_hex(*root_id));
    }
  } else if (consignment.root_schema.has_value()) {
    status.warnings.push_back("root schema supplied for a schema without root");
  }
}

}  // namespace

validation_status_t validate_structure(const consignment_t& consignment,
                                       const chain_access& chain) {
  auto status = validation_status_t{};
  const auto& schema = consignment.schema;
  auto contract_id = make_contract_id(consignment.genesis);

  check_schemata(consignment, status);
  check_assignment_types(schema, consignment.genesis.owned_rights, "genesis",
                         status);
  check_output_count(consignment.genesis.owned_rights, "genesis", status);

  if (consignment.anchored_bundles.size() > kMaxAnchoredBundles) {
    status.failures.push_back("too many anchored bundles");
  }

  // Output counts of every node the consignment discloses.
  auto known_nodes = std::map<node_id_t, std::size_t>{};
  known_nodes.emplace(contract_id,
                      output_count(consignment.genesis.owned_rights));
  for (const auto& extension : consignment.state_extensions) {
    known_nodes.emplace(make_node_id(extension),
                        output_count(extension.owned_rights));
  }
  auto revealed = std::map<node_id_t, const transition_t*>{};
  for (const auto& anchored : consignment.anchored_bundles) {
    for (const auto& item : anchored.bundle.items) {
      if (item.transition.has_value()) {
        known_nodes.emplace(item.node_id,
                            output_count(item.transition->owned_rights));
        revealed.emplace(item.node_id, &*item.transition);
      }
    }
  }

  // Transitions whose ancestry must be complete: those reachable backward
  // from the endpoint transitions, or all of them when none are named.
  // Other revealed transitions may spend nodes the consignment omits.
  auto on_path = std::set<node_id_t>{};
  if (consignment.endpoint_transitions.empty()) {
    for (const auto& [node_id, transition] : revealed) {
      on_path.insert(node_id);
    }
  } else {
    auto pending = std::vector<node_id_t>{};
    for (const auto& tip : consignment.endpoint_transitions) {
      pending.push_back(tip.node_id);
    }
    while (!pending.empty()) {
      auto node_id = pending.back();
      pending.pop_back();
      auto found = revealed.find(node_id);
      if (found == std::end(revealed) || !on_path.insert(node_id).second) {
        continue;
      }
      for (const auto& parent : found->second->parent_outputs) {
        pending.push_back(parent.node_id);
      }
    }
  }

  auto witnesses = std::set<txid_t>{};
  auto bundle_ids = std::set<bundle_id_t>{};
  for (const auto& anchored : consignment.anchored_bundles) {
    const auto& txid = anchored.anchor.txid;
    if (!witnesses.insert(txid).second) {
      status.failures.push_back("witness " + to_hex(txid) +
                                " anchors more than one bundle");
      continue;
    }
    auto bundle_id = make_bundle_id(anchored.bundle);
    bundle_ids.insert(bundle_id);
    if (!into_merkle_block(anchored.anchor, contract_id, bundle_id)) {
      status.failures.push_back("anchor " + to_hex(txid) +
                                " does not commit to bundle " +
                                to_hex(bundle_id));
    }

    const auto& items = anchored.bundle.items;
    if (items.size() > kMaxBundleTransitions) {
      status.failures.push_back("bundle " + to_hex(bundle_id) +
                                " is oversized");
    }
    if (!std::ranges::is_sorted(items, {}, &bundle_item_t::node_id) ||
        std::ranges::adjacent_find(items, {}, &bundle_item_t::node_id) !=
            std::end(items)) {
      status.failures.push_back("bundle " + to_hex(bundle_id) +
                                " items are not strictly ordered");
    }

    for (const auto& item : items) {
      if (!item.transition.has_value()) {
        continue;
      }
      const auto& transition = *item.transition;
      auto subject = "transition " + to_hex(item.node_id);
      if (make_node_id(transition) != item.node_id) {
        status.failures.push_back(subject + " does not match its id");
      }
      if (!declares_transition(schema, transition.transition_type)) {
        status.failures.push_back(subject + " has undeclared type " +
                                  std::to_string(transition.transition_type));
      }
      check_assignment_types(schema, transition.owned_rights, subject, status);
      check_output_count(transition.owned_rights, subject, status);
      if (transition.parent_outputs.empty()) {
        status.failures.push_back(subject + " spends nothing");
      }
      auto& closure = on_path.contains(item.node_id) ? status.failures
                                                     : status.warnings;
      for (const auto& parent : transition.parent_outputs) {
        auto known = known_nodes.find(parent.node_id);
        if (known == std::end(known_nodes)) {
          closure.push_back(subject + " spends unknown node " +
                            to_hex(parent.node_id));
        } else if (parent.output >= known->second) {
          closure.push_back(subject + " spends missing output " +
                            std::to_string(parent.output) + " of " +
                            to_hex(parent.node_id));
        }
      }
    }

    if (!chain.is_mined(txid)) {
      status.unresolved_txids.push_back(txid);
    }
  }

  for (const auto& extension : consignment.state_extensions) {
    auto subject = "extension " + to_hex(make_node_id(extension));
    if (extension.contract_id != contract_id) {
      status.failures.push_back(subject + " belongs to another contract");
    }
    if (!declares_extension(schema, extension.extension_type)) {
      status.failures.push_back(subject + " has undeclared type " +
                                std::to_string(extension.extension_type));
    }
    check_assignment_types(schema, extension.owned_rights, subject, status);
    check_output_count(extension.owned_rights, subject, status);
  }

  for (const auto& endpoint : consignment.endpoints) {
    if (!bundle_ids.contains(endpoint.bundle_id)) {
      status.failures.push_back("endpoint refers to unknown bundle " +
                                to_hex(endpoint.bundle_id));
    }
  }
  for (const auto& tip : consignment.endpoint_transitions) {
    auto known = known_nodes.find(tip.node_id);
    if (known == std::end(known_nodes) || tip.output >= known->second) {
      status.warnings.push_back("endpoint transition " + to_hex(tip.node_id) +
                                " is not disclosed");
    }
  }

  spdlog::debug("Validated consignment for contract {}: {} ({} failures, {} "
                "warnings, {} unresolved)",
                to_hex(contract_id), to_string(status.validity()),
                status.failures.size(), status.warnings.size(),
                status.unresolved_txids.size());
  return status;
}

}  // namespace consign::validation
