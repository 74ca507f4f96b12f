#include <consign/testing/contract_fixture.hpp>
#include <consign/validation/chain_access.hpp>
#include <consign/validation/validator.hpp>
#include <gtest/gtest.h>

#include <algorithm>
#include <cstdint>
#include <string>
#include <vector>

using namespace consign::testing;

namespace {

bool mentions(const std::vector<std::string>& messages,
              const std::string_view fragment) {
  return std::ranges::any_of(messages, [&](const std::string& message) {
    return message.find(fragment) != std::string::npos;
  });
}

}  // namespace

TEST(validator, confirmed_consignment_is_valid) {
  auto contract = chain_contract{};
  auto chain =
      consign::validation::offline_chain_access{{contract.x1, contract.x2}};
  auto status =
      consign::validation::validate_structure(contract.consignment(), chain);
  EXPECT_TRUE(status.failures.empty());
  EXPECT_TRUE(status.unresolved_txids.empty());
  EXPECT_EQ(status.validity(), consign::model::validity_t::valid);
}

TEST(validator, unmined_witness_is_unresolved) {
  auto contract = chain_contract{};
  auto chain = consign::validation::offline_chain_access{{contract.x1}};
  auto status =
      consign::validation::validate_structure(contract.consignment(), chain);
  EXPECT_EQ(status.validity(),
            consign::model::validity_t::unresolved_transactions);
  ASSERT_EQ(status.unresolved_txids.size(), 1u);
  EXPECT_EQ(status.unresolved_txids[0], contract.x2);
}

TEST(validator, genesis_must_commit_to_the_schema) {
  auto contract = chain_contract{};
  auto consignment = contract.consignment();
  consignment.schema.name = "other";
  auto status = consign::validation::validate_structure(
      consignment, consign::validation::offline_chain_access{});
  EXPECT_EQ(status.validity(), consign::model::validity_t::invalid);
  EXPECT_TRUE(mentions(status.failures, "genesis commits to schema"));
}

TEST(validator, root_schema_must_match_reference) {
  auto root = make_schema();
  root.name = "root";
  auto schema = make_schema(consign::model::make_schema_id(root));
  auto genesis = make_genesis(schema, {make_assignment(1, 0, make_hash(1))});

  auto consignment = make_consignment(schema, genesis, {});
  auto status = consign::validation::validate_structure(
      consignment, consign::validation::offline_chain_access{});
  EXPECT_TRUE(mentions(status.failures, "root schema"));

  consignment.root_schema = root;
  status = consign::validation::validate_structure(
      consignment, consign::validation::offline_chain_access{});
  EXPECT_EQ(status.validity(), consign::model::validity_t::valid);
}

TEST(validator, anchor_must_commit_to_the_bundle) {
  auto contract = chain_contract{};
  auto consignment = contract.consignment();
  // Swap the anchors of the two bundles.
  std::swap(consignment.anchored_bundles[0].anchor,
            consignment.anchored_bundles[1].anchor);
  auto status = consign::validation::validate_structure(
      consignment,
      consign::validation::offline_chain_access{{contract.x1, contract.x2}});
  EXPECT_EQ(status.validity(), consign::model::validity_t::invalid);
  EXPECT_TRUE(mentions(status.failures, "does not commit to bundle"));
}

TEST(validator, tampered_transition_is_invalid) {
  auto contract = chain_contract{};
  auto consignment = contract.consignment();
  auto& item = consignment.anchored_bundles[1].bundle.items[0];
  ASSERT_TRUE(item.transition.has_value());
  item.transition->metadata = consign::model::bytes_t{1};
  auto status = consign::validation::validate_structure(
      consignment,
      consign::validation::offline_chain_access{{contract.x1, contract.x2}});
  EXPECT_TRUE(mentions(status.failures, "does not match its id"));
}

TEST(validator, undeclared_types_and_unknown_parents_are_invalid) {
  auto contract = chain_contract{};
  auto orphan = make_transition(kTransferType,
                                {output_of(make_hash(99), 0)},
                                {make_assignment(1, 0)});
  auto foreign = make_transition(42, {output_of(contract.contract_id, 0)},
                                 {make_assignment(1, 0)});
  auto overspent = make_transition(kTransferType,
                                   {output_of(contract.contract_id, 5)},
                                   {make_assignment(1, 0)});
  auto consignment = make_consignment(
      contract.schema, contract.genesis,
      {make_anchored_bundle(contract.contract_id, make_hash(13),
                            {orphan, foreign, overspent})});
  auto status = consign::validation::validate_structure(
      consignment, consign::validation::offline_chain_access{{make_hash(13)}});
  EXPECT_TRUE(mentions(status.failures, "spends unknown node"));
  EXPECT_TRUE(mentions(status.failures, "has undeclared type 42"));
  EXPECT_TRUE(mentions(status.failures, "spends missing output 5"));
}

TEST(validator, extensions_must_belong_to_the_contract) {
  auto contract = chain_contract{};
  auto consignment = contract.consignment();
  consignment.state_extensions.push_back(
      make_extension(make_hash(98), {make_assignment(1, 0, make_hash(2))}));
  auto status = consign::validation::validate_structure(
      consignment,
      consign::validation::offline_chain_access{{contract.x1, contract.x2}});
  EXPECT_TRUE(mentions(status.failures, "belongs to another contract"));
}

TEST(validator, endpoints_must_reference_carried_bundles) {
  auto contract = chain_contract{};
  auto consignment = contract.consignment();
  consignment.endpoints.push_back(consign::model::endpoint_t{
      .bundle_id = make_hash(97),
      .seal_endpoint = consign::model::witness_vout_t{.vout = 0}});
  auto status = consign::validation::validate_structure(
      consignment,
      consign::validation::offline_chain_access{{contract.x1, contract.x2}});
  EXPECT_TRUE(mentions(status.failures, "endpoint refers to unknown bundle"));
}

TEST(validator, closure_is_required_only_behind_endpoints) {
  auto contract = chain_contract{};
  auto tip = make_transition(kTransferType, {output_of(contract.contract_id, 0)},
                             {make_assignment(1000, 0)});
  auto tip_id = consign::model::make_node_id(tip);
  auto detached = make_transition(kTransferType, {output_of(make_hash(99), 0)},
                                  {make_assignment(1, 1)});
  auto consignment = make_consignment(
      contract.schema, contract.genesis,
      {make_anchored_bundle(contract.contract_id, make_hash(13),
                            {tip, detached})});
  consignment.endpoint_transitions = {output_of(tip_id, 0)};
  auto chain = consign::validation::offline_chain_access{{make_hash(13)}};

  auto status = consign::validation::validate_structure(consignment, chain);
  EXPECT_TRUE(status.failures.empty());
  EXPECT_TRUE(mentions(status.warnings, "spends unknown node"));
  EXPECT_EQ(status.validity(), consign::model::validity_t::valid);

  consignment.endpoint_transitions.push_back(
      output_of(consign::model::make_node_id(detached), 0));
  status = consign::validation::validate_structure(consignment, chain);
  EXPECT_TRUE(mentions(status.failures, "spends unknown node"));
  EXPECT_EQ(status.validity(), consign::model::validity_t::invalid);
}

TEST(validator, nodes_are_limited_to_addressable_outputs) {
  auto contract = chain_contract{};
  auto assignments = std::vector<consign::model::assignment_t>{};
  for (auto vout = uint32_t{0}; vout <= consign::model::kMaxNodeOutputs;
       ++vout) {
    assignments.push_back(make_assignment(1, vout));
  }
  auto wide = make_transition(kTransferType,
                              {output_of(contract.contract_id, 0)},
                              std::move(assignments));
  auto consignment = make_consignment(
      contract.schema, contract.genesis,
      {make_anchored_bundle(contract.contract_id, make_hash(13), {wide})});
  auto status = consign::validation::validate_structure(
      consignment, consign::validation::offline_chain_access{{make_hash(13)}});
  EXPECT_EQ(status.validity(), consign::model::validity_t::invalid);
  EXPECT_TRUE(mentions(status.failures, "produces 65536 outputs"));
}
