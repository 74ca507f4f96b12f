#pragma once
#include <consign/model/anchor.hpp>
#include <consign/model/bundle.hpp>
#include <consign/model/enum_string.hpp>
#include <consign/model/extension.hpp>
#include <consign/model/genesis.hpp>
#include <consign/model/outpoint.hpp>
#include <consign/model/primitives.hpp>
#include <consign/model/schema.hpp>
#include <consign/model/seal.hpp>
#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

namespace consign::model {

// Upper bound of the anchored bundle list (24 bit length).
inline constexpr auto kMaxAnchoredBundles = std::size_t{0xFFFFFF};

enum class consignment_purpose : uint8_t {
  // Whole contract history, used to export a contract's source.
  contract = 0,
  // Minimal provenance proof for a set of disclosed outputs.
  transfer = 1,
};

inline constexpr auto kConsignmentPurposeMappings = std::array{
    std::pair<std::string_view, consignment_purpose>{
        "contract", consignment_purpose::contract},
    std::pair<std::string_view, consignment_purpose>{
        "transfer", consignment_purpose::transfer}};

inline constexpr std::string_view to_string(const consignment_purpose value) {
  return to_string(value, kConsignmentPurposeMappings).value_or("unknown");
}

/// Output disclosed to the recipient.
struct endpoint_t final {
  bundle_id_t bundle_id{};
  seal_endpoint_t seal_endpoint;

  bool operator==(const endpoint_t&) const = default;
};

struct anchored_bundle_t final {
  anchor_merkle_proof_t anchor;
  transition_bundle_t bundle;

  bool operator==(const anchored_bundle_t&) const = default;
};

template <uint16_t Version>
struct consignment;

template <>
struct consignment<1> final {
  uint16_t version{1};
  consignment_purpose purpose{consignment_purpose::transfer};
  schema_t schema;
  std::optional<schema_t> root_schema;
  genesis_t genesis;
  // Node outputs the recipient will own.
  std::vector<node_outpoint_t> endpoint_transitions;
  std::vector<endpoint_t> endpoints;
  std::vector<anchored_bundle_t> anchored_bundles;
  std::vector<extension_t> state_extensions;

  bool operator==(const consignment<1>&) const = default;
};

using consignment_t = consignment<1>;

}  // namespace consign::model
