#pragma once
#include <consign/model/primitives.hpp>
#include <algorithm>
#include <compare>
#include <cstdint>
#include <variant>
#include <vector>

namespace consign::model {

/// Base-ledger transaction output.
struct outpoint_t final {
  txid_t txid{};
  uint32_t vout{};

  auto operator<=>(const outpoint_t&) const = default;
};

/// One produced assignment of a node; `output` is the flattened position of
/// the assignment inside the node's owned rights.
struct node_outpoint_t final {
  node_id_t node_id{};
  uint16_t output{};

  auto operator<=>(const node_outpoint_t&) const = default;
};

struct select_all_t final {};
using outpoint_selection_t = std::variant<select_all_t, std::vector<outpoint_t>>;

inline bool includes(const outpoint_selection_t& selection,
                     const outpoint_t& outpoint) {
  return std::visit(
      overloaded{[](const select_all_t&) { return true; },
                 [&](const std::vector<outpoint_t>& selected) {
                   return std::ranges::find(selected, outpoint) !=
                          std::end(selected);
                 }},
      selection);
}

}  // namespace consign::model
