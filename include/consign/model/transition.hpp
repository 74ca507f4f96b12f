#pragma once
#include <consign/model/assignment.hpp>
#include <consign/model/outpoint.hpp>
#include <consign/model/primitives.hpp>
#include <cstdint>
#include <vector>

namespace consign::model {

template <uint16_t Version>
struct transition;

template <>
struct transition<1> final {
  uint16_t version{1};
  transition_type_t transition_type{};
  std::vector<node_outpoint_t> parent_outputs;
  bytes_t metadata;
  owned_rights_t owned_rights;

  bool operator==(const transition<1>&) const = default;
};

using transition_t = transition<1>;

/// Distinct node ids whose outputs `value` spends, in first-seen order.
std::vector<node_id_t> parent_nodes(const transition_t& value);

bool merge(transition_t& existing, const transition_t& incoming);

}  // namespace consign::model
