#pragma once
#include <consign/model/assignment.hpp>
#include <consign/model/primitives.hpp>
#include <cstdint>

namespace consign::model {

template <uint16_t Version>
struct extension;

// Extends contract state without spending an output, so it has no witness
// transaction.
template <>
struct extension<1> final {
  uint16_t version{1};
  extension_type_t extension_type{};
  contract_id_t contract_id{};
  bytes_t metadata;
  owned_rights_t owned_rights;

  bool operator==(const extension<1>&) const = default;
};

using extension_t = extension<1>;

bool merge(extension_t& existing, const extension_t& incoming);

}  // namespace consign::model
