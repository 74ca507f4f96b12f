#pragma once
#include <consign/model/assignment.hpp>
#include <consign/model/primitives.hpp>
#include <cstdint>

namespace consign::model {

template <uint16_t Version>
struct genesis;

template <>
struct genesis<1> final {
  uint16_t version{1};
  schema_id_t schema_id{};
  // Genesis block hash of the base ledger the contract is anchored to.
  hash32_t chain{};
  bytes_t metadata;
  owned_rights_t owned_rights;

  bool operator==(const genesis<1>&) const = default;
};

using genesis_t = genesis<1>;

bool merge(genesis_t& existing, const genesis_t& incoming);

}  // namespace consign::model
