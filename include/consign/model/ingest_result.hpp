#pragma once

#include <consign/model/primitives.hpp>
#include <consign/model/validation_status.hpp>
#include <cstdint>
#include <string>

namespace consign::model {

template <uint16_t Version>
struct ingest_result;

template <>
struct ingest_result<1> final {
  uint16_t version{1};
  uint32_t code{};
  std::string log;
  std::string info;
  std::string codespace;
  hash32_t consignment_id{};
  contract_id_t contract_id{};
  // Validator verdict; reported unchanged even when the import was forced.
  validation_status_t status;
  bool stored{};
};

using ingest_result_t = ingest_result<1>;

}  // namespace consign::model
