#pragma once

#include <consign/model/enum_string.hpp>
#include <consign/model/primitives.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace consign::model {

enum class validity_t : uint8_t {
  valid = 0,
  // Structurally valid, but some witness transactions are not mined yet.
  unresolved_transactions = 1,
  invalid = 2,
};

inline constexpr auto kValidityMappings = std::array{
    std::pair<std::string_view, validity_t>{"valid", validity_t::valid},
    std::pair<std::string_view, validity_t>{
        "unresolved_transactions", validity_t::unresolved_transactions},
    std::pair<std::string_view, validity_t>{"invalid", validity_t::invalid}};

inline constexpr std::string_view to_string(const validity_t value) {
  return to_string(value, kValidityMappings).value_or("unknown");
}

template <uint16_t Version>
struct validation_status;

template <>
struct validation_status<1> final {
  uint16_t version{1};
  std::vector<std::string> failures;
  std::vector<std::string> warnings;
  std::vector<txid_t> unresolved_txids;

  validity_t validity() const {
    if (!failures.empty()) {
      return validity_t::invalid;
    }
    if (!unresolved_txids.empty()) {
      return validity_t::unresolved_transactions;
    }
    return validity_t::valid;
  }

  bool operator==(const validation_status<1>&) const = default;
};

using validation_status_t = validation_status<1>;

}  // namespace consign::model
