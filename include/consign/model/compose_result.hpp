#pragma once

#include <consign/model/consignment.hpp>
#include <cstdint>
#include <optional>
#include <string>

namespace consign::model {

template <uint16_t Version>
struct compose_result;

template <>
struct compose_result<1> final {
  uint16_t version{1};
  uint32_t code{};
  std::string log;
  std::string info;
  std::string codespace;
  std::optional<consignment_t> consignment;
};

using compose_result_t = compose_result<1>;

}  // namespace consign::model
