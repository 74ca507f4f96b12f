#pragma once
#include <consign/model/primitives.hpp>
#include <algorithm>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace consign::model {

template <uint16_t Version>
struct schema;

template <>
struct schema<1> final {
  uint16_t version{1};
  std::string name;
  // Parent schema this one extends.
  std::optional<schema_id_t> root_id;
  std::vector<transition_type_t> transition_types;
  std::vector<extension_type_t> extension_types;
  std::vector<assignment_type_t> assignment_types;

  bool operator==(const schema<1>&) const = default;
};

using schema_t = schema<1>;

inline bool declares_transition(const schema_t& value,
                                const transition_type_t type) {
  return std::ranges::find(value.transition_types, type) !=
         std::end(value.transition_types);
}

inline bool declares_extension(const schema_t& value,
                               const extension_type_t type) {
  return std::ranges::find(value.extension_types, type) !=
         std::end(value.extension_types);
}

}  // namespace consign::model
