#pragma once
#include <consign/model/primitives.hpp>
#include <consign/model/seal.hpp>
#include <cstddef>
#include <cstdint>
#include <variant>
#include <vector>

namespace consign::model {

/// Outputs a single node may produce; output indices are 16 bit.
inline constexpr auto kMaxNodeOutputs = std::size_t{0xFFFF};

struct fungible_state_t final {
  uint64_t amount{};

  bool operator==(const fungible_state_t&) const = default;
};

struct data_state_t final {
  bytes_t data;

  bool operator==(const data_state_t&) const = default;
};

using owned_state_t = std::variant<fungible_state_t, data_state_t>;

struct assignment_t final {
  seal_t seal;
  owned_state_t state;

  bool operator==(const assignment_t&) const = default;
};

struct owned_right_t final {
  assignment_type_t assignment_type{};
  std::vector<assignment_t> assignments;

  bool operator==(const owned_right_t&) const = default;
};

using owned_rights_t = std::vector<owned_right_t>;

/// Copy of `rights` with every seal replaced by its commitment.
owned_rights_t conceal_seals(const owned_rights_t& rights);

/// Upgrade concealed seals in `existing` to the revealed ones carried by
/// `incoming`. Returns false if the two do not describe the same outputs.
bool merge_owned_rights(owned_rights_t& existing,
                        const owned_rights_t& incoming);

/// Invoke `fn(output, assignment_type, assignment)` for every produced output
/// in flattened owned-rights order. Stops after `kMaxNodeOutputs` outputs.
template <typename Fn>
void for_each_output(const owned_rights_t& rights, Fn&& fn) {
  auto output = std::size_t{0};
  for (const auto& right : rights) {
    for (const auto& assignment : right.assignments) {
      if (output >= kMaxNodeOutputs) {
        return;
      }
      fn(static_cast<uint16_t>(output), right.assignment_type, assignment);
      ++output;
    }
  }
}

}  // namespace consign::model
