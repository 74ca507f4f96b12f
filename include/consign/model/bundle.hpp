#pragma once
#include <consign/model/enum_string.hpp>
#include <consign/model/primitives.hpp>
#include <consign/model/transition.hpp>
#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

namespace consign::model {

inline constexpr auto kMaxBundleTransitions = std::size_t{0xFFFF};

struct bundle_item_t final {
  node_id_t node_id{};
  // Witness transaction inputs spent by the transition.
  std::vector<uint16_t> inputs;
  // Unset while the transition is concealed.
  std::optional<transition_t> transition;

  bool operator==(const bundle_item_t&) const = default;
};

template <uint16_t Version>
struct transition_bundle;

/// All transitions of one contract anchored by a single witness transaction.
/// Items are kept sorted by node id.
template <>
struct transition_bundle<1> final {
  uint16_t version{1};
  std::vector<bundle_item_t> items;

  bool operator==(const transition_bundle<1>&) const = default;
};

using transition_bundle_t = transition_bundle<1>;

enum class reveal_error : uint8_t {
  unknown_transition = 1,
  oversized = 2,
  mismatch = 3,
};

inline constexpr auto kRevealErrorMappings = std::array{
    std::pair<std::string_view, reveal_error>{"unknown_transition",
                                              reveal_error::unknown_transition},
    std::pair<std::string_view, reveal_error>{"oversized",
                                              reveal_error::oversized},
    std::pair<std::string_view, reveal_error>{"mismatch",
                                              reveal_error::mismatch}};

inline constexpr std::string_view to_string(const reveal_error value) {
  return to_string(value, kRevealErrorMappings).value_or("unknown");
}

/// Add a revealed transition spending witness `inputs`.
std::optional<reveal_error> insert_transition(transition_bundle_t& bundle,
                                              const transition_t& value,
                                              std::vector<uint16_t> inputs);

/// Reveal `value` in place of its concealed item. Revealing an already
/// revealed transition merges seal data.
std::optional<reveal_error> reveal_transition(transition_bundle_t& bundle,
                                              const transition_t& value);

/// Copy of `bundle` with every transition concealed.
transition_bundle_t conceal_transitions(const transition_bundle_t& bundle);

std::size_t revealed_count(const transition_bundle_t& bundle);

/// Overlay the transitions revealed in `incoming`. Both must commit to the
/// same items.
bool merge(transition_bundle_t& existing, const transition_bundle_t& incoming);

}  // namespace consign::model
