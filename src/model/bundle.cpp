#include <consign/model/bundle.hpp>
#include <consign/model/identity.hpp>

#include <algorithm>

namespace consign::model {

std::optional<reveal_error> insert_transition(transition_bundle_t& bundle,
                                              const transition_t& value,
                                              std::vector<uint16_t> inputs) {
  auto node_id = make_node_id(value);
  auto position = std::ranges::lower_bound(bundle.items, node_id, {},
                                           &bundle_item_t::node_id);
  if (position != std::end(bundle.items) && position->node_id == node_id) {
    return reveal_transition(bundle, value);
  }
  if (bundle.items.size() >= kMaxBundleTransitions) {
    return reveal_error::oversized;
  }
  bundle.items.insert(position, bundle_item_t{.node_id = node_id,
                                              .inputs = std::move(inputs),
                                              .transition = value});
  return std::nullopt;
}

std::optional<reveal_error> reveal_transition(transition_bundle_t& bundle,
                                              const transition_t& value) {
  auto node_id = make_node_id(value);
  auto position = std::ranges::lower_bound(bundle.items, node_id, {},
                                           &bundle_item_t::node_id);
  if (position == std::end(bundle.items) || position->node_id != node_id) {
    return reveal_error::unknown_transition;
  }
  if (position->transition.has_value()) {
    if (!merge(*position->transition, value)) {
      return reveal_error::mismatch;
    }
  } else {
    position->transition = value;
  }
  return std::nullopt;
}

transition_bundle_t conceal_transitions(const transition_bundle_t& bundle) {
  auto concealed = bundle;
  for (auto& item : concealed.items) {
    item.transition.reset();
  }
  return concealed;
}

std::size_t revealed_count(const transition_bundle_t& bundle) {
  return static_cast<std::size_t>(
      std::ranges::count_if(bundle.items, [](const bundle_item_t& item) {
        return item.transition.has_value();
      }));
}

bool merge(transition_bundle_t& existing, const transition_bundle_t& incoming) {
  if (existing.items.size() != incoming.items.size()) {
    return false;
  }
  auto merged = existing;
  for (std::size_t i = 0; i < merged.items.size(); ++i) {
    auto& item = merged.items[i];
    const auto& other = incoming.items[i];
    if (item.node_id != other.node_id || item.inputs != other.inputs) {
      return false;
    }
    if (!other.transition.has_value()) {
      continue;
    }
    if (!item.transition.has_value()) {
      item.transition = other.transition;
    } else if (!merge(*item.transition, *other.transition)) {
      return false;
    }
  }
  existing = std::move(merged);
  return true;
}

}  // namespace consign::model
