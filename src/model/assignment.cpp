#include <consign/model/assignment.hpp>

namespace consign::model {

owned_rights_t conceal_seals(const owned_rights_t& rights) {
  auto concealed = rights;
  for (auto& right : concealed) {
    for (auto& assignment : right.assignments) {
      assignment.seal = conceal(assignment.seal);
    }
  }
  return concealed;
}

bool merge_owned_rights(owned_rights_t& existing,
                        const owned_rights_t& incoming) {
  if (existing.size() != incoming.size()) {
    return false;
  }
  for (std::size_t i = 0; i < existing.size(); ++i) {
    auto& ours = existing[i];
    const auto& theirs = incoming[i];
    if (ours.assignment_type != theirs.assignment_type ||
        ours.assignments.size() != theirs.assignments.size()) {
      return false;
    }
    for (std::size_t j = 0; j < ours.assignments.size(); ++j) {
      auto& assignment = ours.assignments[j];
      const auto& other = theirs.assignments[j];
      if (assignment.state != other.state ||
          conceal(assignment.seal) != conceal(other.seal)) {
        return false;
      }
      if (std::holds_alternative<concealed_seal_t>(assignment.seal) &&
          std::holds_alternative<revealed_seal_t>(other.seal)) {
        assignment.seal = other.seal;
      }
    }
  }
  return true;
}

}  // namespace consign::model
