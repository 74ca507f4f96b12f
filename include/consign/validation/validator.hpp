#pragma once

#include <consign/model/consignment.hpp>
#include <consign/model/validation_status.hpp>
#include <consign/validation/chain_access.hpp>
#include <functional>

namespace consign::validation {

/// Consignment verdict. Never throws; every problem is reported in the
/// returned status.
using validator_t =
    std::function<consign::model::validation_status_t(
        const consign::model::consignment_t& consignment,
        const chain_access& chain)>;

/// Structural checks that do not need schema scripts: schema and genesis
/// binding, declared types, node and bundle id integrity, anchor
/// commitments, parent closure and witness confirmation.
consign::model::validation_status_t validate_structure(
    const consign::model::consignment_t& consignment,
    const chain_access& chain);

}  // namespace consign::validation
