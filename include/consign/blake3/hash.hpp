#pragma once
#include <consign/model/primitives.hpp>
#include <string_view>

namespace consign::blake3 {

/// Hash in BLAKE3 derive-key mode so each object kind lives in its own
/// domain; `context` must be a stable, application-unique string.
consign::model::hash32_t tagged_hash(const std::string_view& context,
                                     const consign::model::bytes_view_t& bytes);

}  // namespace consign::blake3
