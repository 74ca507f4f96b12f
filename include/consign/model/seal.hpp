#pragma once
#include <consign/model/outpoint.hpp>
#include <consign/model/primitives.hpp>
#include <cstdint>
#include <optional>
#include <variant>

namespace consign::model {

/// Seal with its output known. `txid` is unset when the seal points at an
/// output of the witness transaction that anchors the owning node.
struct revealed_seal_t final {
  std::optional<txid_t> txid;
  uint32_t vout{};
  uint64_t blinding{};

  bool operator==(const revealed_seal_t&) const = default;
};

struct concealed_seal_t final {
  hash32_t commitment{};

  bool operator==(const concealed_seal_t&) const = default;
};

using seal_t = std::variant<concealed_seal_t, revealed_seal_t>;

/// Seal on an output of a witness transaction the recipient has not seen yet.
struct witness_vout_t final {
  uint32_t vout{};
  uint64_t blinding{};

  bool operator==(const witness_vout_t&) const = default;
};

using seal_endpoint_t = std::variant<concealed_seal_t, witness_vout_t>;

concealed_seal_t conceal(const revealed_seal_t& seal);
concealed_seal_t conceal(const seal_t& seal);

/// Resolve the seal to a concrete outpoint, defaulting to the witness txid.
outpoint_t resolve_outpoint(const revealed_seal_t& seal,
                            const txid_t& witness_txid);

seal_endpoint_t make_seal_endpoint(const revealed_seal_t& seal);

}  // namespace consign::model
