#include <consign/blake3/hash.hpp>
#include <consign/encoding/scale/encoder.hpp>
#include <consign/model/seal.hpp>

namespace consign::model {

concealed_seal_t conceal(const revealed_seal_t& seal) {
  auto encoder = consign::encoding::scale_encoder_t{};
  auto encoded = encoder.encode(seal);
  return concealed_seal_t{.commitment = consign::blake3::tagged_hash(
                              "consign seal", make_bytes_view(encoded))};
}

concealed_seal_t conceal(const seal_t& seal) {
  return std::visit(
      overloaded{[](const concealed_seal_t& value) { return value; },
                 [](const revealed_seal_t& value) { return conceal(value); }},
      seal);
}

outpoint_t resolve_outpoint(const revealed_seal_t& seal,
                            const txid_t& witness_txid) {
  return outpoint_t{.txid = seal.txid.value_or(witness_txid), .vout = seal.vout};
}

seal_endpoint_t make_seal_endpoint(const revealed_seal_t& seal) {
  if (seal.txid.has_value()) {
    return conceal(seal);
  }
  return witness_vout_t{.vout = seal.vout, .blinding = seal.blinding};
}

}  // namespace consign::model
