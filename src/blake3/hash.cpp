#include <blake3.h>
#include <consign/blake3/hash.hpp>
#include <string>

namespace consign::blake3 {

consign::model::hash32_t tagged_hash(
    const std::string_view& context,
    const consign::model::bytes_view_t& bytes) {
  // The C API wants a NUL terminated context string.
  auto context_string = std::string{context};
  auto hasher = blake3_hasher{};
  blake3_hasher_init_derive_key(&hasher, context_string.c_str());
  blake3_hasher_update(&hasher, bytes.data(), bytes.size());
  auto output = consign::model::hash32_t{};
  blake3_hasher_finalize(&hasher, output.data(), output.size());
  return output;
}

}  // namespace consign::blake3
