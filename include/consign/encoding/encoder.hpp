#pragma once
#include <consign/model/primitives.hpp>
#include <optional>

namespace consign::encoding {

// The encoding library is a build time choice; callers hold an
// encoder<Tag> and never touch the library directly.
template <typename Library>
struct encoder {
  template <typename T>
  consign::model::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, consign::model::bytes_t& out);

  template <typename T>
  T decode(const consign::model::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const consign::model::bytes_view_t& bytes);
};

}  // namespace consign::encoding
