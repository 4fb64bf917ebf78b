#pragma once
#include <optional>
#include <sanidate/schema/primitives.hpp>
#include <string>

namespace sanidate::schema::encoding {

// Backend is chosen at build time by the tag type; storage only needs
// encoding into keys and values and non-fatal decoding of stored rows.
template <typename Library>
struct encoder {
  template <typename T>
  sanidate::schema::bytes_t encode(const T& obj);

  /// Encode and append to `out`, used to build binary storage keys.
  template <typename T>
  void append(const T& obj, std::string& out);

  template <typename T>
  std::optional<T> try_decode(const sanidate::schema::bytes_view_t& bytes);
};

}  // namespace sanidate::schema::encoding
