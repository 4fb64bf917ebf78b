#pragma once
#include <scale/scale.hpp>
#include <sanidate/common/critical.hpp>
#include <sanidate/schema/encoding/encoder.hpp>

namespace sanidate::schema::encoding {

struct scale_encoder_tag {};

template <>
struct encoder<scale_encoder_tag> final {
  template <typename T>
  sanidate::schema::bytes_t encode(const T& obj);

  template <typename T>
  void append(const T& obj, std::string& out);

  template <typename T>
  std::optional<T> try_decode(const sanidate::schema::bytes_view_t& bytes);
};

template <typename T>
sanidate::schema::bytes_t encoder<scale_encoder_tag>::encode(const T& obj) {
  auto encoded = ::scale::impl::memory::encode(obj);
  if (!encoded) {
    sanidate::common::critical("failed to encode SCALE object");
  }
  return encoded.value();
}

template <typename T>
void encoder<scale_encoder_tag>::append(const T& obj, std::string& out) {
  auto encoded = encode(obj);
  out += sanidate::schema::make_string(sanidate::schema::make_bytes_view(encoded));
}

template <typename T>
std::optional<T> encoder<scale_encoder_tag>::try_decode(
    const sanidate::schema::bytes_view_t& bytes) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    return std::nullopt;
  }
  return decoded.value();
}

}  // namespace sanidate::schema::encoding
