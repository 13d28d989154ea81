#pragma once
#include <hostcall/common/critical.hpp>
#include <hostcall/schema/callback_request_type.hpp>
#include <hostcall/schema/encoding/encoder.hpp>
#include <hostcall/schema/sigstore_verification_input_v1.hpp>
#include <hostcall/schema/sigstore_verification_input_v2.hpp>
#include <exception>
#include <scale/scale.hpp>
#include <string>
#include <utility>

namespace hostcall::schema::encoding {

struct scale_encoder_tag {};

template <>
struct encoder<scale_encoder_tag> final {
  template <typename T>
  hostcall::schema::bytes_t encode(const T& obj);

  template <typename T>
  std::optional<T> try_decode(const hostcall::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const hostcall::schema::bytes_view_t& bytes,
                              std::string& error);
};

template <typename T>
hostcall::schema::bytes_t encoder<scale_encoder_tag>::encode(const T& obj) {
  auto encoded = ::scale::impl::memory::encode(obj);
  if (!encoded) {
    hostcall::common::critical("failed to encode SCALE object");
  }
  return encoded.value();
}

template <typename T>
std::optional<T> encoder<scale_encoder_tag>::try_decode(
    const hostcall::schema::bytes_view_t& bytes) {
  auto error = std::string{};
  return try_decode<T>(bytes, error);
}

// The codec reports some failures by throwing from deep inside a decode; both
// paths end up in `error`.
template <typename T>
std::optional<T> encoder<scale_encoder_tag>::try_decode(
    const hostcall::schema::bytes_view_t& bytes,
    std::string& error) {
  try {
    auto decoded = ::scale::impl::memory::decode<T>(bytes);
    if (!decoded) {
      error = decoded.error().message();
      return std::nullopt;
    }
    return std::move(decoded.value());
  } catch (const std::exception& ex) {
    error = ex.what();
    return std::nullopt;
  }
}

}  // namespace hostcall::schema::encoding
