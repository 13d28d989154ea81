#pragma once
#include <hostcall/schema/primitives.hpp>
#include <optional>
#include <span>
#include <string>

namespace hostcall::schema::encoding {

// Codec front end, selected at build time by specializing on a library tag.
// Encoding a schema value cannot fail; decoding reports failure instead of
// throwing because payloads come from guests.
template <typename Library>
struct encoder {
  template <typename T>
  hostcall::schema::bytes_t encode(const T& obj);

  template <typename T>
  std::optional<T> try_decode(const hostcall::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const hostcall::schema::bytes_view_t& bytes,
                              std::string& error);
};

}  // namespace hostcall::schema::encoding
