#pragma once
#include <cstdint>
#include <string>

// Schema type: keyless prefix info.
// Accepted keyless signing identity whose subject only has to start with
// `url_prefix`. Kept apart from keyless_info so a prefix match can never be
// passed where an exact match is expected.
namespace hostcall::schema {

template <uint16_t Version>
struct keyless_prefix_info;

template <>
struct keyless_prefix_info<1> final {
  std::string issuer;
  std::string url_prefix;

  bool operator==(const keyless_prefix_info&) const = default;
};

using keyless_prefix_info_t = keyless_prefix_info<1>;

}  // namespace hostcall::schema
