#pragma once
#include <cstdint>
#include <string>

// Schema type: keyless info.
// Accepted keyless signing identity: the OIDC issuer and the exact subject
// recorded in the signing certificate.
namespace hostcall::schema {

template <uint16_t Version>
struct keyless_info;

template <>
struct keyless_info<1> final {
  std::string issuer;
  std::string subject;

  bool operator==(const keyless_info&) const = default;
};

using keyless_info_t = keyless_info<1>;

}  // namespace hostcall::schema
