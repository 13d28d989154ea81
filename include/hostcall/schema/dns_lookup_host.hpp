#pragma once
#include <string>

// Canonical request: resolve the addresses of a hostname.
// There is no versioned verification input carrying this request; guests
// reach it through the `net` host call route only.
namespace hostcall::schema {

struct dns_lookup_host_t final {
  std::string host;

  bool operator==(const dns_lookup_host_t&) const = default;
};

}  // namespace hostcall::schema
