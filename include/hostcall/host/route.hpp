#pragma once

#include <hostcall/schema/request_version.hpp>

#include <cstdint>
#include <optional>
#include <string_view>

namespace hostcall::host {

// Host calls a guest may issue, addressed by (namespace, operation).
enum class route_t : uint8_t {
  verify_v1 = 0,           // oci / v1/verify
  verify_v2 = 1,           // oci / v2/verify
  manifest_digest_v1 = 2,  // oci / v1/manifest_digest
  dns_lookup_host_v1 = 3,  // net / v1/dns_lookup_host
};

struct route_entry_t final {
  std::string_view binding_namespace;
  std::string_view operation;
  route_t route;
};

std::optional<route_t> find_route(std::string_view binding_namespace,
                                  std::string_view operation);

/// Version of the verification input a route carries, if any.
std::optional<hostcall::schema::request_version_t> verification_version(
    route_t route);

}  // namespace hostcall::host
