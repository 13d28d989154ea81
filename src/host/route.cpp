#include <hostcall/host/route.hpp>

#include <array>

namespace hostcall::host {

namespace {

constexpr auto kRoutes = std::array{
    route_entry_t{"oci", "v1/verify", route_t::verify_v1},
    route_entry_t{"oci", "v2/verify", route_t::verify_v2},
    route_entry_t{"oci", "v1/manifest_digest", route_t::manifest_digest_v1},
    route_entry_t{"net", "v1/dns_lookup_host", route_t::dns_lookup_host_v1},
};

}  // namespace

std::optional<route_t> find_route(const std::string_view binding_namespace,
                                  const std::string_view operation) {
  for (const auto& entry : kRoutes) {
    if (entry.binding_namespace == binding_namespace &&
        entry.operation == operation) {
      return entry.route;
    }
  }
  return std::nullopt;
}

std::optional<hostcall::schema::request_version_t> verification_version(
    const route_t route) {
  switch (route) {
    case route_t::verify_v1:
      return hostcall::schema::request_version_t::v1;
    case route_t::verify_v2:
      return hostcall::schema::request_version_t::v2;
    case route_t::manifest_digest_v1:
    case route_t::dns_lookup_host_v1:
      return std::nullopt;
  }
  return std::nullopt;
}

}  // namespace hostcall::host
