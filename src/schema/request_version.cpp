#include <hostcall/schema/request_version.hpp>

namespace hostcall::schema {

std::optional<request_version_t> try_make_request_version(
    const uint16_t value) {
  switch (value) {
    case static_cast<uint16_t>(request_version_t::v1):
      return request_version_t::v1;
    case static_cast<uint16_t>(request_version_t::v2):
      return request_version_t::v2;
    default:
      return std::nullopt;
  }
}

}  // namespace hostcall::schema
