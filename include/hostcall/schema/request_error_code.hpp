#pragma once

#include <cstdint>

namespace hostcall::schema {

enum class request_error_code : uint32_t {
  unsupported_version = 1,
  malformed_request = 2,
  capability_unavailable = 3,
};

}  // namespace hostcall::schema
