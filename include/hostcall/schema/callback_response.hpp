#pragma once

#include <hostcall/schema/primitives.hpp>
#include <cstdint>
#include <string>

namespace hostcall::schema {

template <uint16_t Version>
struct callback_response;

// Reply handed back to the guest. `payload` is produced by the capability
// and is opaque to the host.
template <>
struct callback_response<1> final {
  uint32_t code{};
  bytes_t payload;
  std::string log;
  std::string info;
  std::string codespace;
};

using callback_response_t = callback_response<1>;

}  // namespace hostcall::schema
