#pragma once

#include <hostcall/schema/callback_request_type.hpp>
#include <cstdint>
#include <optional>
#include <string>

namespace hostcall::schema {

template <uint16_t Version>
struct decode_result;

// `code` is 0 on success, otherwise a request_error_code. `request` is only
// engaged on success.
template <>
struct decode_result<1> final {
  uint32_t code{};
  std::string log;
  std::string info;
  std::string codespace;
  std::optional<callback_request_type_t> request;
};

using decode_result_t = decode_result<1>;

}  // namespace hostcall::schema
