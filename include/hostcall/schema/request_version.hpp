#pragma once

#include <hostcall/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: request version.
// Generation of the verification input a guest was built against. Travels
// out of band, in the host call operation name.
namespace hostcall::schema {

enum class request_version_t : uint16_t { v1 = 1, v2 = 2 };

inline constexpr auto kRequestVersionMappings = std::array{
    std::pair<std::string_view, request_version_t>{"v1",
                                                   request_version_t::v1},
    std::pair<std::string_view, request_version_t>{"v2",
                                                   request_version_t::v2},
};

template <>
inline std::optional<request_version_t> try_from_string<request_version_t>(
    const std::string_view value) {
  return from_string(value, kRequestVersionMappings);
}

inline constexpr std::string_view to_string(const request_version_t value) {
  return to_string(value, kRequestVersionMappings).value_or("unknown");
}

std::optional<request_version_t> try_make_request_version(uint16_t value);

}  // namespace hostcall::schema
