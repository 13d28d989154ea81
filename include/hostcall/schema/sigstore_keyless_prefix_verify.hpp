#pragma once
#include <hostcall/schema/keyless_prefix_info.hpp>
#include <hostcall/schema/primitives.hpp>
#include <optional>
#include <vector>

// Canonical request: keyless verification where each identity subject is
// matched as a URL prefix.
namespace hostcall::schema {

struct sigstore_keyless_prefix_verify_t final {
  image_ref_t image;
  std::vector<keyless_prefix_info_t> keyless_prefix;
  std::optional<annotations_t> annotations;

  bool operator==(const sigstore_keyless_prefix_verify_t&) const = default;
};

}  // namespace hostcall::schema
