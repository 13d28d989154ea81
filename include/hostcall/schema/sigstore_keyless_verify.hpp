#pragma once
#include <hostcall/schema/keyless_info.hpp>
#include <hostcall/schema/primitives.hpp>
#include <optional>
#include <vector>

// Canonical request: verify that the manifest digest of an OCI object was
// signed with Sigstore in keyless mode by every listed identity.
namespace hostcall::schema {

struct sigstore_keyless_verify_t final {
  image_ref_t image;
  std::vector<keyless_info_t> keyless;
  std::optional<annotations_t> annotations;

  bool operator==(const sigstore_keyless_verify_t&) const = default;
};

}  // namespace hostcall::schema
