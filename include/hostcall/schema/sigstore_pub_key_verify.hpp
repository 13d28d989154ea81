#pragma once
#include <hostcall/schema/primitives.hpp>
#include <optional>
#include <vector>

// Canonical request: verify that the manifest digest of an OCI object was
// signed with Sigstore in public key mode.
namespace hostcall::schema {

struct sigstore_pub_key_verify_t final {
  image_ref_t image;
  std::vector<pem_key_t> pub_keys;  // all of them must have signed
  std::optional<annotations_t> annotations;

  bool operator==(const sigstore_pub_key_verify_t&) const = default;
};

}  // namespace hostcall::schema
