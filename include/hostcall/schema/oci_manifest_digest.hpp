#pragma once
#include <hostcall/schema/primitives.hpp>

// Canonical request: compute the manifest digest of an OCI object (an image
// or anything else stored in an OCI registry).
namespace hostcall::schema {

struct oci_manifest_digest_t final {
  image_ref_t image;

  bool operator==(const oci_manifest_digest_t&) const = default;
};

}  // namespace hostcall::schema
