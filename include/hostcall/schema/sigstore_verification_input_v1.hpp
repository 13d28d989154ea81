#pragma once
#include <hostcall/schema/keyless_info.hpp>
#include <hostcall/schema/primitives.hpp>
#include <hostcall/schema/sigstore_verification_input.hpp>
#include <optional>
#include <variant>
#include <vector>

// Schema generation 1. Frozen.
namespace hostcall::schema {

template <>
struct sigstore_pub_key_verify_input<1> final {
  image_ref_t image;
  std::vector<pem_key_t> pub_keys;
  std::optional<annotations_t> annotations;

  bool operator==(const sigstore_pub_key_verify_input&) const = default;
};

template <>
struct sigstore_keyless_verify_input<1> final {
  image_ref_t image;
  std::vector<keyless_info_t> keyless;
  std::optional<annotations_t> annotations;

  bool operator==(const sigstore_keyless_verify_input&) const = default;
};

using sigstore_verification_input_v1_t =
    std::variant<sigstore_pub_key_verify_input<1>,
                 sigstore_keyless_verify_input<1>>;

}  // namespace hostcall::schema
