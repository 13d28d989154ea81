#pragma once
#include <hostcall/schema/keyless_info.hpp>
#include <hostcall/schema/keyless_prefix_info.hpp>
#include <hostcall/schema/primitives.hpp>
#include <hostcall/schema/sigstore_verification_input.hpp>
#include <optional>
#include <string>
#include <variant>
#include <vector>

// Schema generation 2. Open: new verification requests are appended here.
namespace hostcall::schema {

template <>
struct sigstore_pub_key_verify_input<2> final {
  image_ref_t image;
  std::vector<pem_key_t> pub_keys;
  std::optional<annotations_t> annotations;

  bool operator==(const sigstore_pub_key_verify_input&) const = default;
};

template <>
struct sigstore_keyless_verify_input<2> final {
  image_ref_t image;
  std::vector<keyless_info_t> keyless;
  std::optional<annotations_t> annotations;

  bool operator==(const sigstore_keyless_verify_input&) const = default;
};

template <>
struct sigstore_keyless_prefix_verify_input<2> final {
  image_ref_t image;
  std::vector<keyless_prefix_info_t> keyless_prefix;
  std::optional<annotations_t> annotations;

  bool operator==(const sigstore_keyless_prefix_verify_input&) const = default;
};

template <>
struct sigstore_github_actions_verify_input<2> final {
  image_ref_t image;
  std::string owner;
  std::optional<std::string> repo;
  std::optional<annotations_t> annotations;

  bool operator==(const sigstore_github_actions_verify_input&) const = default;
};

using sigstore_verification_input_v2_t =
    std::variant<sigstore_pub_key_verify_input<2>,
                 sigstore_keyless_verify_input<2>,
                 sigstore_keyless_prefix_verify_input<2>,
                 sigstore_github_actions_verify_input<2>>;

}  // namespace hostcall::schema
