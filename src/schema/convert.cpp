#include <hostcall/schema/convert.hpp>

#include <utility>

// Every arm below is a pure relabeling. std::visit rejects an overload set
// that misses an alternative, so a request added to a generation without an
// arm here does not build.
namespace hostcall::schema {

static_assert(!is_alternative_of_v<dns_lookup_host_t,
                                   sigstore_verification_input_v1_t>);
static_assert(!is_alternative_of_v<dns_lookup_host_t,
                                   sigstore_verification_input_v2_t>);

callback_request_type_t to_callback_request(
    sigstore_verification_input_v1_t input) {
  return std::visit(
      overloaded{
          [](sigstore_pub_key_verify_input<1>&& o) -> callback_request_type_t {
            return sigstore_pub_key_verify_t{
                .image = std::move(o.image),
                .pub_keys = std::move(o.pub_keys),
                .annotations = std::move(o.annotations)};
          },
          [](sigstore_keyless_verify_input<1>&& o) -> callback_request_type_t {
            return sigstore_keyless_verify_t{
                .image = std::move(o.image),
                .keyless = std::move(o.keyless),
                .annotations = std::move(o.annotations)};
          }},
      std::move(input));
}

callback_request_type_t to_callback_request(
    sigstore_verification_input_v2_t input) {
  return std::visit(
      overloaded{
          [](sigstore_pub_key_verify_input<2>&& o) -> callback_request_type_t {
            return sigstore_pub_key_verify_t{
                .image = std::move(o.image),
                .pub_keys = std::move(o.pub_keys),
                .annotations = std::move(o.annotations)};
          },
          [](sigstore_keyless_verify_input<2>&& o) -> callback_request_type_t {
            return sigstore_keyless_verify_t{
                .image = std::move(o.image),
                .keyless = std::move(o.keyless),
                .annotations = std::move(o.annotations)};
          },
          [](sigstore_keyless_prefix_verify_input<2>&& o)
              -> callback_request_type_t {
            return sigstore_keyless_prefix_verify_t{
                .image = std::move(o.image),
                .keyless_prefix = std::move(o.keyless_prefix),
                .annotations = std::move(o.annotations)};
          },
          [](sigstore_github_actions_verify_input<2>&& o)
              -> callback_request_type_t {
            return sigstore_github_actions_verify_t{
                .image = std::move(o.image),
                .owner = std::move(o.owner),
                .repo = std::move(o.repo),
                .annotations = std::move(o.annotations)};
          }},
      std::move(input));
}

}  // namespace hostcall::schema
