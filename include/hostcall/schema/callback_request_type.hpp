#pragma once
#include <hostcall/schema/dns_lookup_host.hpp>
#include <hostcall/schema/oci_manifest_digest.hpp>
#include <hostcall/schema/sigstore_github_actions_verify.hpp>
#include <hostcall/schema/sigstore_keyless_prefix_verify.hpp>
#include <hostcall/schema/sigstore_keyless_verify.hpp>
#include <hostcall/schema/sigstore_pub_key_verify.hpp>
#include <variant>

namespace hostcall::schema {

// Every request a guest can make to the host, independent of the schema
// generation the guest was built against. Only ever grows.
using callback_request_type_t = std::variant<oci_manifest_digest_t,
                                             sigstore_pub_key_verify_t,
                                             sigstore_keyless_verify_t,
                                             sigstore_keyless_prefix_verify_t,
                                             sigstore_github_actions_verify_t,
                                             dns_lookup_host_t>;

}  // namespace hostcall::schema
