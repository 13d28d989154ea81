#pragma once

#include <hostcall/schema/callback_request_type.hpp>
#include <hostcall/schema/callback_response.hpp>
#include <functional>

namespace hostcall::host {

template <typename Request>
using capability_handler_t =
    std::function<hostcall::schema::callback_response_t(const Request&)>;

// Capability implementations, one per canonical request. An empty handler
// means the capability is not available in this host build.
struct capability_handlers final {
  capability_handler_t<hostcall::schema::oci_manifest_digest_t>
      oci_manifest_digest;
  capability_handler_t<hostcall::schema::sigstore_pub_key_verify_t>
      sigstore_pub_key_verify;
  capability_handler_t<hostcall::schema::sigstore_keyless_verify_t>
      sigstore_keyless_verify;
  capability_handler_t<hostcall::schema::sigstore_keyless_prefix_verify_t>
      sigstore_keyless_prefix_verify;
  capability_handler_t<hostcall::schema::sigstore_github_actions_verify_t>
      sigstore_github_actions_verify;
  capability_handler_t<hostcall::schema::dns_lookup_host_t> dns_lookup_host;
};

}  // namespace hostcall::host
