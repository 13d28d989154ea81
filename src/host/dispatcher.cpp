#include <hostcall/host/dispatcher.hpp>
#include <hostcall/host/request_decoder.hpp>
#include <hostcall/host/route.hpp>
#include <hostcall/schema/request_error_code.hpp>
#include <hostcall/schema/variant_names.hpp>
#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <utility>

using namespace hostcall::schema;

namespace {

callback_response_t make_error_response(const request_error_code code,
                                        std::string log,
                                        std::string info,
                                        const std::string_view codespace) {
  auto response = callback_response_t{};
  response.code = static_cast<uint32_t>(code);
  response.log = std::move(log);
  response.info = std::move(info);
  response.codespace = std::string{codespace};
  return response;
}

template <typename Request>
callback_response_t run_capability(
    const hostcall::host::capability_handler_t<Request>& handler,
    const Request& request,
    const std::string_view name) {
  if (!handler) {
    spdlog::warn("No capability registered for {}", name);
    return make_error_response(request_error_code::capability_unavailable,
                               "capability unavailable", std::string{name},
                               "hostcall.dispatch");
  }
  return handler(request);
}

}  // namespace

namespace hostcall::host {

dispatcher::dispatcher(capability_handlers handlers)
    : handlers_(std::move(handlers)) {}

callback_response_t dispatcher::handle(
    const std::string_view binding_namespace,
    const std::string_view operation,
    const bytes_view_t& payload) const {
  auto route = find_route(binding_namespace, operation);
  if (!route) {
    spdlog::warn("Rejecting unknown host call {}/{}", binding_namespace,
                 operation);
    return make_error_response(
        request_error_code::unsupported_version, "unsupported host call",
        fmt::format("{}/{}", binding_namespace, operation), "hostcall.route");
  }

  auto decoded = decode_request(*route, payload);
  if (decoded.code != 0 || !decoded.request) {
    auto response = callback_response_t{};
    response.code = decoded.code;
    response.log = std::move(decoded.log);
    response.info = std::move(decoded.info);
    response.codespace = std::move(decoded.codespace);
    return response;
  }
  return dispatch(*decoded.request);
}

callback_response_t dispatcher::dispatch(
    const callback_request_type_t& request) const {
  const auto name = variant_name(request);
  return std::visit(
      overloaded{
          [&](const oci_manifest_digest_t& r) {
            spdlog::debug("Dispatching {} for {}", name, r.image);
            return run_capability(handlers_.oci_manifest_digest, r, name);
          },
          [&](const sigstore_pub_key_verify_t& r) {
            spdlog::debug("Dispatching {} for {} with {} key(s)", name,
                          r.image, r.pub_keys.size());
            return run_capability(handlers_.sigstore_pub_key_verify, r,
                                  name);
          },
          [&](const sigstore_keyless_verify_t& r) {
            spdlog::debug("Dispatching {} for {} with {} identity(ies)", name,
                          r.image, r.keyless.size());
            return run_capability(handlers_.sigstore_keyless_verify, r,
                                  name);
          },
          [&](const sigstore_keyless_prefix_verify_t& r) {
            spdlog::debug("Dispatching {} for {} with {} prefix(es)", name,
                          r.image, r.keyless_prefix.size());
            return run_capability(handlers_.sigstore_keyless_prefix_verify, r,
                                  name);
          },
          [&](const sigstore_github_actions_verify_t& r) {
            spdlog::debug("Dispatching {} for {} owned by {}", name, r.image,
                          r.owner);
            return run_capability(handlers_.sigstore_github_actions_verify, r,
                                  name);
          },
          [&](const dns_lookup_host_t& r) {
            spdlog::debug("Dispatching {} for {}", name, r.host);
            return run_capability(handlers_.dns_lookup_host, r, name);
          }},
      request);
}

}  // namespace hostcall::host
