#pragma once

#include <hostcall/host/capability_handlers.hpp>
#include <hostcall/schema/callback_request_type.hpp>
#include <hostcall/schema/callback_response.hpp>
#include <hostcall/schema/primitives.hpp>

#include <string_view>

namespace hostcall::host {

/// Entry point for guest host calls.
///
/// Routes a call by (namespace, operation), decodes the payload for the
/// generation the route names, converts it to the canonical request and
/// dispatches it to the matching capability handler. Immutable after
/// construction; `handle` may be called from any number of threads as long as
/// the installed handlers allow it.
class dispatcher final {
 public:
  explicit dispatcher(capability_handlers handlers);

  /// Serve one host call. Errors are returned in the response code and never
  /// affect other calls.
  hostcall::schema::callback_response_t handle(
      std::string_view binding_namespace,
      std::string_view operation,
      const hostcall::schema::bytes_view_t& payload) const;

  /// Hand an already canonical request to its capability handler.
  hostcall::schema::callback_response_t dispatch(
      const hostcall::schema::callback_request_type_t& request) const;

 private:
  capability_handlers handlers_;
};

}  // namespace hostcall::host
