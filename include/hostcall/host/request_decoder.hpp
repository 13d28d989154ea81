#pragma once

#include <hostcall/host/route.hpp>
#include <hostcall/schema/decode_result.hpp>
#include <hostcall/schema/primitives.hpp>

#include <cstdint>

namespace hostcall::host {

/// Decode a verification input of the given generation and convert it to the
/// canonical request.
///
/// Never throws and never terminates on guest input. An unknown `version`
/// yields `unsupported_version`; bytes that do not form exactly one value of
/// that generation yield `malformed_request` with `info` naming the
/// generation, the variant when its tag was readable, and the codec error.
hostcall::schema::decode_result_t decode_verification_input(
    uint16_t version,
    const hostcall::schema::bytes_view_t& payload);

/// Decode a SCALE string image reference into `oci_manifest_digest_t`.
hostcall::schema::decode_result_t decode_manifest_digest(
    const hostcall::schema::bytes_view_t& payload);

/// Decode a SCALE string hostname into `dns_lookup_host_t`.
hostcall::schema::decode_result_t decode_dns_lookup_host(
    const hostcall::schema::bytes_view_t& payload);

/// Decode the payload of a routed host call.
hostcall::schema::decode_result_t decode_request(
    route_t route,
    const hostcall::schema::bytes_view_t& payload);

}  // namespace hostcall::host
