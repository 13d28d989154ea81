#include <hostcall/host/request_decoder.hpp>
#include <hostcall/schema/convert.hpp>
#include <hostcall/schema/encoding/scale/encoder.hpp>
#include <hostcall/schema/request_error_code.hpp>
#include <hostcall/schema/request_version.hpp>
#include <hostcall/schema/variant_names.hpp>
#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <string>
#include <utility>

using namespace hostcall::schema;

namespace {

using encoder_t = hostcall::schema::encoding::encoder<
    hostcall::schema::encoding::scale_encoder_tag>;

constexpr auto kCodespace = std::string_view{"hostcall.decode"};

decode_result_t make_error(const request_error_code code,
                           std::string log,
                           std::string info) {
  spdlog::warn("Rejecting host call request: {} ({})", log, info);
  auto result = decode_result_t{};
  result.code = static_cast<uint32_t>(code);
  result.log = std::move(log);
  result.info = std::move(info);
  result.codespace = std::string{kCodespace};
  return result;
}

decode_result_t malformed(std::string info) {
  return make_error(request_error_code::malformed_request, "malformed request",
                    std::move(info));
}

// Decodes exactly one value of `T` and requires the payload to be its
// canonical encoding. Re-encoding never yields more bytes than were read, so a
// shorter re-encoding covers trailing bytes, repeated map keys and padded
// length prefixes alike.
template <typename T>
std::optional<T> decode_exact(const bytes_view_t& payload, std::string& error) {
  auto encoder = encoder_t{};
  auto decoded = encoder.try_decode<T>(payload, error);
  if (!decoded) {
    return std::nullopt;
  }
  auto canonical = encoder.encode(*decoded).size();
  if (canonical != payload.size()) {
    error = fmt::format(
        "payload is not the canonical encoding of the decoded value ({} extra "
        "byte(s))",
        payload.size() - canonical);
    return std::nullopt;
  }
  return decoded;
}

template <typename Variant>
decode_result_t decode_versioned(const request_version_t version,
                                 const bytes_view_t& payload) {
  const auto label = to_string(version);
  if (payload.empty()) {
    return malformed(fmt::format("{}: empty payload", label));
  }

  // The first byte is the variant index; resolve it up front so an unknown
  // request is reported by its index and a broken one by its name.
  const auto index = static_cast<std::size_t>(payload[0]);
  const auto name = variant_name(version, index);
  if (!name) {
    return malformed(fmt::format("{}: unknown request variant index {}", label,
                                 index));
  }

  auto error = std::string{};
  auto decoded = decode_exact<Variant>(payload, error);
  if (!decoded) {
    return malformed(fmt::format("{}: {}: {}", label, *name, error));
  }

  auto result = decode_result_t{};
  result.request = to_callback_request(std::move(*decoded));
  return result;
}

template <typename Request>
decode_result_t decode_string_request(const std::string_view label,
                                      const bytes_view_t& payload) {
  auto error = std::string{};
  auto decoded = decode_exact<std::string>(payload, error);
  if (!decoded) {
    return malformed(fmt::format("{}: {}", label, error));
  }
  auto result = decode_result_t{};
  result.request = Request{std::move(*decoded)};
  return result;
}

}  // namespace

namespace hostcall::host {

decode_result_t decode_verification_input(const uint16_t version,
                                          const bytes_view_t& payload) {
  auto known = try_make_request_version(version);
  if (!known) {
    return make_error(request_error_code::unsupported_version,
                      "unsupported request version",
                      fmt::format("version {} is not served by this host",
                                  version));
  }
  switch (*known) {
    case request_version_t::v1:
      return decode_versioned<sigstore_verification_input_v1_t>(*known,
                                                                payload);
    case request_version_t::v2:
      return decode_versioned<sigstore_verification_input_v2_t>(*known,
                                                                payload);
  }
  return make_error(request_error_code::unsupported_version,
                    "unsupported request version",
                    fmt::format("version {} is not served by this host",
                                version));
}

decode_result_t decode_manifest_digest(const bytes_view_t& payload) {
  return decode_string_request<oci_manifest_digest_t>("OciManifestDigest",
                                                      payload);
}

decode_result_t decode_dns_lookup_host(const bytes_view_t& payload) {
  return decode_string_request<dns_lookup_host_t>("DNSLookupHost", payload);
}

decode_result_t decode_request(const route_t route,
                               const bytes_view_t& payload) {
  switch (route) {
    case route_t::verify_v1:
    case route_t::verify_v2:
      return decode_verification_input(
          static_cast<uint16_t>(*verification_version(route)), payload);
    case route_t::manifest_digest_v1:
      return decode_manifest_digest(payload);
    case route_t::dns_lookup_host_v1:
      return decode_dns_lookup_host(payload);
  }
  return make_error(request_error_code::unsupported_version,
                    "unsupported host call", "unknown route");
}

}  // namespace hostcall::host
