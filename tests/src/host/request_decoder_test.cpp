#include <gtest/gtest.h>
#include <hostcall/host/request_decoder.hpp>
#include <hostcall/host/route.hpp>
#include <hostcall/schema/request_error_code.hpp>
#include <hostcall/testing/common.hpp>

#include <string>

using namespace hostcall::schema;
using hostcall::testing::encode;
using hostcall::testing::view;

namespace {

constexpr auto kUnsupportedVersion =
    static_cast<uint32_t>(request_error_code::unsupported_version);
constexpr auto kMalformedRequest =
    static_cast<uint32_t>(request_error_code::malformed_request);

bool contains(const std::string& haystack, const std::string_view needle) {
  return haystack.find(needle) != std::string::npos;
}

}  // namespace

TEST(request_decoder, v1_pub_key_scenario) {
  auto bytes = encode(sigstore_verification_input_v1_t{
      sigstore_pub_key_verify_input<1>{.image = "reg/busybox:1.0.0",
                                       .pub_keys = {"PEM1", "PEM2"},
                                       .annotations = std::nullopt}});

  auto result = hostcall::host::decode_verification_input(1, view(bytes));

  ASSERT_EQ(result.code, 0u) << result.info;
  ASSERT_TRUE(result.request.has_value());
  EXPECT_EQ(*result.request,
            callback_request_type_t{sigstore_pub_key_verify_t{
                .image = "reg/busybox:1.0.0",
                .pub_keys = {"PEM1", "PEM2"},
                .annotations = std::nullopt}});
}

TEST(request_decoder, v2_github_actions_scenario) {
  auto bytes = encode(sigstore_verification_input_v2_t{
      sigstore_github_actions_verify_input<2>{
          .image = "reg/app:latest",
          .owner = "octocat",
          .repo = std::nullopt,
          .annotations = annotations_t{{"env", "prod"}}}});

  auto result = hostcall::host::decode_verification_input(2, view(bytes));

  ASSERT_EQ(result.code, 0u) << result.info;
  ASSERT_TRUE(result.request.has_value());
  EXPECT_EQ(*result.request,
            callback_request_type_t{sigstore_github_actions_verify_t{
                .image = "reg/app:latest",
                .owner = "octocat",
                .repo = std::nullopt,
                .annotations = annotations_t{{"env", "prod"}}}});
}

TEST(request_decoder, v1_payload_is_accepted_by_v2) {
  auto bytes = encode(sigstore_verification_input_v1_t{
      sigstore_keyless_verify_input<1>{
          .image = "img",
          .keyless = hostcall::testing::make_keyless(),
          .annotations = annotations_t{}}});

  auto as_v1 = hostcall::host::decode_verification_input(1, view(bytes));
  auto as_v2 = hostcall::host::decode_verification_input(2, view(bytes));

  ASSERT_EQ(as_v1.code, 0u);
  ASSERT_EQ(as_v2.code, 0u);
  EXPECT_EQ(as_v1.request, as_v2.request);
}

TEST(request_decoder, unknown_version_is_unsupported) {
  auto bytes = encode(sigstore_verification_input_v2_t{});
  for (const auto version : {uint16_t{0}, uint16_t{3}, uint16_t{0xffff}}) {
    auto result =
        hostcall::host::decode_verification_input(version, view(bytes));
    EXPECT_EQ(result.code, kUnsupportedVersion);
    EXPECT_FALSE(result.request.has_value());
    EXPECT_EQ(result.codespace, "hostcall.decode");
  }
}

TEST(request_decoder, unknown_variant_is_malformed) {
  auto bytes = encode(sigstore_verification_input_v2_t{
      sigstore_keyless_prefix_verify_input<2>{
          .image = "img",
          .keyless_prefix = hostcall::testing::make_keyless_prefix(),
          .annotations = std::nullopt}});

  auto result = hostcall::host::decode_verification_input(1, view(bytes));

  EXPECT_EQ(result.code, kMalformedRequest);
  EXPECT_FALSE(result.request.has_value());
  EXPECT_TRUE(contains(result.info, "v1"));
  EXPECT_TRUE(contains(result.info, "unknown request variant index 2"));

  auto beyond_v2 = bytes_t{0x04, 0x00};
  auto v2_result =
      hostcall::host::decode_verification_input(2, view(beyond_v2));
  EXPECT_EQ(v2_result.code, kMalformedRequest);
  EXPECT_TRUE(contains(v2_result.info, "unknown request variant index 4"));
}

TEST(request_decoder, missing_fields_name_the_variant) {
  auto bytes = encode(sigstore_verification_input_v2_t{
      sigstore_github_actions_verify_input<2>{.image = "reg/app:latest",
                                              .owner = "octocat",
                                              .repo = "example-repo",
                                              .annotations = std::nullopt}});
  bytes.resize(bytes.size() / 2);

  auto result = hostcall::host::decode_verification_input(2, view(bytes));

  EXPECT_EQ(result.code, kMalformedRequest);
  EXPECT_FALSE(result.request.has_value());
  EXPECT_TRUE(contains(result.info, "SigstoreGithubActionsVerify"));
}

TEST(request_decoder, trailing_bytes_are_malformed) {
  auto bytes = encode(sigstore_verification_input_v1_t{
      sigstore_pub_key_verify_input<1>{
          .image = "img", .pub_keys = {}, .annotations = std::nullopt}});
  bytes.push_back(0xff);

  auto result = hostcall::host::decode_verification_input(1, view(bytes));

  EXPECT_EQ(result.code, kMalformedRequest);
  EXPECT_TRUE(contains(result.info, "SigstorePubKeyVerify"));
  EXPECT_TRUE(contains(result.info, "(1 extra byte(s))"));
}

TEST(request_decoder, mistyped_optional_flag_is_malformed) {
  // image "a", no keys, then an optional presence byte that is neither 0 nor 1.
  auto bytes = bytes_t{0x00, 0x04, 'a', 0x00, 0x02};

  auto result = hostcall::host::decode_verification_input(1, view(bytes));

  EXPECT_EQ(result.code, kMalformedRequest);
  EXPECT_FALSE(result.request.has_value());
  EXPECT_TRUE(contains(result.info, "v1: SigstorePubKeyVerify"));
}

TEST(request_decoder, repeated_annotation_key_is_rejected) {
  // Two annotation entries that both use the key "k".
  auto bytes = bytes_t{0x00, 0x04, 'a', 0x00, 0x01, 0x08,
                       0x04, 'k',  0x04, '1', 0x04, 'k', 0x04, '2'};

  for (const auto version : {uint16_t{1}, uint16_t{2}}) {
    auto result = hostcall::host::decode_verification_input(version,
                                                            view(bytes));
    EXPECT_EQ(result.code, kMalformedRequest);
    EXPECT_FALSE(result.request.has_value());
    EXPECT_TRUE(contains(result.info, "SigstorePubKeyVerify"));
  }

  auto unique = bytes_t{0x00, 0x04, 'a', 0x00, 0x01, 0x08,
                        0x04, 'j',  0x04, '1', 0x04, 'k', 0x04, '2'};
  auto accepted = hostcall::host::decode_verification_input(1, view(unique));
  ASSERT_EQ(accepted.code, 0u) << accepted.info;
  EXPECT_EQ(*accepted.request,
            callback_request_type_t{sigstore_pub_key_verify_t{
                .image = "a",
                .pub_keys = {},
                .annotations = annotations_t{{"j", "1"}, {"k", "2"}}}});
}

TEST(request_decoder, empty_payload_is_malformed) {
  auto bytes = bytes_t{};
  auto result = hostcall::host::decode_verification_input(2, view(bytes));
  EXPECT_EQ(result.code, kMalformedRequest);
  EXPECT_TRUE(contains(result.info, "empty payload"));
}

TEST(request_decoder, manifest_digest_and_dns_payloads) {
  auto image = encode(std::string{"reg/app:latest"});
  auto digest = hostcall::host::decode_manifest_digest(view(image));
  ASSERT_EQ(digest.code, 0u);
  EXPECT_EQ(*digest.request,
            callback_request_type_t{oci_manifest_digest_t{"reg/app:latest"}});

  auto host = encode(std::string{"example.com"});
  auto dns = hostcall::host::decode_dns_lookup_host(view(host));
  ASSERT_EQ(dns.code, 0u);
  EXPECT_EQ(*dns.request,
            callback_request_type_t{dns_lookup_host_t{"example.com"}});

  auto garbage = bytes_t{0x08, 'x'};
  auto broken = hostcall::host::decode_dns_lookup_host(view(garbage));
  EXPECT_EQ(broken.code, kMalformedRequest);
  EXPECT_TRUE(contains(broken.info, "DNSLookupHost"));
}

TEST(request_decoder, routes) {
  EXPECT_EQ(hostcall::host::find_route("oci", "v1/verify"),
            hostcall::host::route_t::verify_v1);
  EXPECT_EQ(hostcall::host::find_route("oci", "v2/verify"),
            hostcall::host::route_t::verify_v2);
  EXPECT_EQ(hostcall::host::find_route("oci", "v1/manifest_digest"),
            hostcall::host::route_t::manifest_digest_v1);
  EXPECT_EQ(hostcall::host::find_route("net", "v1/dns_lookup_host"),
            hostcall::host::route_t::dns_lookup_host_v1);
  EXPECT_FALSE(hostcall::host::find_route("net", "v1/verify").has_value());
  EXPECT_FALSE(hostcall::host::find_route("oci", "v3/verify").has_value());

  EXPECT_EQ(
      hostcall::host::verification_version(hostcall::host::route_t::verify_v1),
      request_version_t::v1);
  EXPECT_FALSE(hostcall::host::verification_version(
                   hostcall::host::route_t::dns_lookup_host_v1)
                   .has_value());
}

TEST(request_decoder, routed_verify_uses_the_route_version) {
  auto bytes = encode(sigstore_verification_input_v2_t{
      sigstore_keyless_prefix_verify_input<2>{
          .image = "img",
          .keyless_prefix = hostcall::testing::make_keyless_prefix(),
          .annotations = std::nullopt}});

  auto v1 = hostcall::host::decode_request(hostcall::host::route_t::verify_v1,
                                           view(bytes));
  auto v2 = hostcall::host::decode_request(hostcall::host::route_t::verify_v2,
                                           view(bytes));

  EXPECT_EQ(v1.code, kMalformedRequest);
  ASSERT_EQ(v2.code, 0u);
  EXPECT_TRUE(
      std::holds_alternative<sigstore_keyless_prefix_verify_t>(*v2.request));
}
