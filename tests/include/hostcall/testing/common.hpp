#pragma once

#include <hostcall/schema/encoding/scale/encoder.hpp>
#include <hostcall/schema/primitives.hpp>
#include <hostcall/schema/sigstore_verification_input_v1.hpp>
#include <hostcall/schema/sigstore_verification_input_v2.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace hostcall::testing {

using encoder_t = hostcall::schema::encoding::encoder<
    hostcall::schema::encoding::scale_encoder_tag>;

inline constexpr auto kImage = std::string_view{"reg/busybox:1.0.0"};

inline std::vector<std::string> make_pub_keys() {
  return {"-----BEGIN PUBLIC KEY-----\nPEM1\n-----END PUBLIC KEY-----\n",
          "-----BEGIN PUBLIC KEY-----\nPEM2\n-----END PUBLIC KEY-----\n"};
}

inline std::vector<hostcall::schema::keyless_info_t> make_keyless() {
  return {{.issuer = "https://token.actions.githubusercontent.com",
           .subject = "https://github.com/octocat/app/.github/workflows/"
                      "release.yml@refs/heads/main"},
          {.issuer = "https://accounts.google.com",
           .subject = "signer@example.com"}};
}

inline std::vector<hostcall::schema::keyless_prefix_info_t>
make_keyless_prefix() {
  return {{.issuer = "https://token.actions.githubusercontent.com",
           .url_prefix = "https://github.com/octocat/"}};
}

inline hostcall::schema::annotations_t make_annotations() {
  return {{"env", "prod"}, {"team", "platform"}};
}

template <typename T>
hostcall::schema::bytes_t encode(const T& value) {
  return encoder_t{}.encode(value);
}

inline hostcall::schema::bytes_view_t view(
    const hostcall::schema::bytes_t& bytes) {
  return hostcall::schema::bytes_view_t{bytes.data(), bytes.size()};
}

}  // namespace hostcall::testing
