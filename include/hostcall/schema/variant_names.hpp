#pragma once
#include <hostcall/schema/callback_request_type.hpp>
#include <hostcall/schema/request_version.hpp>
#include <hostcall/schema/sigstore_verification_input_v1.hpp>
#include <hostcall/schema/sigstore_verification_input_v2.hpp>

#include <array>
#include <optional>
#include <string_view>
#include <variant>

// Wire names of every request, indexed by variant position.
namespace hostcall::schema {

inline constexpr auto kSigstoreVerificationInputV1Names =
    std::array<std::string_view, 2>{"SigstorePubKeyVerify",
                                    "SigstoreKeylessVerify"};

inline constexpr auto kSigstoreVerificationInputV2Names =
    std::array<std::string_view, 4>{
        "SigstorePubKeyVerify", "SigstoreKeylessVerify",
        "SigstoreKeylessPrefixVerify", "SigstoreGithubActionsVerify"};

inline constexpr auto kCallbackRequestTypeNames =
    std::array<std::string_view, 6>{"OciManifestDigest",
                                    "SigstorePubKeyVerify",
                                    "SigstoreKeylessVerify",
                                    "SigstoreKeylessPrefixVerify",
                                    "SigstoreGithubActionsVerify",
                                    "DNSLookupHost"};

static_assert(kSigstoreVerificationInputV1Names.size() ==
              std::variant_size_v<sigstore_verification_input_v1_t>);
static_assert(kSigstoreVerificationInputV2Names.size() ==
              std::variant_size_v<sigstore_verification_input_v2_t>);
static_assert(kCallbackRequestTypeNames.size() ==
              std::variant_size_v<callback_request_type_t>);

std::string_view variant_name(const sigstore_verification_input_v1_t& input);
std::string_view variant_name(const sigstore_verification_input_v2_t& input);
std::string_view variant_name(const callback_request_type_t& request);

std::optional<std::string_view> variant_name(request_version_t version,
                                             std::size_t index);

}  // namespace hostcall::schema
