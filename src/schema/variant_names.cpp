#include <hostcall/schema/variant_names.hpp>

namespace hostcall::schema {

std::string_view variant_name(const sigstore_verification_input_v1_t& input) {
  return kSigstoreVerificationInputV1Names[input.index()];
}

std::string_view variant_name(const sigstore_verification_input_v2_t& input) {
  return kSigstoreVerificationInputV2Names[input.index()];
}

std::string_view variant_name(const callback_request_type_t& request) {
  return kCallbackRequestTypeNames[request.index()];
}

std::optional<std::string_view> variant_name(const request_version_t version,
                                             const std::size_t index) {
  switch (version) {
    case request_version_t::v1:
      if (index < kSigstoreVerificationInputV1Names.size()) {
        return kSigstoreVerificationInputV1Names[index];
      }
      return std::nullopt;
    case request_version_t::v2:
      if (index < kSigstoreVerificationInputV2Names.size()) {
        return kSigstoreVerificationInputV2Names[index];
      }
      return std::nullopt;
  }
  return std::nullopt;
}

}  // namespace hostcall::schema
