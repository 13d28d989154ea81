#pragma once
#include <hostcall/schema/callback_request_type.hpp>
#include <hostcall/schema/sigstore_verification_input_v1.hpp>
#include <hostcall/schema/sigstore_verification_input_v2.hpp>

namespace hostcall::schema {

// Relabel a versioned request as the canonical request of the same name.
// Fields are moved over untouched. Cannot fail.
callback_request_type_t to_callback_request(
    sigstore_verification_input_v1_t input);
callback_request_type_t to_callback_request(
    sigstore_verification_input_v2_t input);

}  // namespace hostcall::schema
