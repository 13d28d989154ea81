#pragma once
#include <cstdint>

// Versioned verification requests as sent by guests.
//
// Each schema generation specializes its own request structs; a generation is
// frozen once released. A new generation repeats every request of the previous
// one, in the same order and with the same fields, and appends new requests at
// the end, so a payload written for generation N decodes unchanged as N + 1.
namespace hostcall::schema {

template <uint16_t Version>
struct sigstore_pub_key_verify_input;

template <uint16_t Version>
struct sigstore_keyless_verify_input;

template <uint16_t Version>
struct sigstore_keyless_prefix_verify_input;

template <uint16_t Version>
struct sigstore_github_actions_verify_input;

}  // namespace hostcall::schema
