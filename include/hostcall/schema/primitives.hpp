#pragma once
#include <cstdint>
#include <map>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>
#include <vector>

namespace hostcall::schema {

using bytes_t = std::vector<uint8_t>;
using bytes_view_t = std::span<const uint8_t>;

// Object stored in an OCI registry, e.g. `registry.testing.lan/busybox:1.0.0`.
// Not validated here.
using image_ref_t = std::string;

// PEM encoded public key.
using pem_key_t = std::string;

// Annotations every signer must have attached. An absent set means no
// constraint and is not the same as an empty set.
using annotations_t = std::map<std::string, std::string>;

bytes_t make_bytes(const std::string_view& bytes);
bytes_view_t make_bytes_view(const bytes_t& bytes);

std::string to_hex(const bytes_view_t& bytes);
std::optional<bytes_t> try_from_hex(std::string_view hex);

template <typename T, typename Variant>
struct is_alternative_of : std::false_type {};

template <typename T, typename... Ts>
struct is_alternative_of<T, std::variant<Ts...>>
    : std::disjunction<std::is_same<T, Ts>...> {};

template <typename T, typename Variant>
inline constexpr bool is_alternative_of_v = is_alternative_of<T, Variant>::value;

}  // namespace hostcall::schema

template <class... Ts>
struct overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;
