#pragma once
#include <hostcall/schema/primitives.hpp>
#include <optional>
#include <string>

// Canonical request: keyless verification of a signature produced inside a
// GitHub Actions workflow.
namespace hostcall::schema {

struct sigstore_github_actions_verify_t final {
  image_ref_t image;
  std::string owner;                // e.g. octocat
  std::optional<std::string> repo;  // e.g. example-repo
  std::optional<annotations_t> annotations;

  bool operator==(const sigstore_github_actions_verify_t&) const = default;
};

}  // namespace hostcall::schema
