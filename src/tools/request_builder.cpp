#include <boost/program_options.hpp>
#include <hostcall/common/critical.hpp>
#include <hostcall/host/request_decoder.hpp>
#include <hostcall/host/route.hpp>
#include <hostcall/schema/encoding/scale/encoder.hpp>
#include <hostcall/schema/request_error_code.hpp>
#include <hostcall/schema/request_version.hpp>
#include <hostcall/schema/sigstore_verification_input_v1.hpp>
#include <hostcall/schema/sigstore_verification_input_v2.hpp>
#include <hostcall/schema/variant_names.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <cstdint>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace {

using encoder_t = hostcall::schema::encoding::encoder<
    hostcall::schema::encoding::scale_encoder_tag>;
namespace po = boost::program_options;

std::vector<std::string> get_strings(const po::variables_map& vm,
                                     const std::string& name) {
  if (!vm.contains(name)) {
    return {};
  }
  return vm[name].as<std::vector<std::string>>();
}

std::string get_required(const po::variables_map& vm, const std::string& name) {
  if (!vm.contains(name)) {
    hostcall::common::critical("missing required option --" + name);
  }
  return vm[name].as<std::string>();
}

std::pair<std::string, std::string> split_pair(const std::string_view value,
                                               const char separator) {
  auto at = value.find(separator);
  if (at == std::string_view::npos) {
    hostcall::common::critical("expected <left>" + std::string{separator} +
                               "<right>, got '" + std::string{value} + "'");
  }
  return {std::string{value.substr(0, at)}, std::string{value.substr(at + 1)}};
}

std::optional<hostcall::schema::annotations_t> make_annotations(
    const po::variables_map& vm) {
  auto values = get_strings(vm, "annotation");
  if (values.empty() && !vm.contains("empty-annotations")) {
    return std::nullopt;
  }
  auto annotations = hostcall::schema::annotations_t{};
  for (const auto& value : values) {
    auto [key, entry] = split_pair(value, '=');
    if (annotations.contains(key)) {
      hostcall::common::critical("--annotation key '" + key +
                                 "' given more than once");
    }
    annotations.emplace(std::move(key), std::move(entry));
  }
  return annotations;
}

// --keyless takes issuer=subject, --keyless-prefix takes issuer=url_prefix.
std::vector<hostcall::schema::keyless_info_t> make_keyless(
    const po::variables_map& vm) {
  auto out = std::vector<hostcall::schema::keyless_info_t>{};
  for (const auto& value : get_strings(vm, "keyless")) {
    auto [issuer, subject] = split_pair(value, '=');
    out.push_back({.issuer = std::move(issuer), .subject = std::move(subject)});
  }
  return out;
}

std::vector<hostcall::schema::keyless_prefix_info_t> make_keyless_prefix(
    const po::variables_map& vm) {
  auto out = std::vector<hostcall::schema::keyless_prefix_info_t>{};
  for (const auto& value : get_strings(vm, "keyless-prefix")) {
    auto [issuer, url_prefix] = split_pair(value, '=');
    out.push_back(
        {.issuer = std::move(issuer), .url_prefix = std::move(url_prefix)});
  }
  return out;
}

std::optional<std::string> get_optional(const po::variables_map& vm,
                                        const std::string& name) {
  if (!vm.contains(name)) {
    return std::nullopt;
  }
  return vm[name].as<std::string>();
}

hostcall::schema::bytes_t build_v1(const po::variables_map& vm,
                                   const std::string& kind) {
  using namespace hostcall::schema;
  auto input = sigstore_verification_input_v1_t{};
  if (kind == "pub-key") {
    input = sigstore_pub_key_verify_input<1>{
        .image = get_required(vm, "image"),
        .pub_keys = get_strings(vm, "pub-key"),
        .annotations = make_annotations(vm)};
  } else if (kind == "keyless") {
    input = sigstore_keyless_verify_input<1>{
        .image = get_required(vm, "image"),
        .keyless = make_keyless(vm),
        .annotations = make_annotations(vm)};
  } else {
    hostcall::common::critical("v1 supports --kind pub-key|keyless");
  }
  return encoder_t{}.encode(input);
}

hostcall::schema::bytes_t build_v2(const po::variables_map& vm,
                                   const std::string& kind) {
  using namespace hostcall::schema;
  auto input = sigstore_verification_input_v2_t{};
  if (kind == "pub-key") {
    input = sigstore_pub_key_verify_input<2>{
        .image = get_required(vm, "image"),
        .pub_keys = get_strings(vm, "pub-key"),
        .annotations = make_annotations(vm)};
  } else if (kind == "keyless") {
    input = sigstore_keyless_verify_input<2>{
        .image = get_required(vm, "image"),
        .keyless = make_keyless(vm),
        .annotations = make_annotations(vm)};
  } else if (kind == "keyless-prefix") {
    input = sigstore_keyless_prefix_verify_input<2>{
        .image = get_required(vm, "image"),
        .keyless_prefix = make_keyless_prefix(vm),
        .annotations = make_annotations(vm)};
  } else if (kind == "github-actions") {
    input = sigstore_github_actions_verify_input<2>{
        .image = get_required(vm, "image"),
        .owner = get_required(vm, "owner"),
        .repo = get_optional(vm, "repo"),
        .annotations = make_annotations(vm)};
  } else {
    hostcall::common::critical(
        "v2 supports --kind pub-key|keyless|keyless-prefix|github-actions");
  }
  return encoder_t{}.encode(input);
}

void print_annotations(
    const std::optional<hostcall::schema::annotations_t>& annotations) {
  if (!annotations) {
    std::cout << "annotations: none\n";
    return;
  }
  std::cout << "annotations: " << annotations->size() << '\n';
  for (const auto& [key, value] : *annotations) {
    std::cout << "  " << key << '=' << value << '\n';
  }
}

void print_request(const hostcall::schema::callback_request_type_t& request) {
  using namespace hostcall::schema;
  std::cout << variant_name(request) << '\n';
  std::visit(
      overloaded{[](const oci_manifest_digest_t& r) {
                   std::cout << "image: " << r.image << '\n';
                 },
                 [](const sigstore_pub_key_verify_t& r) {
                   std::cout << "image: " << r.image << '\n';
                   for (const auto& key : r.pub_keys) {
                     std::cout << "pub_key: " << key << '\n';
                   }
                   print_annotations(r.annotations);
                 },
                 [](const sigstore_keyless_verify_t& r) {
                   std::cout << "image: " << r.image << '\n';
                   for (const auto& info : r.keyless) {
                     std::cout << "keyless: " << info.issuer << ' '
                               << info.subject << '\n';
                   }
                   print_annotations(r.annotations);
                 },
                 [](const sigstore_keyless_prefix_verify_t& r) {
                   std::cout << "image: " << r.image << '\n';
                   for (const auto& info : r.keyless_prefix) {
                     std::cout << "keyless_prefix: " << info.issuer << ' '
                               << info.url_prefix << '\n';
                   }
                   print_annotations(r.annotations);
                 },
                 [](const sigstore_github_actions_verify_t& r) {
                   std::cout << "image: " << r.image << '\n';
                   std::cout << "owner: " << r.owner << '\n';
                   std::cout << "repo: " << r.repo.value_or("none") << '\n';
                   print_annotations(r.annotations);
                 },
                 [](const dns_lookup_host_t& r) {
                   std::cout << "host: " << r.host << '\n';
                 }},
      request);
}

int inspect(const po::variables_map& vm) {
  const auto binding_namespace = get_required(vm, "namespace");
  const auto operation = get_required(vm, "operation");
  auto payload =
      hostcall::schema::try_from_hex(get_required(vm, "payload-hex"));
  if (!payload) {
    hostcall::common::critical("--payload-hex is not valid hex");
  }

  auto route = hostcall::host::find_route(binding_namespace, operation);
  if (!route) {
    std::cout << "error "
              << static_cast<uint32_t>(
                     hostcall::schema::request_error_code::unsupported_version)
              << " unsupported host call: " << binding_namespace << '/'
              << operation << '\n';
    return 1;
  }
  auto decoded = hostcall::host::decode_request(
      *route, hostcall::schema::make_bytes_view(*payload));
  if (decoded.code != 0 || !decoded.request) {
    std::cout << "error " << decoded.code << ' ' << decoded.log << ": "
              << decoded.info << '\n';
    return 1;
  }
  print_request(*decoded.request);
  return 0;
}

void print_help(const po::options_description& options) {
  std::cout << "Usage:\n"
            << "  request_builder verify --schema v1|v2 --kind <kind> "
               "[options]\n"
            << "  request_builder manifest-digest --image <image>\n"
            << "  request_builder dns-lookup --host <host>\n"
            << "  request_builder inspect --namespace <ns> --operation <op> "
               "--payload-hex <hex>\n\n";
  std::cout << options << '\n';
}

}  // namespace

int main(int argc, const char** argv) {
  auto logger = spdlog::stderr_color_mt("request_builder");
  spdlog::set_default_logger(logger);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
  spdlog::set_level(spdlog::level::warn);

  auto command = std::string{};
  auto options = po::options_description{"request_builder options"};
  options.add_options()("help,h", "show help")(
      "verbose,v", "enable debug logging")(
      "command", po::value<std::string>(&command),
      "verify|manifest-digest|dns-lookup|inspect")(
      "schema", po::value<std::string>()->default_value("v2"),
      "verification input generation: v1|v2")(
      "kind", po::value<std::string>(),
      "pub-key|keyless|keyless-prefix|github-actions")(
      "image", po::value<std::string>(), "OCI object reference")(
      "pub-key", po::value<std::vector<std::string>>()->multitoken(),
      "PEM encoded public keys")(
      "keyless", po::value<std::vector<std::string>>()->multitoken(),
      "issuer=subject identities")(
      "keyless-prefix", po::value<std::vector<std::string>>()->multitoken(),
      "issuer=url_prefix identities")(
      "owner", po::value<std::string>(), "GitHub repository owner")(
      "repo", po::value<std::string>(), "GitHub repository name")(
      "annotation", po::value<std::vector<std::string>>()->multitoken(),
      "key=value annotations required from every signer")(
      "empty-annotations", "send an empty annotation set instead of none")(
      "host", po::value<std::string>(), "hostname to resolve")(
      "namespace", po::value<std::string>(), "host call namespace")(
      "operation", po::value<std::string>(), "host call operation")(
      "payload-hex", po::value<std::string>(), "payload bytes hex");

  auto positional = po::positional_options_description{};
  positional.add("command", 1);
  auto vm = po::variables_map{};
  po::store(po::command_line_parser(argc, argv)
                .options(options)
                .positional(positional)
                .run(),
            vm);
  po::notify(vm);

  if (vm.contains("help") || command.empty()) {
    print_help(options);
    return 0;
  }
  if (vm.contains("verbose")) {
    spdlog::set_level(spdlog::level::debug);
  }

  if (command == "verify") {
    auto version = hostcall::schema::try_from_string<
        hostcall::schema::request_version_t>(vm["schema"].as<std::string>());
    if (!version) {
      hostcall::common::critical("--schema must be v1|v2");
    }
    const auto kind = get_required(vm, "kind");
    auto encoded = *version == hostcall::schema::request_version_t::v1
                       ? build_v1(vm, kind)
                       : build_v2(vm, kind);
    std::cout << hostcall::schema::to_hex(
                     hostcall::schema::make_bytes_view(encoded))
              << '\n';
    return 0;
  }

  if (command == "manifest-digest") {
    auto encoded = encoder_t{}.encode(get_required(vm, "image"));
    std::cout << hostcall::schema::to_hex(
                     hostcall::schema::make_bytes_view(encoded))
              << '\n';
    return 0;
  }

  if (command == "dns-lookup") {
    auto encoded = encoder_t{}.encode(get_required(vm, "host"));
    std::cout << hostcall::schema::to_hex(
                     hostcall::schema::make_bytes_view(encoded))
              << '\n';
    return 0;
  }

  if (command == "inspect") {
    return inspect(vm);
  }

  hostcall::common::critical(
      "command must be verify|manifest-digest|dns-lookup|inspect");
}
