#include <calico/datamodel/v1/parse.hpp>
#include <calico/datamodel/v1/paths.hpp>

#include <spdlog/spdlog.h>

#include <array>

namespace calico::datamodel::v1 {

namespace {

using endpoint_fields_t = std::array<std::string_view, 4>;

bool consume_literal(std::string_view& rest, const std::string_view literal) {
  if (!rest.starts_with(literal)) {
    return false;
  }
  rest.remove_prefix(literal.size());
  return true;
}

// "/<name>", as a prefix of rest.
bool consume_named_segment(std::string_view& rest,
                           const std::string_view name) {
  auto copy = rest;
  if (!consume_literal(copy, "/") || !consume_literal(copy, name)) {
    return false;
  }
  rest = copy;
  return true;
}

// "/" followed by a non-empty run of anything but '/'.
std::optional<std::string_view> consume_capture(std::string_view& rest) {
  if (!rest.starts_with('/')) {
    return std::nullopt;
  }
  auto segment = rest.substr(1, rest.find('/', 1) - 1);
  if (segment.empty()) {
    return std::nullopt;
  }
  rest.remove_prefix(segment.size() + 1);
  return segment;
}

// Last segment of key, minus trailing '/', when its parent is exactly dir.
std::optional<std::string> child_of_dir(std::string_view key,
                                        const std::string_view dir) {
  while (key.ends_with('/')) {
    key.remove_suffix(1);
  }
  auto separator = key.rfind('/');
  if (separator == std::string_view::npos) {
    return std::nullopt;
  }
  if (key.substr(0, separator) != dir) {
    return std::nullopt;
  }
  return std::string{key.substr(separator + 1)};
}

std::optional<std::string> capture_after(std::string_view key,
                                         const std::string_view prefix,
                                         const std::string_view leaf) {
  if (!consume_literal(key, prefix)) {
    return std::nullopt;
  }
  auto captured = consume_capture(key);
  if (!captured || !consume_named_segment(key, leaf)) {
    return std::nullopt;
  }
  return std::string{*captured};
}

std::optional<endpoint_fields_t> match_endpoint(std::string_view key) {
  if (!consume_literal(key, kHostDir) &&
      !consume_literal(key, kFelixStatusDir)) {
    return std::nullopt;
  }
  auto host = consume_capture(key);
  if (!host || !consume_named_segment(key, kWorkloadSegment)) {
    return std::nullopt;
  }
  auto orchestrator = consume_capture(key);
  if (!orchestrator) {
    return std::nullopt;
  }
  auto workload = consume_capture(key);
  if (!workload || !consume_named_segment(key, kEndpointSegment)) {
    return std::nullopt;
  }
  auto endpoint = consume_capture(key);
  if (!endpoint) {
    return std::nullopt;
  }
  return endpoint_fields_t{*host, *orchestrator, *workload, *endpoint};
}

template <typename MakeEndpoint>
std::optional<parsed_key_t> classify(std::string_view key,
                                     MakeEndpoint&& make_endpoint) {
  if (key == kReadyKey) {
    return parsed_key_t{ready_key{}};
  }
  if (key == kNeutronElectionKey) {
    return parsed_key_t{neutron_election_key{}};
  }
  // Endpoint status keys also end in a host's status subtree, so endpoints
  // are tried before the looser status match.
  if (auto fields = match_endpoint(key)) {
    return parsed_key_t{make_endpoint(*fields)};
  }
  if (auto hostname = parse_hostname_from_status_key(key)) {
    return parsed_key_t{status_key{.hostname = std::move(*hostname)}};
  }
  if (auto hostname =
          capture_after(key, kFelixStatusDir, kLastStatusSegment)) {
    return parsed_key_t{status_key{.hostname = std::move(*hostname)}};
  }
  if (auto profile_id = parse_profile_rules_key(key)) {
    return parsed_key_t{profile_key{.profile_id = std::move(*profile_id),
                                    .resource = profile_resource_t::rules}};
  }
  if (auto profile_id = parse_profile_tags_key(key)) {
    return parsed_key_t{profile_key{.profile_id = std::move(*profile_id),
                                    .resource = profile_resource_t::tags}};
  }
  if (auto profile_id = parse_profile_dir_key(key)) {
    return parsed_key_t{profile_key{.profile_id = std::move(*profile_id),
                                    .resource = profile_resource_t::directory}};
  }
  if (auto hostname = parse_host_ip_key(key)) {
    return parsed_key_t{host_ip_key{.hostname = std::move(*hostname)}};
  }
  if (auto host_config = parse_host_config_key(key)) {
    return parsed_key_t{config_key{.hostname = std::move(host_config->first),
                                   .name = std::move(host_config->second)}};
  }
  if (auto hostname = parse_host_dir_key(key)) {
    return parsed_key_t{host_key{.hostname = std::move(*hostname)}};
  }
  if (auto name = parse_config_key(key)) {
    return parsed_key_t{
        config_key{.hostname = std::nullopt, .name = std::move(*name)}};
  }
  if (auto encoded_cidr = parse_ipam_v4_pool_key(key)) {
    return parsed_key_t{
        ipam_v4_pool_key{.encoded_cidr = std::move(*encoded_cidr)}};
  }
  spdlog::debug("ignoring unrecognized key {}", key);
  return std::nullopt;
}

}  // namespace

std::optional<std::string> parse_profile_rules_key(std::string_view key) {
  return capture_after(key, kProfileDir, kRulesSegment);
}

std::optional<std::string> parse_profile_tags_key(std::string_view key) {
  return capture_after(key, kProfileDir, kTagsSegment);
}

std::optional<std::string> parse_profile_dir_key(std::string_view key) {
  return child_of_dir(key, kProfileDir);
}

std::optional<endpoint_id> parse_endpoint_key(std::string_view key) {
  auto fields = match_endpoint(key);
  if (!fields) {
    return std::nullopt;
  }
  return endpoint_id{(*fields)[0], (*fields)[1], (*fields)[2], (*fields)[3]};
}

std::optional<endpoint_id> parse_endpoint_key(intern_pool& pool,
                                              std::string_view key) {
  auto fields = match_endpoint(key);
  if (!fields) {
    return std::nullopt;
  }
  return endpoint_id{pool, (*fields)[0], (*fields)[1], (*fields)[2],
                     (*fields)[3]};
}

std::optional<std::string> parse_host_ip_key(std::string_view key) {
  return capture_after(key, kHostDir, kBirdIpSegment);
}

std::optional<std::string> parse_ipam_v4_pool_key(std::string_view key) {
  if (!consume_literal(key, kIpamV4PoolDir)) {
    return std::nullopt;
  }
  auto encoded_cidr = consume_capture(key);
  if (!encoded_cidr) {
    return std::nullopt;
  }
  return std::string{*encoded_cidr};
}

std::optional<std::string> parse_hostname_from_status_key(
    std::string_view key) {
  if (!key.ends_with("/status") || !consume_literal(key, kFelixStatusDir) ||
      !consume_literal(key, "/")) {
    return std::nullopt;
  }
  // The suffix may be the first segment itself: <felix status dir>/status
  // yields "status".
  auto hostname = key.substr(0, key.find('/'));
  if (hostname.empty()) {
    return std::nullopt;
  }
  return std::string{hostname};
}

std::optional<std::string> parse_host_dir_key(std::string_view key) {
  return child_of_dir(key, kHostDir);
}

std::optional<std::string> parse_config_key(std::string_view key) {
  if (!consume_literal(key, kConfigDir)) {
    return std::nullopt;
  }
  auto name = consume_capture(key);
  if (!name || !key.empty()) {
    return std::nullopt;
  }
  return std::string{*name};
}

std::optional<std::pair<std::string, std::string>> parse_host_config_key(
    std::string_view key) {
  if (!consume_literal(key, kHostDir)) {
    return std::nullopt;
  }
  auto hostname = consume_capture(key);
  if (!hostname || !consume_named_segment(key, kConfigSegment)) {
    return std::nullopt;
  }
  auto name = consume_capture(key);
  if (!name || !key.empty()) {
    return std::nullopt;
  }
  return std::pair<std::string, std::string>{*hostname, *name};
}

std::optional<parsed_key_t> parse_key(std::string_view key) {
  return classify(key, [](const endpoint_fields_t& fields) {
    return endpoint_id{fields[0], fields[1], fields[2], fields[3]};
  });
}

std::optional<parsed_key_t> parse_key(intern_pool& pool,
                                      std::string_view key) {
  return classify(key, [&pool](const endpoint_fields_t& fields) {
    return endpoint_id{pool, fields[0], fields[1], fields[2], fields[3]};
  });
}

}  // namespace calico::datamodel::v1
