#pragma once

#include <calico/datamodel/intern_pool.hpp>
#include <calico/datamodel/v1/endpoint_id.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

// Datamodel v1: key parsing.
// Keys arrive from a namespace shared with other writers and other schema
// versions, so a key that matches nothing is normal: every parser returns
// std::nullopt for it and never throws, whatever the input bytes.
//
// Unless stated otherwise a pattern only has to match the start of the key.
// Captured identifiers run to the next '/' (or the end of the key) and are
// never empty.
namespace calico::datamodel::v1 {

enum class profile_resource_t : uint8_t { directory = 0, rules = 1, tags = 2 };

struct profile_key final {
  std::string profile_id;
  profile_resource_t resource{profile_resource_t::directory};
  bool operator==(const profile_key&) const = default;
};

struct host_key final {
  std::string hostname;
  bool operator==(const host_key&) const = default;
};

struct host_ip_key final {
  std::string hostname;
  bool operator==(const host_ip_key&) const = default;
};

/// Global configuration when hostname is empty, per-host otherwise.
struct config_key final {
  std::optional<std::string> hostname;
  std::string name;
  bool operator==(const config_key&) const = default;
};

struct ipam_v4_pool_key final {
  std::string encoded_cidr;
  bool operator==(const ipam_v4_pool_key&) const = default;
};

/// Any status leaf of a host: see parse_hostname_from_status_key(), plus
/// the last_reported_status leaf.
struct status_key final {
  std::string hostname;
  bool operator==(const status_key&) const = default;
};

struct ready_key final {
  bool operator==(const ready_key&) const = default;
};

struct neutron_election_key final {
  bool operator==(const neutron_election_key&) const = default;
};

using parsed_key_t = std::variant<endpoint_id,
                                  profile_key,
                                  host_key,
                                  host_ip_key,
                                  config_key,
                                  ipam_v4_pool_key,
                                  status_key,
                                  ready_key,
                                  neutron_election_key>;

/// <profile dir>/<profile id>/rules
std::optional<std::string> parse_profile_rules_key(std::string_view key);

/// <profile dir>/<profile id>/tags
std::optional<std::string> parse_profile_tags_key(std::string_view key);

/// Profile id when the key, minus trailing '/', is a direct child of the
/// profile directory. Unlike the other parsers this one is anchored at both
/// ends.
std::optional<std::string> parse_profile_dir_key(std::string_view key);

/// (<host dir>|<felix status dir>)/<host>/workload/<orchestrator>/
/// <workload>/endpoint/<endpoint>; both roots decode to the same id.
std::optional<endpoint_id> parse_endpoint_key(std::string_view key);
std::optional<endpoint_id> parse_endpoint_key(intern_pool& pool,
                                              std::string_view key);

/// <host dir>/<hostname>/bird_ip
std::optional<std::string> parse_host_ip_key(std::string_view key);

/// <version dir>/ipam/v4/pool/<encoded cidr>. The CIDR is returned still
/// encoded.
std::optional<std::string> parse_ipam_v4_pool_key(std::string_view key);

/// Owning host of any key below the felix status dir that ends in /status.
///
/// Looser than parse_endpoint_key(): it accepts per-host status as well as
/// anything deeper, e.g. <felix status dir>/h1/workload/.../e1/status.
/// The hostname is the first segment after the felix status dir, so
/// <felix status dir>/status yields "status". An empty first segment
/// (<felix status dir>//status) yields nothing.
std::optional<std::string> parse_hostname_from_status_key(
    std::string_view key);

/// Hostname when the key, minus trailing '/', is a direct child of the host
/// directory.
std::optional<std::string> parse_host_dir_key(std::string_view key);

/// Exactly <config dir>/<name>.
std::optional<std::string> parse_config_key(std::string_view key);

/// Exactly <host dir>/<hostname>/config/<name>, as (hostname, name).
std::optional<std::pair<std::string, std::string>> parse_host_config_key(
    std::string_view key);

/// Classify a key of any known shape.
std::optional<parsed_key_t> parse_key(std::string_view key);
std::optional<parsed_key_t> parse_key(intern_pool& pool, std::string_view key);

}  // namespace calico::datamodel::v1
