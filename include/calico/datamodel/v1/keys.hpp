#pragma once

#include <string>
#include <string_view>

// Datamodel v1: key construction.
// Every function is total: identifiers are expected to be non-empty and free
// of '/', but nothing is validated here. Each key has a matching parse_*
// function in parse.hpp that recovers the identifiers it was built from.
namespace calico::datamodel::v1 {

/// Directory holding everything felix reads for one host.
std::string make_host_dir(std::string_view hostname);

/// Per-host configuration directory.
std::string make_host_config_dir(std::string_view hostname);

/// A single per-host configuration value.
std::string make_host_config_key(std::string_view hostname,
                                 std::string_view config_name);

/// BGP address advertised for a host.
std::string make_host_ip_key(std::string_view hostname);

/// Felix status directory of one host.
std::string make_status_dir(std::string_view hostname);

std::string make_last_status_key(std::string_view hostname);
std::string make_status_key(std::string_view hostname);

/// Live endpoint configuration written by the orchestrator.
std::string make_endpoint_key(std::string_view host,
                              std::string_view orchestrator,
                              std::string_view workload_id,
                              std::string_view endpoint_id);

/// Endpoint status reported by felix; same shape as make_endpoint_key under
/// the felix status root.
std::string make_endpoint_status_key(std::string_view host,
                                     std::string_view orchestrator,
                                     std::string_view workload_id,
                                     std::string_view endpoint_id);

std::string make_profile_key(std::string_view profile_id);
std::string make_profile_rules_key(std::string_view profile_id);
std::string make_profile_tags_key(std::string_view profile_id);

/// Global configuration value.
std::string make_config_key(std::string_view config_name);

/// IPv4 pool entry. The CIDR must already be encoded so it holds no '/'.
std::string make_ipam_v4_pool_key(std::string_view encoded_cidr);

}  // namespace calico::datamodel::v1
