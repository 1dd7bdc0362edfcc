#pragma once

#include <string_view>

// Datamodel v1: path schema.
// Literal layout of the v1 namespace in the key-value store. Incompatible
// layouts get a new sibling namespace (v2, ...) so both can be served while
// hosts migrate; nothing here is ever changed in place.
namespace calico::datamodel::v1 {

// All Calico data lives under this root.
inline constexpr std::string_view kRootDir{"/calico"};

inline constexpr std::string_view kFelixVersion{"/v1"};
inline constexpr std::string_view kOpenstackVersion{"/v1"};

inline constexpr std::string_view kOpenstackDir{"/calico/openstack"};
inline constexpr std::string_view kOpenstackVersionDir{"/calico/openstack/v1"};

// Status reported by felix, one subtree per host.
inline constexpr std::string_view kFelixStatusDir{"/calico/felix/v1/host"};

// Data flowing from the orchestrator to felix.
inline constexpr std::string_view kVersionDir{"/calico/v1"};
// Global ready flag, holds "true" or "false".
inline constexpr std::string_view kReadyKey{"/calico/v1/Ready"};
inline constexpr std::string_view kConfigDir{"/calico/v1/config"};
inline constexpr std::string_view kHostDir{"/calico/v1/host"};
inline constexpr std::string_view kPolicyDir{"/calico/v1/policy"};
inline constexpr std::string_view kProfileDir{"/calico/v1/policy/profile"};
inline constexpr std::string_view kIpamV4PoolDir{"/calico/v1/ipam/v4/pool"};

// Leader election among Neutron mechanism drivers.
inline constexpr std::string_view kNeutronElectionKey{
    "/calico/openstack/v1/neutron_election"};

// Leaf and directory names below a host or profile.
inline constexpr std::string_view kConfigSegment{"config"};
inline constexpr std::string_view kWorkloadSegment{"workload"};
inline constexpr std::string_view kEndpointSegment{"endpoint"};
inline constexpr std::string_view kBirdIpSegment{"bird_ip"};
inline constexpr std::string_view kStatusSegment{"status"};
inline constexpr std::string_view kLastStatusSegment{"last_reported_status"};
inline constexpr std::string_view kRulesSegment{"rules"};
inline constexpr std::string_view kTagsSegment{"tags"};

static_assert(kVersionDir.starts_with(kRootDir));
static_assert(kVersionDir.ends_with(kFelixVersion));
static_assert(kOpenstackVersionDir.starts_with(kOpenstackDir));
static_assert(kOpenstackVersionDir.ends_with(kOpenstackVersion));
static_assert(kHostDir.starts_with(kVersionDir));
static_assert(kConfigDir.starts_with(kVersionDir));
static_assert(kProfileDir.starts_with(kPolicyDir));
static_assert(kIpamV4PoolDir.starts_with(kVersionDir));
static_assert(kFelixStatusDir.starts_with(kRootDir));
static_assert(kNeutronElectionKey.starts_with(kOpenstackVersionDir));

}  // namespace calico::datamodel::v1
