#pragma once

#include <calico/datamodel/v1/endpoint_id.hpp>

#include <array>
#include <string>
#include <string_view>

namespace calico::testing {

inline constexpr auto kHost = std::string_view{"h1"};
inline constexpr auto kOrchestrator = std::string_view{"orc"};
inline constexpr auto kWorkload = std::string_view{"w1"};
inline constexpr auto kEndpoint = std::string_view{"e1"};

inline calico::datamodel::v1::endpoint_id make_endpoint_id() {
  return calico::datamodel::v1::endpoint_id{kHost, kOrchestrator, kWorkload,
                                            kEndpoint};
}

inline calico::datamodel::v1::endpoint_id make_endpoint_id(const int seed) {
  const auto suffix = std::to_string(seed);
  return calico::datamodel::v1::endpoint_id{
      "host-" + suffix, "orch-" + suffix, "workload-" + suffix,
      "endpoint-" + suffix};
}

// Keys no v1 parser may accept.
inline constexpr auto kUnrelatedKeys = std::array{
    std::string_view{""},
    std::string_view{"/"},
    std::string_view{"/foo/bar"},
    std::string_view{"/calico"},
    std::string_view{"/calico/v1"},
    std::string_view{"/calico/v2/host/h1/workload/orc/w1/endpoint/e1"},
    std::string_view{"/calico/v2/policy/profile/foo/rules"},
    std::string_view{"/calico/v2/ipam/v4/pool/10.0.0.0-8"},
    std::string_view{"\xff\xfe\x00garbage", 10},
    std::string_view{"calico/v1/host/h1/bird_ip"}};

}  // namespace calico::testing
