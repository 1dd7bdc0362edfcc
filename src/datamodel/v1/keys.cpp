#include <calico/datamodel/v1/builder.hpp>
#include <calico/datamodel/v1/keys.hpp>
#include <calico/datamodel/v1/paths.hpp>

namespace calico::datamodel::v1 {

namespace {

std::string make_workload_endpoint_key(std::string_view root,
                                       std::string_view host,
                                       std::string_view orchestrator,
                                       std::string_view workload_id,
                                       std::string_view endpoint_id) {
  auto b = builder{};
  b.write(root);
  b.segments(host, kWorkloadSegment, orchestrator, workload_id,
             kEndpointSegment, endpoint_id);
  return std::move(b).str();
}

}  // namespace

std::string make_host_dir(std::string_view hostname) {
  auto b = builder{};
  b.write(kHostDir).segment(hostname);
  return std::move(b).str();
}

std::string make_host_config_dir(std::string_view hostname) {
  auto b = builder{};
  b.write(kHostDir).segments(hostname, kConfigSegment);
  return std::move(b).str();
}

std::string make_host_config_key(std::string_view hostname,
                                 std::string_view config_name) {
  auto b = builder{};
  b.write(kHostDir).segments(hostname, kConfigSegment, config_name);
  return std::move(b).str();
}

std::string make_host_ip_key(std::string_view hostname) {
  auto b = builder{};
  b.write(kHostDir).segments(hostname, kBirdIpSegment);
  return std::move(b).str();
}

std::string make_status_dir(std::string_view hostname) {
  auto b = builder{};
  b.write(kFelixStatusDir).segment(hostname);
  return std::move(b).str();
}

std::string make_last_status_key(std::string_view hostname) {
  auto b = builder{};
  b.write(kFelixStatusDir).segments(hostname, kLastStatusSegment);
  return std::move(b).str();
}

std::string make_status_key(std::string_view hostname) {
  auto b = builder{};
  b.write(kFelixStatusDir).segments(hostname, kStatusSegment);
  return std::move(b).str();
}

std::string make_endpoint_key(std::string_view host,
                              std::string_view orchestrator,
                              std::string_view workload_id,
                              std::string_view endpoint_id) {
  return make_workload_endpoint_key(kHostDir, host, orchestrator, workload_id,
                                    endpoint_id);
}

std::string make_endpoint_status_key(std::string_view host,
                                     std::string_view orchestrator,
                                     std::string_view workload_id,
                                     std::string_view endpoint_id) {
  return make_workload_endpoint_key(kFelixStatusDir, host, orchestrator,
                                    workload_id, endpoint_id);
}

std::string make_profile_key(std::string_view profile_id) {
  auto b = builder{};
  b.write(kProfileDir).segment(profile_id);
  return std::move(b).str();
}

std::string make_profile_rules_key(std::string_view profile_id) {
  auto b = builder{};
  b.write(kProfileDir).segments(profile_id, kRulesSegment);
  return std::move(b).str();
}

std::string make_profile_tags_key(std::string_view profile_id) {
  auto b = builder{};
  b.write(kProfileDir).segments(profile_id, kTagsSegment);
  return std::move(b).str();
}

std::string make_config_key(std::string_view config_name) {
  auto b = builder{};
  b.write(kConfigDir).segment(config_name);
  return std::move(b).str();
}

std::string make_ipam_v4_pool_key(std::string_view encoded_cidr) {
  auto b = builder{};
  b.write(kIpamV4PoolDir).segment(encoded_cidr);
  return std::move(b).str();
}

}  // namespace calico::datamodel::v1
