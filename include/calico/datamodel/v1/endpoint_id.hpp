#pragma once

#include <calico/datamodel/intern_pool.hpp>

#include <cstddef>
#include <functional>
#include <ostream>
#include <string>
#include <string_view>

// Datamodel v1: endpoint identity.
// Identifies one workload endpoint by host, orchestrator, workload and
// endpoint name. Values are immutable and cheap to copy; the field strings
// are shared between copies, and between all ids built through the same
// intern_pool.
namespace calico::datamodel::v1 {

class endpoint_id final {
 public:
  endpoint_id(std::string_view host,
              std::string_view orchestrator,
              std::string_view workload,
              std::string_view endpoint);

  endpoint_id(intern_pool& pool,
              std::string_view host,
              std::string_view orchestrator,
              std::string_view workload,
              std::string_view endpoint);

  // Copy only; a moved-from id keeps its (shared) fields.
  endpoint_id(const endpoint_id&) = default;
  endpoint_id& operator=(const endpoint_id&) = default;
  ~endpoint_id() = default;

  const std::string& host() const { return *host_; }
  const std::string& orchestrator() const { return *orchestrator_; }
  const std::string& workload() const { return *workload_; }
  const std::string& endpoint() const { return *endpoint_; }

  /// Felix status key of this endpoint, identical to
  /// make_endpoint_status_key() for the same fields.
  std::string path_for_status() const;

  /// Live configuration key of this endpoint, identical to
  /// make_endpoint_key() for the same fields.
  std::string path_for_config() const;

  friend bool operator==(const endpoint_id& lhs, const endpoint_id& rhs);

 private:
  interned_string_t host_;
  interned_string_t orchestrator_;
  interned_string_t workload_;
  interned_string_t endpoint_;
};

/// Short form for log lines: endpoint_id<endpoint>.
std::string to_string(const endpoint_id& id);

std::ostream& operator<<(std::ostream& os, const endpoint_id& id);

}  // namespace calico::datamodel::v1

// Only the endpoint and workload names are hashed. Hosts and orchestrators
// have low cardinality, so leaving them out costs little spread and saves
// work on the decode path. Equal ids still hash equally.
template <>
struct std::hash<calico::datamodel::v1::endpoint_id> {
  std::size_t operator()(
      const calico::datamodel::v1::endpoint_id& id) const noexcept {
    return std::hash<std::string>{}(id.endpoint()) +
           std::hash<std::string>{}(id.workload());
  }
};
