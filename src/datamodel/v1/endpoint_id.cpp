#include <calico/datamodel/v1/endpoint_id.hpp>
#include <calico/datamodel/v1/keys.hpp>

#include <memory>

namespace calico::datamodel::v1 {

namespace {

interned_string_t make_field(std::string_view value) {
  return std::make_shared<const std::string>(value);
}

bool same_field(const interned_string_t& lhs, const interned_string_t& rhs) {
  return lhs == rhs || *lhs == *rhs;
}

}  // namespace

endpoint_id::endpoint_id(std::string_view host,
                         std::string_view orchestrator,
                         std::string_view workload,
                         std::string_view endpoint)
    : host_{make_field(host)},
      orchestrator_{make_field(orchestrator)},
      workload_{make_field(workload)},
      endpoint_{make_field(endpoint)} {}

endpoint_id::endpoint_id(intern_pool& pool,
                         std::string_view host,
                         std::string_view orchestrator,
                         std::string_view workload,
                         std::string_view endpoint)
    : host_{pool.intern(host)},
      orchestrator_{pool.intern(orchestrator)},
      workload_{pool.intern(workload)},
      endpoint_{pool.intern(endpoint)} {}

std::string endpoint_id::path_for_status() const {
  return make_endpoint_status_key(*host_, *orchestrator_, *workload_,
                                  *endpoint_);
}

std::string endpoint_id::path_for_config() const {
  return make_endpoint_key(*host_, *orchestrator_, *workload_, *endpoint_);
}

bool operator==(const endpoint_id& lhs, const endpoint_id& rhs) {
  if (&lhs == &rhs) {
    return true;
  }
  // Most likely to differ first.
  return same_field(lhs.endpoint_, rhs.endpoint_) &&
         same_field(lhs.workload_, rhs.workload_) &&
         same_field(lhs.host_, rhs.host_) &&
         same_field(lhs.orchestrator_, rhs.orchestrator_);
}

std::string to_string(const endpoint_id& id) {
  return "endpoint_id<" + id.endpoint() + ">";
}

std::ostream& operator<<(std::ostream& os, const endpoint_id& id) {
  return os << "endpoint_id(" << id.host() << ", " << id.orchestrator()
            << ", " << id.workload() << ", " << id.endpoint() << ")";
}

}  // namespace calico::datamodel::v1
