#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_set>

namespace calico::datamodel {

using interned_string_t = std::shared_ptr<const std::string>;

/// Canonicalizes identifier strings so that equal values share one copy.
///
/// Hostnames and orchestrator names repeat across every endpoint of a host,
/// and workload/endpoint names recur as workloads churn. Decoders that build
/// many endpoint_id values from a watch stream pass one pool to all of them.
/// intern() is safe to call concurrently from any number of threads.
class intern_pool final {
 public:
  intern_pool() = default;

  intern_pool(const intern_pool&) = delete;
  intern_pool& operator=(const intern_pool&) = delete;
  intern_pool(intern_pool&&) = delete;
  intern_pool& operator=(intern_pool&&) = delete;

  /// Return the canonical instance equal to value, inserting it if absent.
  interned_string_t intern(std::string_view value);

  /// Number of canonical strings currently held.
  std::size_t size() const;

  /// Drop strings that nothing outside the pool references any more.
  ///
  /// Returns the number of entries removed.
  std::size_t purge();

 private:
  struct string_hash final {
    using is_transparent = void;
    std::size_t operator()(std::string_view value) const noexcept {
      return std::hash<std::string_view>{}(value);
    }
    std::size_t operator()(const interned_string_t& value) const noexcept {
      return std::hash<std::string_view>{}(*value);
    }
  };

  struct string_equal final {
    using is_transparent = void;
    bool operator()(const interned_string_t& lhs,
                    const interned_string_t& rhs) const noexcept {
      return *lhs == *rhs;
    }
    bool operator()(std::string_view lhs,
                    const interned_string_t& rhs) const noexcept {
      return lhs == *rhs;
    }
    bool operator()(const interned_string_t& lhs,
                    std::string_view rhs) const noexcept {
      return *lhs == rhs;
    }
  };

  mutable std::shared_mutex mutex_;
  std::unordered_set<interned_string_t, string_hash, string_equal> strings_;
};

}  // namespace calico::datamodel
