#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>
#include <utility>

// Datamodel v1: endpoint status.
// Values felix writes under an endpoint status key.
namespace calico::datamodel::v1 {

enum class endpoint_status_t : uint8_t { up = 0, down = 1, error = 2 };

inline constexpr auto kEndpointStatusNames = std::array{
    std::pair<std::string_view, endpoint_status_t>{"up",
                                                   endpoint_status_t::up},
    std::pair<std::string_view, endpoint_status_t>{"down",
                                                   endpoint_status_t::down},
    std::pair<std::string_view, endpoint_status_t>{"error",
                                                   endpoint_status_t::error}};

inline constexpr std::string_view to_string(const endpoint_status_t value) {
  for (const auto& [name, status] : kEndpointStatusNames) {
    if (status == value) {
      return name;
    }
  }
  return "unknown";
}

/// Exact, case-sensitive match of a stored status value.
inline constexpr std::optional<endpoint_status_t> parse_endpoint_status(
    const std::string_view value) {
  for (const auto& [name, status] : kEndpointStatusNames) {
    if (name == value) {
      return status;
    }
  }
  return std::nullopt;
}

}  // namespace calico::datamodel::v1
