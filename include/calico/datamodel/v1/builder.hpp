#pragma once

#include <string>
#include <string_view>
#include <utility>

namespace calico::datamodel::v1 {

/// Appends literal prefixes and '/'-separated segments into a key.
///
/// Segments are copied verbatim; a segment containing '/' produces a key
/// that the matchers will not decode back to the same identifier.
struct builder final {
  std::string data;

  builder& write(const std::string_view& str);
  builder& segment(const std::string_view& str);

  template <typename... Segments>
  builder& segments(const Segments&... values) {
    (segment(std::string_view{values}), ...);
    return *this;
  }

  std::string str() const& { return data; }
  std::string str() && { return std::move(data); }
};

}  // namespace calico::datamodel::v1
