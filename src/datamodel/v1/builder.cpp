#include <calico/datamodel/v1/builder.hpp>

#include <algorithm>
#include <iterator>

using namespace calico::datamodel::v1;

builder& builder::write(const std::string_view& str) {
  std::ranges::copy_n(str.data(), str.size(), std::back_inserter(data));
  return *this;
}

builder& builder::segment(const std::string_view& str) {
  data.reserve(data.size() + str.size() + 1);
  data.push_back('/');
  return write(str);
}
