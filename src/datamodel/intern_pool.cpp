#include <calico/datamodel/intern_pool.hpp>

#include <spdlog/spdlog.h>

#include <mutex>

namespace calico::datamodel {

interned_string_t intern_pool::intern(std::string_view value) {
  {
    auto lock = std::shared_lock{mutex_};
    auto it = strings_.find(value);
    if (it != std::end(strings_)) {
      return *it;
    }
  }

  auto lock = std::unique_lock{mutex_};
  // Another writer may have inserted it between the two locks.
  auto it = strings_.find(value);
  if (it != std::end(strings_)) {
    return *it;
  }
  auto interned = std::make_shared<const std::string>(value);
  strings_.insert(interned);
  return interned;
}

std::size_t intern_pool::size() const {
  auto lock = std::shared_lock{mutex_};
  return strings_.size();
}

std::size_t intern_pool::purge() {
  auto lock = std::unique_lock{mutex_};
  auto removed = std::erase_if(strings_, [](const interned_string_t& value) {
    return value.use_count() == 1;
  });
  spdlog::debug("intern pool purged {} of {} strings", removed,
                removed + strings_.size());
  return removed;
}

}  // namespace calico::datamodel
