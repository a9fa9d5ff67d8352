#include "internal/access/plate_lock_table.hpp"

namespace lotgate::access {

PlateLockTable::Guard PlateLockTable::Lock(const std::string& plate) {
  std::shared_ptr<std::mutex> plate_mutex;
  {
    std::lock_guard<std::mutex> lock(guard_);
    auto&                       slot = mutexes_[plate];
    if (!slot) {
      slot = std::make_shared<std::mutex>();
    }
    plate_mutex = slot;
  }
  return Guard(std::move(plate_mutex));
}

void PlateLockTable::Prune() {
  std::lock_guard<std::mutex> lock(guard_);
  std::erase_if(mutexes_, [](const auto& item) { return item.second.use_count() == 1; });
}

std::size_t PlateLockTable::Size() const {
  std::lock_guard<std::mutex> lock(guard_);
  return mutexes_.size();
}

} // namespace lotgate::access
