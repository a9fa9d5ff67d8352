#pragma once

#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace lotgate::access {

/*
  Per-plate mutual exclusion.

  Every read-decide-mutate sequence for a plate (detections, payment
  notifications, operator actions) runs under that plate's lock. Lock order
  is plate lock before repository transaction.
*/
class PlateLockTable {
 public:
  class Guard {
   public:
    explicit Guard(std::shared_ptr<std::mutex> mutex) : mutex_(std::move(mutex)), lock_(*mutex_) {
    }

   private:
    std::shared_ptr<std::mutex>  mutex_;
    std::unique_lock<std::mutex> lock_;
  };

  Guard Lock(const std::string& plate);

  // Forget plates nobody holds or waits on.
  void Prune();

  std::size_t Size() const;

 private:
  mutable std::mutex                                           guard_;
  std::unordered_map<std::string, std::shared_ptr<std::mutex>> mutexes_;
};

} // namespace lotgate::access
