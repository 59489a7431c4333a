#include "engine/file_lock_registry.hpp"
#include <boost/log/trivial.hpp>

namespace chunkvault {
namespace engine {

//==============================================
// GUARD
//==============================================

FileLockRegistry::Guard::Guard(FileLockRegistry* registry, std::pair<std::string, std::string> key,
                               std::shared_ptr<std::mutex> mutex)
  : registry_(registry)
  , key_(std::move(key))
  , mutex_(std::move(mutex)) {}

FileLockRegistry::Guard::Guard(Guard&& other) noexcept
  : registry_(other.registry_)
  , key_(std::move(other.key_))
  , mutex_(std::move(other.mutex_)) {
  other.registry_ = nullptr;
}

FileLockRegistry::Guard::~Guard() {
  if (registry_ && mutex_) {
    mutex_->unlock();
    registry_->release(key_);
  }
}


//==============================================
// REGISTRY
//==============================================

FileLockRegistry::Guard FileLockRegistry::lock(const std::string& owner, const std::string& file_id) {
  auto key = std::make_pair(owner, file_id);
  std::shared_ptr<std::mutex> mutex;
  {
    // Only the lookup happens under the registry mutex, never the file I/O
    std::lock_guard<std::mutex> lock(registry_mutex_);
    Slot& slot = slots_[key];
    if (!slot.mutex) {
      slot.mutex = std::make_shared<std::mutex>();
    }
    ++slot.users;
    mutex = slot.mutex;
  }

  BOOST_LOG_TRIVIAL(trace) << "File locks: Waiting for " << owner << "/" << file_id;
  mutex->lock();
  return Guard(this, std::move(key), std::move(mutex));
}

std::size_t FileLockRegistry::active_entries() const {
  std::lock_guard<std::mutex> lock(registry_mutex_);
  return slots_.size();
}

void FileLockRegistry::release(const std::pair<std::string, std::string>& key) {
  std::lock_guard<std::mutex> lock(registry_mutex_);
  auto it = slots_.find(key);
  if (it != slots_.end() && --it->second.users == 0) {
    slots_.erase(it);
  }
}

} // namespace engine
} // namespace chunkvault
