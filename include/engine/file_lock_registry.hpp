#ifndef CHUNKVAULT_ENGINE_FILE_LOCK_REGISTRY_HPP
#define CHUNKVAULT_ENGINE_FILE_LOCK_REGISTRY_HPP

#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <utility>

namespace chunkvault {
namespace engine {

// Hands out one mutex per (owner, file id). Entries live only while someone holds or waits on them.
class FileLockRegistry {
public:
  // Holds the per-file mutex until destroyed
  class Guard {
  public:
    Guard(Guard&& other) noexcept;
    Guard& operator=(Guard&&) = delete;
    Guard(const Guard&) = delete;
    Guard& operator=(const Guard&) = delete;
    ~Guard();

  private:
    friend class FileLockRegistry;

    Guard(FileLockRegistry* registry, std::pair<std::string, std::string> key,
          std::shared_ptr<std::mutex> mutex);

    FileLockRegistry* registry_;
    std::pair<std::string, std::string> key_;
    std::shared_ptr<std::mutex> mutex_;
  };

  // Blocks until the file's mutex is acquired
  Guard lock(const std::string& owner, const std::string& file_id);

  // Number of files currently locked or waited on
  std::size_t active_entries() const;

private:
  struct Slot {
    std::shared_ptr<std::mutex> mutex;
    std::size_t users = 0;
  };

  mutable std::mutex registry_mutex_;
  std::map<std::pair<std::string, std::string>, Slot> slots_;

  void release(const std::pair<std::string, std::string>& key);
};

} // namespace engine
} // namespace chunkvault

#endif // CHUNKVAULT_ENGINE_FILE_LOCK_REGISTRY_HPP
