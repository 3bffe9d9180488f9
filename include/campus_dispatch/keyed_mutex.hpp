// === Keyed Mutex =============================================================
//
// Hands out one exclusive lock per key (beacon id, incident id) so contention
// stays scoped to the resource being decided on.

#pragma once

#include <mutex>
#include <unordered_map>

namespace campus_dispatch {

/** @brief Lazily-created mutex per key; entries live as long as the table. */
template <typename Key>
class KeyedMutex final {
  public:
    /** @brief Block until the lock for @p key is held by the caller. */
    [[nodiscard]] std::unique_lock<std::mutex> lock(const Key& key) {
        std::mutex* key_mutex = nullptr;
        {
            std::scoped_lock table_lock(table_mutex_);
            key_mutex = &map_key_mutexes_[key];
        }
        return std::unique_lock<std::mutex>(*key_mutex);
    }

  private:
    std::mutex table_mutex_;
    std::unordered_map<Key, std::mutex> map_key_mutexes_;
};

}  // namespace campus_dispatch
