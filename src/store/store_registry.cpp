#include "store/store_registry.h"

namespace bandprint {

std::shared_ptr<FingerprintStore> StoreRegistry::open(const std::string& folder) {
  const std::string key = normalize_folder(folder);
  std::lock_guard<std::mutex> lock(mutex_);

  auto it = stores_.find(key);
  if (it != stores_.end()) {
    if (std::shared_ptr<FingerprintStore> live = it->second.lock()) {
      return live;
    }
  }

  // Drop entries whose stores have been released
  for (auto e = stores_.begin(); e != stores_.end();) {
    e = e->second.expired() ? stores_.erase(e) : std::next(e);
  }

  std::shared_ptr<FingerprintStore> store = FingerprintStore::open(key);
  stores_[key] = store;
  return store;
}

size_t StoreRegistry::live_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  size_t count = 0;
  for (const auto& [folder, store] : stores_) {
    if (!store.expired()) ++count;
  }
  return count;
}

}  // namespace bandprint
