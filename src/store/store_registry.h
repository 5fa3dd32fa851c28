#pragma once

/// @file store_registry.h
/// @brief Shared access to per-folder fingerprint stores.

#include <map>
#include <memory>
#include <mutex>
#include <string>

#include "store/fingerprint_store.h"

namespace bandprint {

/// @brief Hands out one FingerprintStore per folder while it is in use.
/// @details Stores are keyed by normalize_folder() and held weakly: as long as
///          any caller (typically a running generation batch) keeps a store,
///          every open() of that folder returns the same instance, so flag and
///          exclusion changes land in the copy the batch will save. A folder
///          nobody holds is reloaded from disk on the next open().
class StoreRegistry {
 public:
  StoreRegistry() = default;

  StoreRegistry(const StoreRegistry&) = delete;
  StoreRegistry& operator=(const StoreRegistry&) = delete;

  /// @brief Returns the live store for a folder, loading it if none is held.
  std::shared_ptr<FingerprintStore> open(const std::string& folder);

  /// @brief Number of folders currently held by some caller.
  size_t live_count() const;

 private:
  mutable std::mutex mutex_;
  std::map<std::string, std::weak_ptr<FingerprintStore>> stores_;
};

}  // namespace bandprint
