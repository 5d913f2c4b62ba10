#ifndef OBJSTORE_STORE_MEMORY_STORE_HPP
#define OBJSTORE_STORE_MEMORY_STORE_HPP

#include <cstddef>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>

namespace objstore::store {

// Volatile object store keeping every payload in a nested map guarded by a
// single reader/writer lock
class MemoryStore {
public:
  MemoryStore() = default;
  MemoryStore(const MemoryStore&) = delete;
  MemoryStore& operator=(const MemoryStore&) = delete;


  // ---- CORE STORAGE OPERATIONS ----
  bool store(const std::string& payload, const std::string& object_id, const std::string& bucket_id);
  std::optional<std::string> retrieve(const std::string& object_id, const std::string& bucket_id);
  bool remove(const std::string& object_id, const std::string& bucket_id);


  // ---- QUERY OPERATIONS ----
  bool has_bucket(const std::string& bucket_id) const;
  std::size_t bucket_count() const;

private:
  using Bucket = std::unordered_map<std::string, std::string>;

  mutable std::shared_mutex mutex_;
  std::unordered_map<std::string, Bucket> buckets_;
};

} // namespace objstore::store

#endif // OBJSTORE_STORE_MEMORY_STORE_HPP
