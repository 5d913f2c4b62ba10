#include "store/memory_store.hpp"
#include "store/record_codec.hpp"
#include <mutex>

namespace objstore::store {

bool MemoryStore::store(const std::string& payload, const std::string& object_id, const std::string& bucket_id) {
  RecordCodec::validate_identifier(object_id, "object id");
  RecordCodec::validate_identifier(bucket_id, "bucket id");

  std::unique_lock<std::shared_mutex> lock(mutex_);
  Bucket& bucket = buckets_[bucket_id];
  auto [it, inserted] = bucket.insert_or_assign(object_id, payload);
  return !inserted;
}

std::optional<std::string> MemoryStore::retrieve(const std::string& object_id, const std::string& bucket_id) {
  RecordCodec::validate_identifier(object_id, "object id");
  RecordCodec::validate_identifier(bucket_id, "bucket id");

  std::shared_lock<std::shared_mutex> lock(mutex_);
  auto bucket = buckets_.find(bucket_id);
  if (bucket == buckets_.end()) {
    return std::nullopt;
  }
  auto object = bucket->second.find(object_id);
  if (object == bucket->second.end()) {
    return std::nullopt;
  }
  return object->second;
}

bool MemoryStore::remove(const std::string& object_id, const std::string& bucket_id) {
  RecordCodec::validate_identifier(object_id, "object id");
  RecordCodec::validate_identifier(bucket_id, "bucket id");

  std::unique_lock<std::shared_mutex> lock(mutex_);
  auto bucket = buckets_.find(bucket_id);
  if (bucket == buckets_.end()) {
    return false;
  }
  if (bucket->second.erase(object_id) == 0) {
    return false;
  }
  // Emptied buckets are dropped
  if (bucket->second.empty()) {
    buckets_.erase(bucket);
  }
  return true;
}

bool MemoryStore::has_bucket(const std::string& bucket_id) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return buckets_.count(bucket_id) > 0;
}

std::size_t MemoryStore::bucket_count() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return buckets_.size();
}

} // namespace objstore::store
