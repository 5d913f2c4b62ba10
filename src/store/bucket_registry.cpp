#include "store/bucket_registry.hpp"

namespace objstore::store {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

BucketRegistry::BucketRegistry(std::filesystem::path storage_path, StripeLockManager& stripes)
  : storage_path_(std::move(storage_path))
  , stripes_(stripes) {}


//==============================================
// BUCKET ACCESS
//==============================================

WriteHandle BucketRegistry::resolve_or_create(const std::string& bucket_id) {
  std::unique_lock<std::shared_mutex> registry_lock(mutex_);

  WriteHandle handle;
  auto it = buckets_.find(bucket_id);
  if (it == buckets_.end() || it->second->retired) {
    handle.entry = make_entry(bucket_id);
    buckets_[bucket_id] = handle.entry;
    handle.created = true;
  } else {
    handle.entry = it->second;
  }

  handle.lock = std::unique_lock<std::shared_mutex>(stripes_.lock_for(handle.entry->stripe_index));
  return handle;
}

std::optional<ReadHandle> BucketRegistry::lookup_for_read(const std::string& bucket_id) const {
  std::shared_lock<std::shared_mutex> registry_lock(mutex_);

  auto entry = find_live(bucket_id);
  if (!entry) {
    return std::nullopt;
  }
  ReadHandle handle;
  handle.lock = std::shared_lock<std::shared_mutex>(stripes_.lock_for(entry->stripe_index));
  handle.entry = std::move(entry);
  return handle;
}

std::optional<WriteHandle> BucketRegistry::lookup_for_write(const std::string& bucket_id) const {
  std::shared_lock<std::shared_mutex> registry_lock(mutex_);

  auto entry = find_live(bucket_id);
  if (!entry) {
    return std::nullopt;
  }
  WriteHandle handle;
  handle.lock = std::unique_lock<std::shared_mutex>(stripes_.lock_for(entry->stripe_index));
  handle.entry = std::move(entry);
  return handle;
}


//==============================================
// REGISTRATION
//==============================================

std::shared_ptr<BucketEntry> BucketRegistry::make_entry(const std::string& bucket_id) const {
  return std::make_shared<BucketEntry>(file_path_for(bucket_id), stripes_.stripe_for(bucket_id));
}

void BucketRegistry::insert(const std::string& bucket_id, std::shared_ptr<BucketEntry> entry) {
  std::unique_lock<std::shared_mutex> registry_lock(mutex_);
  buckets_[bucket_id] = std::move(entry);
}

bool BucketRegistry::remove(const std::string& bucket_id, const std::shared_ptr<BucketEntry>& expected) {
  std::unique_lock<std::shared_mutex> registry_lock(mutex_);

  auto it = buckets_.find(bucket_id);
  if (it == buckets_.end() || it->second != expected) {
    return false;
  }
  buckets_.erase(it);
  return true;
}


//==============================================
// QUERY OPERATIONS
//==============================================

bool BucketRegistry::contains(const std::string& bucket_id) const {
  std::shared_lock<std::shared_mutex> registry_lock(mutex_);
  return find_live(bucket_id) != nullptr;
}

std::size_t BucketRegistry::size() const {
  std::shared_lock<std::shared_mutex> registry_lock(mutex_);
  std::size_t live = 0;
  for (const auto& [bucket_id, entry] : buckets_) {
    if (!entry->retired) {
      ++live;
    }
  }
  return live;
}

std::filesystem::path BucketRegistry::file_path_for(const std::string& bucket_id) const {
  return storage_path_ / (bucket_id + kBucketFileExtension);
}

std::shared_ptr<BucketEntry> BucketRegistry::find_live(const std::string& bucket_id) const {
  auto it = buckets_.find(bucket_id);
  if (it == buckets_.end() || it->second->retired) {
    return nullptr;
  }
  return it->second;
}

} // namespace objstore::store
