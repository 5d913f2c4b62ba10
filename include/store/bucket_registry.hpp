#ifndef OBJSTORE_STORE_BUCKET_REGISTRY_HPP
#define OBJSTORE_STORE_BUCKET_REGISTRY_HPP

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include "store/metadata_chain.hpp"
#include "store/stripe_lock.hpp"

namespace objstore::store {

// Extension of every bucket file
constexpr const char* kBucketFileExtension = ".dat";

struct BucketEntry {
  BucketEntry(std::filesystem::path path, std::uint32_t stripe)
    : file_path(std::move(path))
    , stripe_index(stripe) {}

  const std::filesystem::path file_path;
  // Fixed at creation, never recomputed
  const std::uint32_t stripe_index;
  // Only read or mutated while the stripe lock is held
  MetadataChain objects;
  // Set under the stripe lock once the bucket file is gone and the entry is
  // waiting to be dropped from the registry
  std::atomic<bool> retired{false};
};

// Entry plus the stripe lock that guards it. Releasing the handle releases
// the stripe.
template <typename Lock>
struct BucketHandle {
  std::shared_ptr<BucketEntry> entry;
  Lock lock;
  bool created{false};
};

using ReadHandle = BucketHandle<std::shared_lock<std::shared_mutex>>;
using WriteHandle = BucketHandle<std::unique_lock<std::shared_mutex>>;

// Maps bucket identifiers to their entries.
//
// The registry lock is only held while the map itself is read or changed,
// plus the wait for the bucket's stripe lock. Locks are always taken
// registry first, then stripe, and the registry lock is dropped before the
// caller does any file I/O.
class BucketRegistry {
public:
  // Delete copy constructor and assignment operator
  BucketRegistry(const BucketRegistry&) = delete;
  BucketRegistry& operator=(const BucketRegistry&) = delete;


  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  BucketRegistry(std::filesystem::path storage_path, StripeLockManager& stripes);


  // ---- BUCKET ACCESS ----
  // Returns the bucket with its stripe held exclusively, creating an empty
  // entry when the bucket is unknown or retired. No file is created.
  WriteHandle resolve_or_create(const std::string& bucket_id);
  // Returns the bucket with its stripe held shared, or nullopt
  std::optional<ReadHandle> lookup_for_read(const std::string& bucket_id) const;
  // Returns the bucket with its stripe held exclusively, or nullopt
  std::optional<WriteHandle> lookup_for_write(const std::string& bucket_id) const;


  // ---- REGISTRATION ----
  // Builds an entry for a bucket with its file path and stripe
  std::shared_ptr<BucketEntry> make_entry(const std::string& bucket_id) const;
  // Registers a fully built entry; used while bootstrapping
  void insert(const std::string& bucket_id, std::shared_ptr<BucketEntry> entry);
  // Drops the bucket only if it still maps to the given entry
  bool remove(const std::string& bucket_id, const std::shared_ptr<BucketEntry>& expected);


  // ---- QUERY OPERATIONS ----
  bool contains(const std::string& bucket_id) const;
  std::size_t size() const;
  std::filesystem::path file_path_for(const std::string& bucket_id) const;

private:
  // ---- PARAMETERS ----
  const std::filesystem::path storage_path_;
  StripeLockManager& stripes_;

  // Buckets map and access mutex
  std::map<std::string, std::shared_ptr<BucketEntry>> buckets_;
  mutable std::shared_mutex mutex_;


  std::shared_ptr<BucketEntry> find_live(const std::string& bucket_id) const;
};

} // namespace objstore::store

#endif // OBJSTORE_STORE_BUCKET_REGISTRY_HPP
