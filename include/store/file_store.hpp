#ifndef OBJSTORE_STORE_FILE_STORE_HPP
#define OBJSTORE_STORE_FILE_STORE_HPP

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "logger/logger.hpp"
#include "store/bucket_registry.hpp"
#include "store/log_rewriter.hpp"
#include "store/metadata_chain.hpp"
#include "store/stripe_lock.hpp"

namespace objstore::store {

// File-backed object store.
//
// Each bucket is one file <bucket>.dat holding its records back to back.
// Every mutation writes the next version of the file to a temporary file,
// renames it over the bucket file and only then updates the in-memory
// metadata, so a failed operation leaves both untouched.
class FileStore {
public:
  static constexpr std::uint32_t kDefaultStripeCount = 100;

  // Delete copy constructor and assignment operator
  FileStore(const FileStore&) = delete;
  FileStore& operator=(const FileStore&) = delete;


  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  // Loads every bucket found in storage_path. Throws ConfigurationError when
  // the directory is unusable, FormatError or IOError when a bucket file
  // cannot be loaded.
  FileStore(const std::string& storage_path, logging::Logger& logger,
            std::uint32_t stripe_count = kDefaultStripeCount);


  // ---- CORE STORAGE OPERATIONS ----
  // Creates or replaces an object, returns true when it replaced one
  bool store(const std::string& payload, const std::string& object_id, const std::string& bucket_id);
  // Returns the object payload, or nullopt when the bucket or object is unknown
  std::optional<std::string> retrieve(const std::string& object_id, const std::string& bucket_id);
  // Deletes an object, returns false when there was nothing to delete
  bool remove(const std::string& object_id, const std::string& bucket_id);


  // ---- QUERY OPERATIONS ----
  // Records of a bucket in physical order, empty for an unknown bucket
  std::vector<ObjectLayout> layout(const std::string& bucket_id) const;
  bool has_bucket(const std::string& bucket_id) const;
  std::size_t bucket_count() const;
  std::uint32_t stripe_of(const std::string& bucket_id) const;
  const std::filesystem::path& storage_path() const { return storage_path_; }

private:
  // ---- PARAMETERS ----
  std::filesystem::path storage_path_;
  logging::Logger& logger_;

  // System components
  std::unique_ptr<StripeLockManager> stripes_;
  std::unique_ptr<BucketRegistry> registry_;


  // ---- INITIALIZATION ----
  void check_storage_path() const;


  // ---- LOG REWRITE SUPPORT ----
  // Writes the object into a rewritten copy of the bucket file and commits it.
  // Returns the header size of the new record.
  std::uint64_t rewrite_with(const BucketEntry& bucket, const std::string& bucket_id,
                             const std::string& object_id, const std::string& payload);
  // Commits a copy of the bucket file without the given record
  void rewrite_without(const BucketEntry& bucket, const std::string& bucket_id,
                       const ObjectEntry& removed);
  // Throws IOError when a rewrite did not produce the size the index predicts
  void check_rewrite_size(const LogRewriter& rewriter, const BucketEntry& bucket,
                          std::uint64_t expected) const;
  // Drops an entry whose index is empty: flags it under the stripe lock,
  // releases the stripe, then removes it from the registry
  void retire(WriteHandle& handle, const std::string& bucket_id);
};

} // namespace objstore::store

#endif // OBJSTORE_STORE_FILE_STORE_HPP
