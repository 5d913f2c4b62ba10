#include "store/file_store.hpp"
#include "store/bootstrap_loader.hpp"
#include "store/log_rewriter.hpp"
#include "store/record_codec.hpp"
#include "store/store_error.hpp"
#include <fstream>
#include <system_error>

namespace objstore::store {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

FileStore::FileStore(const std::string& storage_path, logging::Logger& logger, std::uint32_t stripe_count)
  : storage_path_(std::filesystem::path(storage_path).lexically_normal())
  , logger_(logger) {
  OBJSTORE_LOG_INFO(logger_) << "File store: Initializing with storage path " << storage_path_.string()
                             << " and " << stripe_count << " lock stripes";

  check_storage_path();

  stripes_ = std::make_unique<StripeLockManager>(stripe_count);
  registry_ = std::make_unique<BucketRegistry>(storage_path_, *stripes_);

  BootstrapLoader loader(storage_path_, *registry_, logger_);
  loader.load();

  OBJSTORE_LOG_INFO(logger_) << "File store: Ready with " << registry_->size() << " buckets";
}

void FileStore::check_storage_path() const {
  std::error_code ec;
  const auto status = std::filesystem::status(storage_path_, ec);
  if (ec || !std::filesystem::exists(status)) {
    OBJSTORE_LOG_ERROR(logger_) << "File store: Storage folder does not exist: " << storage_path_.string();
    throw ConfigurationError("store folder " + storage_path_.string() + " does not exist");
  }
  if (!std::filesystem::is_directory(status)) {
    OBJSTORE_LOG_ERROR(logger_) << "File store: Storage path is not a directory: " << storage_path_.string();
    throw ConfigurationError("store path " + storage_path_.string() + " is not a directory");
  }

  std::filesystem::directory_iterator probe(storage_path_, ec);
  if (ec) {
    OBJSTORE_LOG_ERROR(logger_) << "File store: Cannot access storage folder: " << ec.message();
    throw ConfigurationError("cannot access store folder " + storage_path_.string() + ": " + ec.message());
  }
}


//==============================================
// CORE STORAGE OPERATIONS
//==============================================

bool FileStore::store(const std::string& payload, const std::string& object_id, const std::string& bucket_id) {
  RecordCodec::validate_identifier(object_id, "object id");
  RecordCodec::validate_identifier(bucket_id, "bucket id");

  OBJSTORE_LOG_DEBUG(logger_) << "File store: Storing " << payload.size() << " bytes as "
                              << bucket_id << "/" << object_id;

  for (;;) {
    WriteHandle handle = registry_->resolve_or_create(bucket_id);
    BucketEntry& bucket = *handle.entry;
    if (bucket.retired) {
      // Emptied by a concurrent delete after we resolved it, resolve again
      continue;
    }
    if (handle.created) {
      OBJSTORE_LOG_INFO(logger_) << "File store: Created bucket " << bucket_id
                                 << " on stripe " << bucket.stripe_index;
    }

    MetadataChain& chain = bucket.objects;
    const ObjectEntry* existing = chain.find(object_id);
    const bool replaced = existing != nullptr;

    std::uint64_t header_size = 0;
    try {
      header_size = rewrite_with(bucket, bucket_id, object_id, payload);
    }
    catch (const std::exception& e) {
      OBJSTORE_LOG_ERROR(logger_) << "File store: Failed to store " << bucket_id << "/" << object_id
                                  << ": " << e.what();
      if (chain.empty()) {
        retire(handle, bucket_id);
      }
      throw;
    }

    // Rename committed, bring the index in line with the file
    if (replaced) {
      chain.resize(object_id, header_size, payload.size());
    } else {
      chain.append(object_id, header_size, payload.size());
    }

    OBJSTORE_LOG_DEBUG(logger_) << "File store: " << (replaced ? "Replaced " : "Created ")
                                << bucket_id << "/" << object_id;
    return replaced;
  }
}

std::optional<std::string> FileStore::retrieve(const std::string& object_id, const std::string& bucket_id) {
  RecordCodec::validate_identifier(object_id, "object id");
  RecordCodec::validate_identifier(bucket_id, "bucket id");

  auto handle = registry_->lookup_for_read(bucket_id);
  if (!handle) {
    OBJSTORE_LOG_DEBUG(logger_) << "File store: Bucket " << bucket_id << " not found";
    return std::nullopt;
  }

  const ObjectEntry* entry = handle->entry->objects.find(object_id);
  if (!entry) {
    OBJSTORE_LOG_DEBUG(logger_) << "File store: Object " << bucket_id << "/" << object_id << " not found";
    return std::nullopt;
  }

  const auto& file_path = handle->entry->file_path;
  std::ifstream file(file_path, std::ios::binary);
  if (!file) {
    OBJSTORE_LOG_ERROR(logger_) << "File store: Failed to open bucket file " << file_path.string();
    throw IOError("failed to open bucket file " + file_path.string());
  }

  // Skip identifier, length field and separator
  file.seekg(static_cast<std::streamoff>(entry->offset + entry->header_size + 1), std::ios::beg);

  std::string payload(entry->payload_size, '\0');
  file.read(payload.data(), static_cast<std::streamsize>(payload.size()));
  if (static_cast<std::uint64_t>(file.gcount()) != entry->payload_size) {
    OBJSTORE_LOG_ERROR(logger_) << "File store: Short read for " << bucket_id << "/" << object_id;
    throw IOError("error reading object " + object_id + " from bucket file " + file_path.string());
  }

  OBJSTORE_LOG_DEBUG(logger_) << "File store: Retrieved " << payload.size() << " bytes for "
                              << bucket_id << "/" << object_id;
  return payload;
}

bool FileStore::remove(const std::string& object_id, const std::string& bucket_id) {
  RecordCodec::validate_identifier(object_id, "object id");
  RecordCodec::validate_identifier(bucket_id, "bucket id");

  auto handle = registry_->lookup_for_write(bucket_id);
  if (!handle || handle->entry->retired) {
    return false;
  }

  BucketEntry& bucket = *handle->entry;
  const ObjectEntry* existing = bucket.objects.find(object_id);
  if (!existing) {
    return false;
  }

  if (bucket.objects.size() == 1) {
    // Last object, the whole bucket goes away
    std::error_code ec;
    std::filesystem::remove(bucket.file_path, ec);
    if (ec) {
      OBJSTORE_LOG_ERROR(logger_) << "File store: Failed to remove bucket file " << bucket.file_path.string()
                                  << ": " << ec.message();
      throw IOError("failed to remove bucket file " + bucket.file_path.string() + ": " + ec.message());
    }
    bucket.objects.clear();
    retire(*handle, bucket_id);
    OBJSTORE_LOG_DEBUG(logger_) << "File store: Removed bucket " << bucket_id << " with its last object";
    return true;
  }

  try {
    rewrite_without(bucket, bucket_id, *existing);
  }
  catch (const std::exception& e) {
    OBJSTORE_LOG_ERROR(logger_) << "File store: Failed to delete " << bucket_id << "/" << object_id
                                << ": " << e.what();
    throw;
  }

  bucket.objects.unlink(object_id);
  OBJSTORE_LOG_DEBUG(logger_) << "File store: Deleted " << bucket_id << "/" << object_id;
  return true;
}


//==============================================
// QUERY OPERATIONS
//==============================================

std::vector<ObjectLayout> FileStore::layout(const std::string& bucket_id) const {
  auto handle = registry_->lookup_for_read(bucket_id);
  if (!handle) {
    return {};
  }
  return handle->entry->objects.layout();
}

bool FileStore::has_bucket(const std::string& bucket_id) const {
  return registry_->contains(bucket_id);
}

std::size_t FileStore::bucket_count() const {
  return registry_->size();
}

std::uint32_t FileStore::stripe_of(const std::string& bucket_id) const {
  return stripes_->stripe_for(bucket_id);
}


//==============================================
// LOG REWRITE SUPPORT
//==============================================

std::uint64_t FileStore::rewrite_with(const BucketEntry& bucket, const std::string& bucket_id,
                                      const std::string& object_id, const std::string& payload) {
  LogRewriter rewriter(bucket.file_path, bucket_id);
  std::uint64_t header_size = 0;

  const ObjectEntry* existing = bucket.objects.find(object_id);
  if (!existing) {
    // New object goes after everything already on disk
    if (!bucket.objects.empty()) {
      rewriter.copy_all();
    }
    header_size = rewriter.append_record(object_id, payload);
  } else {
    // Replaced object keeps its physical slot
    rewriter.copy_prefix(existing->offset);
    header_size = rewriter.append_record(object_id, payload);
    rewriter.copy_from(existing->offset +
                       RecordCodec::encoded_size(existing->header_size, existing->payload_size));
  }

  std::uint64_t expected = bucket.objects.end_offset() + RecordCodec::encoded_size(header_size, payload.size());
  if (existing) {
    expected -= RecordCodec::encoded_size(existing->header_size, existing->payload_size);
  }
  check_rewrite_size(rewriter, bucket, expected);
  rewriter.commit();
  return header_size;
}

void FileStore::rewrite_without(const BucketEntry& bucket, const std::string& bucket_id,
                                const ObjectEntry& removed) {
  LogRewriter rewriter(bucket.file_path, bucket_id);
  rewriter.copy_prefix(removed.offset);
  rewriter.copy_from(removed.offset + RecordCodec::encoded_size(removed.header_size, removed.payload_size));
  check_rewrite_size(rewriter, bucket,
                     bucket.objects.end_offset() -
                     RecordCodec::encoded_size(removed.header_size, removed.payload_size));
  rewriter.commit();
}

void FileStore::check_rewrite_size(const LogRewriter& rewriter, const BucketEntry& bucket,
                                   std::uint64_t expected) const {
  if (rewriter.bytes_written() != expected) {
    OBJSTORE_LOG_ERROR(logger_) << "File store: Bucket file " << bucket.file_path.string()
                                << " does not match its index, rewrite produced "
                                << rewriter.bytes_written() << " bytes instead of " << expected;
    throw IOError("bucket file " + bucket.file_path.string() + " changed outside the store");
  }
}

void FileStore::retire(WriteHandle& handle, const std::string& bucket_id) {
  auto entry = handle.entry;
  entry->retired = true;

  // Stripe first, registry second: never wait on the registry while holding a stripe
  handle.lock.unlock();
  registry_->remove(bucket_id, entry);
}

} // namespace objstore::store
