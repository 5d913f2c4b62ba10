#include "store/bootstrap_loader.hpp"
#include "store/log_rewriter.hpp"
#include "store/record_codec.hpp"
#include "store/store_error.hpp"
#include <fstream>
#include <system_error>
#include <vector>

namespace objstore::store {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

BootstrapLoader::BootstrapLoader(std::filesystem::path storage_path, BucketRegistry& registry,
                                 logging::Logger& logger)
  : storage_path_(std::move(storage_path))
  , registry_(registry)
  , logger_(logger) {}


//==============================================
// LOADING
//==============================================

std::size_t BootstrapLoader::load() {
  OBJSTORE_LOG_INFO(logger_) << "Bootstrap loader: Scanning storage directory " << storage_path_.string();

  const std::size_t removed = remove_stray_temp_files();
  if (removed > 0) {
    OBJSTORE_LOG_WARN(logger_) << "Bootstrap loader: Removed " << removed << " stray temporary files";
  }

  // Collect first, loading may delete empty files
  std::vector<std::filesystem::path> bucket_files;
  std::error_code ec;
  for (std::filesystem::directory_iterator it(storage_path_, ec), end; !ec && it != end; it.increment(ec)) {
    if (it->is_regular_file() && it->path().extension() == kBucketFileExtension) {
      bucket_files.push_back(it->path());
    }
  }
  if (ec) {
    throw IOError("failed to list storage directory " + storage_path_.string() + ": " + ec.message());
  }

  std::size_t loaded = 0;
  for (const auto& file_path : bucket_files) {
    if (load_bucket_file(file_path)) {
      ++loaded;
    }
  }

  OBJSTORE_LOG_INFO(logger_) << "Bootstrap loader: Loaded " << loaded << " buckets";
  return loaded;
}

MetadataChain BootstrapLoader::parse_bucket_file(const std::filesystem::path& file_path) {
  std::ifstream input(file_path, std::ios::binary);
  if (!input) {
    throw IOError("failed to open bucket file " + file_path.string());
  }

  MetadataChain chain;
  std::uint64_t offset = 0;
  try {
    while (auto header = RecordCodec::decode_header(input)) {
      if (chain.contains(header->object_id)) {
        throw FormatError("duplicate object " + header->object_id);
      }
      RecordCodec::skip_payload(input, *header);
      chain.append(header->object_id, header->header_size, header->payload_size);
      offset += RecordCodec::encoded_size(header->header_size, header->payload_size);
    }
  }
  catch (const FormatError& e) {
    throw FormatError(file_path.string() + " at offset " + std::to_string(offset) + ": " + e.detail());
  }

  if (input.bad()) {
    throw IOError("failed to read bucket file " + file_path.string());
  }
  return chain;
}


//==============================================
// LOADING SUPPORT
//==============================================

std::size_t BootstrapLoader::remove_stray_temp_files() {
  std::vector<std::filesystem::path> stray;
  std::error_code ec;
  for (std::filesystem::directory_iterator it(storage_path_, ec), end; !ec && it != end; it.increment(ec)) {
    if (it->is_regular_file() && LogRewriter::is_temp_file_name(it->path().filename().string())) {
      stray.push_back(it->path());
    }
  }
  if (ec) {
    throw IOError("failed to list storage directory " + storage_path_.string() + ": " + ec.message());
  }

  std::size_t removed = 0;
  for (const auto& path : stray) {
    OBJSTORE_LOG_WARN(logger_) << "Bootstrap loader: Removing stray temporary file " << path.filename().string();
    if (std::filesystem::remove(path, ec)) {
      ++removed;
    } else if (ec) {
      OBJSTORE_LOG_ERROR(logger_) << "Bootstrap loader: Failed to remove " << path.string() << ": " << ec.message();
    }
  }
  return removed;
}

bool BootstrapLoader::load_bucket_file(const std::filesystem::path& file_path) {
  const std::string bucket_id = file_path.stem().string();
  if (!RecordCodec::is_valid_identifier(bucket_id)) {
    OBJSTORE_LOG_WARN(logger_) << "Bootstrap loader: Ignoring file with invalid bucket name "
                               << file_path.filename().string();
    return false;
  }

  MetadataChain chain;
  try {
    chain = parse_bucket_file(file_path);
  }
  catch (const StoreError& e) {
    OBJSTORE_LOG_FATAL(logger_) << "Bootstrap loader: Cannot load bucket " << bucket_id << ": " << e.what();
    throw;
  }

  if (chain.empty()) {
    // Orphan left by a bucket whose records never made it to disk
    OBJSTORE_LOG_INFO(logger_) << "Bootstrap loader: Removing empty bucket file " << file_path.filename().string();
    std::error_code ec;
    if (!std::filesystem::remove(file_path, ec) && ec) {
      throw IOError("failed to remove empty bucket file " + file_path.string() + ": " + ec.message());
    }
    return false;
  }

  auto entry = registry_.make_entry(bucket_id);
  entry->objects = std::move(chain);
  OBJSTORE_LOG_INFO(logger_) << "Bootstrap loader: Bucket " << bucket_id << " holds "
                             << entry->objects.size() << " objects in "
                             << entry->objects.end_offset() << " bytes, stripe " << entry->stripe_index;
  registry_.insert(bucket_id, std::move(entry));
  return true;
}

} // namespace objstore::store
