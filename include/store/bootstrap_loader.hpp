#ifndef OBJSTORE_STORE_BOOTSTRAP_LOADER_HPP
#define OBJSTORE_STORE_BOOTSTRAP_LOADER_HPP

#include <cstddef>
#include <filesystem>
#include <string>
#include "logger/logger.hpp"
#include "store/bucket_registry.hpp"
#include "store/metadata_chain.hpp"

namespace objstore::store {

// Rebuilds the registry and every metadata chain from the bucket files
// found in the storage directory. Runs once, before any request is served.
class BootstrapLoader {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  BootstrapLoader(std::filesystem::path storage_path, BucketRegistry& registry,
                  logging::Logger& logger);


  // ---- LOADING ----
  // Loads every bucket file and returns the number of buckets registered.
  // Throws FormatError on a malformed bucket file and IOError when one
  // cannot be read.
  std::size_t load();

  // Parses one bucket file into a chain in physical record order
  static MetadataChain parse_bucket_file(const std::filesystem::path& file_path);

private:
  // ---- PARAMETERS ----
  const std::filesystem::path storage_path_;
  BucketRegistry& registry_;
  logging::Logger& logger_;


  // Removes temporary files left behind by rewrites that never committed
  std::size_t remove_stray_temp_files();
  // Registers one bucket file, returns false when it held no records
  bool load_bucket_file(const std::filesystem::path& file_path);
};

} // namespace objstore::store

#endif // OBJSTORE_STORE_BOOTSTRAP_LOADER_HPP
