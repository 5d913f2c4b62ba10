#include "store/stripe_lock.hpp"
#include "store/store_error.hpp"
#include <boost/endian/conversion.hpp>
#include <openssl/evp.h>
#include <cstring>
#include <stdexcept>

namespace objstore::store {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

StripeLockManager::StripeLockManager(std::uint32_t stripe_count)
  : stripe_count_(stripe_count) {
  if (stripe_count_ == 0) {
    throw std::invalid_argument("StripeLockManager: stripe count must be positive");
  }
  locks_ = std::make_unique<std::shared_mutex[]>(stripe_count_);
}


//==============================================
// STRIPE RESOLUTION
//==============================================

std::uint32_t StripeLockManager::hash(const std::string& bucket_id) {
  unsigned char digest[EVP_MAX_MD_SIZE];
  unsigned int digest_len = 0;

  // Create a new message digest context for the hashing operation
  EVP_MD_CTX* ctx = EVP_MD_CTX_new();
  if (!ctx) {
    throw StoreError("StripeLockManager: Failed to create hash context");
  }

  if (!EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr)) {
    EVP_MD_CTX_free(ctx);
    throw StoreError("StripeLockManager: Failed to initialize hash context");
  }

  if (!EVP_DigestUpdate(ctx, bucket_id.data(), bucket_id.size())) {
    EVP_MD_CTX_free(ctx);
    throw StoreError("StripeLockManager: Failed to update hash");
  }

  if (!EVP_DigestFinal_ex(ctx, digest, &digest_len)) {
    EVP_MD_CTX_free(ctx);
    throw StoreError("StripeLockManager: Failed to finalize hash");
  }

  EVP_MD_CTX_free(ctx);

  // Leading four digest bytes read as a big-endian integer
  std::uint32_t prefix = 0;
  std::memcpy(&prefix, digest, sizeof(prefix));
  return boost::endian::big_to_native(prefix);
}

std::uint32_t StripeLockManager::stripe_for(const std::string& bucket_id) const {
  return hash(bucket_id) % stripe_count_;
}

std::shared_mutex& StripeLockManager::lock_for(std::uint32_t stripe_index) {
  if (stripe_index >= stripe_count_) {
    throw std::out_of_range("StripeLockManager: stripe index " + std::to_string(stripe_index) +
                            " out of range");
  }
  return locks_[stripe_index];
}

} // namespace objstore::store
