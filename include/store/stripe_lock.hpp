#ifndef OBJSTORE_STORE_STRIPE_LOCK_HPP
#define OBJSTORE_STORE_STRIPE_LOCK_HPP

#include <cstdint>
#include <memory>
#include <shared_mutex>
#include <string>

namespace objstore::store {

// Fixed array of reader/writer locks shared by every bucket.
//
// A bucket is bound to one stripe by hashing its identifier. More stripes
// let more unrelated buckets proceed in parallel, at the cost of lock memory
// and of more bucket files open at once; fewer stripes bound both but make
// unrelated buckets that hash to the same stripe wait for each other.
class StripeLockManager {
public:
  // Delete copy constructor and assignment operator
  StripeLockManager(const StripeLockManager&) = delete;
  StripeLockManager& operator=(const StripeLockManager&) = delete;

  
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit StripeLockManager(std::uint32_t stripe_count);


  // ---- STRIPE RESOLUTION ----
  // Stable 32-bit hash of a bucket identifier (first four bytes of its SHA-256)
  static std::uint32_t hash(const std::string& bucket_id);
  // Stripe index for a bucket identifier
  std::uint32_t stripe_for(const std::string& bucket_id) const;
  // Lock guarding the given stripe
  std::shared_mutex& lock_for(std::uint32_t stripe_index);

  std::uint32_t size() const { return stripe_count_; }

private:
  // ---- PARAMETERS ----
  const std::uint32_t stripe_count_;
  std::unique_ptr<std::shared_mutex[]> locks_;
};

} // namespace objstore::store

#endif // OBJSTORE_STORE_STRIPE_LOCK_HPP
