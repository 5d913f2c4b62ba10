#ifndef OBJSTORE_STORE_OBJECT_STORE_HPP
#define OBJSTORE_STORE_OBJECT_STORE_HPP

#include <optional>
#include <string>
#include <utility>
#include <variant>
#include "store/file_store.hpp"
#include "store/memory_store.hpp"

namespace objstore::store {

// Storage capability used by the request layer. The backend is picked once,
// at construction, and every call is dispatched to it.
//
// Identifiers must match [a-z0-9_-]+; anything else is rejected with
// InvalidIdentifierError before the backend is touched.
class ObjectStore {
public:
  using Backend = std::variant<MemoryStore, FileStore>;

  template <typename T, typename... Args>
  explicit ObjectStore(std::in_place_type_t<T> backend, Args&&... args)
    : backend_(backend, std::forward<Args>(args)...) {}

  ObjectStore(const ObjectStore&) = delete;
  ObjectStore& operator=(const ObjectStore&) = delete;


  // ---- CORE STORAGE OPERATIONS ----
  // Returns true when an existing object was replaced
  bool store(const std::string& payload, const std::string& object_id, const std::string& bucket_id) {
    return std::visit([&](auto& backend) { return backend.store(payload, object_id, bucket_id); }, backend_);
  }
  // Returns nullopt when the object was not found
  std::optional<std::string> retrieve(const std::string& object_id, const std::string& bucket_id) {
    return std::visit([&](auto& backend) { return backend.retrieve(object_id, bucket_id); }, backend_);
  }
  // Returns true when the object existed and was deleted
  bool remove(const std::string& object_id, const std::string& bucket_id) {
    return std::visit([&](auto& backend) { return backend.remove(object_id, bucket_id); }, backend_);
  }


  // ---- GETTERS ----
  bool is_persistent() const { return std::holds_alternative<FileStore>(backend_); }
  const char* backend_name() const { return is_persistent() ? "file" : "memory"; }
  FileStore* file_store() { return std::get_if<FileStore>(&backend_); }
  MemoryStore* memory_store() { return std::get_if<MemoryStore>(&backend_); }

private:
  Backend backend_;
};

} // namespace objstore::store

#endif // OBJSTORE_STORE_OBJECT_STORE_HPP
