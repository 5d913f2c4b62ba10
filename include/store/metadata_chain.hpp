#ifndef OBJSTORE_STORE_METADATA_CHAIN_HPP
#define OBJSTORE_STORE_METADATA_CHAIN_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace objstore::store {

// Location of one record inside its bucket file
struct ObjectEntry {
  std::uint64_t offset{0};        // byte offset of the identifier field
  std::uint64_t header_size{0};   // "<id> <length>" without the trailing separator
  std::uint64_t payload_size{0};
  std::optional<std::size_t> prev;  // slot of the physically preceding record
  std::optional<std::size_t> next;  // slot of the physically following record
};

// Flattened view of an entry, as reported to callers
struct ObjectLayout {
  std::string object_id;
  std::uint64_t offset{0};
  std::uint64_t header_size{0};
  std::uint64_t payload_size{0};

  bool operator==(const ObjectLayout& other) const {
    return object_id == other.object_id && offset == other.offset &&
           header_size == other.header_size && payload_size == other.payload_size;
  }
};

// Per-bucket index of records in physical file order.
//
// Entries live in a slot vector and reference their neighbours by slot
// index. Freed slots are recycled. For every entry with a successor,
// next.offset == offset + header_size + payload_size + 2, and the head
// entry always sits at offset 0.
class MetadataChain {
public:
  // ---- QUERY OPERATIONS ----
  bool empty() const { return index_.empty(); }
  std::size_t size() const { return index_.size(); }
  bool contains(const std::string& object_id) const;
  // Returns nullptr when the object is not indexed
  const ObjectEntry* find(const std::string& object_id) const;
  // Size of the bucket file described by the chain
  std::uint64_t end_offset() const;
  // Every entry in physical order
  std::vector<ObjectLayout> layout() const;


  // ---- MUTATIONS ----
  // Links a new record after the current tail and returns it
  const ObjectEntry& append(const std::string& object_id, std::uint64_t header_size,
                            std::uint64_t payload_size);
  // Rewrites the sizes of a record kept in its physical slot and shifts
  // every later record by the change in encoded size
  void resize(const std::string& object_id, std::uint64_t header_size, std::uint64_t payload_size);
  // Unlinks a record and shifts every later record back by its encoded size
  void unlink(const std::string& object_id);
  void clear();

private:
  struct Slot {
    std::string object_id;
    ObjectEntry entry;
  };

  // ---- PARAMETERS ----
  std::vector<Slot> slots_;
  std::vector<std::size_t> free_slots_;
  std::unordered_map<std::string, std::size_t> index_;
  std::optional<std::size_t> head_;
  std::optional<std::size_t> tail_;


  // ---- CHAIN MAINTENANCE ----
  std::size_t slot_of(const std::string& object_id) const;
  // Adds delta to the offset of every record after the given slot
  void shift_after(std::size_t slot, std::int64_t delta);
};

} // namespace objstore::store

#endif // OBJSTORE_STORE_METADATA_CHAIN_HPP
