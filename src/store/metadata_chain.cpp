#include "store/metadata_chain.hpp"
#include "store/record_codec.hpp"
#include <stdexcept>

namespace objstore::store {

//==============================================
// QUERY OPERATIONS
//==============================================

bool MetadataChain::contains(const std::string& object_id) const {
  return index_.count(object_id) > 0;
}

const ObjectEntry* MetadataChain::find(const std::string& object_id) const {
  auto it = index_.find(object_id);
  if (it == index_.end()) {
    return nullptr;
  }
  return &slots_[it->second].entry;
}

std::uint64_t MetadataChain::end_offset() const {
  if (!tail_) {
    return 0;
  }
  const ObjectEntry& last = slots_[*tail_].entry;
  return last.offset + RecordCodec::encoded_size(last.header_size, last.payload_size);
}

std::vector<ObjectLayout> MetadataChain::layout() const {
  std::vector<ObjectLayout> result;
  result.reserve(index_.size());

  for (auto slot = head_; slot; slot = slots_[*slot].entry.next) {
    const Slot& current = slots_[*slot];
    result.push_back({current.object_id, current.entry.offset,
                      current.entry.header_size, current.entry.payload_size});
  }
  return result;
}


//==============================================
// MUTATIONS
//==============================================

const ObjectEntry& MetadataChain::append(const std::string& object_id, std::uint64_t header_size,
                                         std::uint64_t payload_size) {
  if (contains(object_id)) {
    throw std::invalid_argument("MetadataChain: object " + object_id + " is already indexed");
  }

  ObjectEntry entry;
  entry.offset = end_offset();
  entry.header_size = header_size;
  entry.payload_size = payload_size;
  entry.prev = tail_;

  // Reuse a freed slot when there is one
  std::size_t slot;
  if (!free_slots_.empty()) {
    slot = free_slots_.back();
    free_slots_.pop_back();
    slots_[slot] = Slot{object_id, entry};
  } else {
    slot = slots_.size();
    slots_.push_back(Slot{object_id, entry});
  }

  if (tail_) {
    slots_[*tail_].entry.next = slot;
  } else {
    head_ = slot;
  }
  tail_ = slot;
  index_.emplace(object_id, slot);

  return slots_[slot].entry;
}

void MetadataChain::resize(const std::string& object_id, std::uint64_t header_size,
                           std::uint64_t payload_size) {
  const std::size_t slot = slot_of(object_id);
  ObjectEntry& entry = slots_[slot].entry;

  const auto old_size = static_cast<std::int64_t>(
    RecordCodec::encoded_size(entry.header_size, entry.payload_size));
  const auto new_size = static_cast<std::int64_t>(
    RecordCodec::encoded_size(header_size, payload_size));

  if (new_size != old_size) {
    shift_after(slot, new_size - old_size);
  }
  entry.header_size = header_size;
  entry.payload_size = payload_size;
}

void MetadataChain::unlink(const std::string& object_id) {
  const std::size_t slot = slot_of(object_id);
  const ObjectEntry entry = slots_[slot].entry;

  shift_after(slot, -static_cast<std::int64_t>(
    RecordCodec::encoded_size(entry.header_size, entry.payload_size)));

  if (entry.prev) {
    slots_[*entry.prev].entry.next = entry.next;
  } else {
    head_ = entry.next;
  }

  if (entry.next) {
    slots_[*entry.next].entry.prev = entry.prev;
  } else {
    tail_ = entry.prev;
  }

  index_.erase(object_id);
  slots_[slot] = Slot{};
  free_slots_.push_back(slot);
}

void MetadataChain::clear() {
  slots_.clear();
  free_slots_.clear();
  index_.clear();
  head_.reset();
  tail_.reset();
}


//==============================================
// CHAIN MAINTENANCE
//==============================================

std::size_t MetadataChain::slot_of(const std::string& object_id) const {
  auto it = index_.find(object_id);
  if (it == index_.end()) {
    throw std::out_of_range("MetadataChain: object " + object_id + " is not indexed");
  }
  return it->second;
}

void MetadataChain::shift_after(std::size_t slot, std::int64_t delta) {
  for (auto next = slots_[slot].entry.next; next; next = slots_[*next].entry.next) {
    ObjectEntry& entry = slots_[*next].entry;
    entry.offset = static_cast<std::uint64_t>(static_cast<std::int64_t>(entry.offset) + delta);
  }
}

} // namespace objstore::store
