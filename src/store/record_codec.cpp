#include "store/record_codec.hpp"
#include "store/store_error.hpp"
#include <algorithm>
#include <charconv>
#include <limits>

namespace objstore::store {

//==============================================
// ENCODING
//==============================================

std::uint64_t RecordCodec::encode(std::ostream& output, const std::string& object_id,
                                  const std::string& payload) {
  const std::string header = object_id + kFieldSeparator + std::to_string(payload.size());

  output.write(header.data(), static_cast<std::streamsize>(header.size()));
  output.put(kFieldSeparator);
  output.write(payload.data(), static_cast<std::streamsize>(payload.size()));
  output.put(kRecordTerminator);

  if (!output) {
    throw IOError("failed to write record for object " + object_id);
  }
  return header.size();
}

std::uint64_t RecordCodec::header_size(const std::string& object_id, std::uint64_t payload_size) {
  return object_id.size() + 1 + std::to_string(payload_size).size();
}


//==============================================
// DECODING
//==============================================

std::optional<RecordHeader> RecordCodec::decode_header(std::istream& input) {
  RecordHeader header;

  // Identifier up to the first separator
  std::getline(input, header.object_id, kFieldSeparator);
  if (input.eof()) {
    if (header.object_id.empty()) {
      return std::nullopt;
    }
    throw FormatError("truncated record header for object " + header.object_id);
  }
  if (input.bad()) {
    throw IOError("failed to read record header");
  }
  if (!is_valid_identifier(header.object_id)) {
    throw FormatError("invalid object identifier \"" + header.object_id + "\"");
  }

  // Decimal length up to the next separator
  std::string length_field;
  std::getline(input, length_field, kFieldSeparator);
  if (input.eof()) {
    throw FormatError("truncated length field for object " + header.object_id);
  }
  if (input.bad()) {
    throw IOError("failed to read length field for object " + header.object_id);
  }

  const char* first = length_field.data();
  const char* last = first + length_field.size();
  auto [ptr, ec] = std::from_chars(first, last, header.payload_size);
  if (length_field.empty() || ec != std::errc() || ptr != last) {
    throw FormatError("invalid length field \"" + length_field + "\" for object " + header.object_id);
  }

  header.header_size = header.object_id.size() + 1 + length_field.size();
  return header;
}

void RecordCodec::skip_payload(std::istream& input, const RecordHeader& header) {
  if (header.payload_size > static_cast<std::uint64_t>(std::numeric_limits<std::streamsize>::max())) {
    throw FormatError("payload length out of range for object " + header.object_id);
  }

  const auto expected = static_cast<std::streamsize>(header.payload_size);
  input.ignore(expected);
  if (input.gcount() != expected) {
    throw FormatError("truncated payload for object " + header.object_id + ": expected " +
                      std::to_string(expected) + " bytes, found " + std::to_string(input.gcount()));
  }
  read_terminator(input, header);
}

void RecordCodec::read_terminator(std::istream& input, const RecordHeader& header) {
  const auto terminator = input.get();
  if (terminator == std::char_traits<char>::eof()) {
    throw FormatError("missing record terminator for object " + header.object_id);
  }
  if (static_cast<char>(terminator) != kRecordTerminator) {
    throw FormatError("unexpected byte after payload of object " + header.object_id);
  }
}


//==============================================
// IDENTIFIERS
//==============================================

bool RecordCodec::is_valid_identifier(const std::string& identifier) {
  return !identifier.empty() &&
         std::all_of(identifier.begin(), identifier.end(), [](char c) {
           return (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '_' || c == '-';
         });
}

void RecordCodec::validate_identifier(const std::string& identifier, const char* kind) {
  if (!is_valid_identifier(identifier)) {
    throw InvalidIdentifierError(std::string(kind) + " \"" + identifier + "\" must match [a-z0-9_-]+");
  }
}

} // namespace objstore::store
