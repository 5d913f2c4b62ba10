#ifndef OBJSTORE_STORE_RECORD_CODEC_HPP
#define OBJSTORE_STORE_RECORD_CODEC_HPP

#include <cstdint>
#include <iostream>
#include <optional>
#include <string>

namespace objstore::store {

// Byte written between the identifier, the length field and the payload
constexpr char kFieldSeparator = ' ';
// Byte written after every payload
constexpr char kRecordTerminator = '\n';

// Decoded "<id> <length>" prefix of one record
struct RecordHeader {
  std::string object_id;
  std::uint64_t header_size{0};   // identifier, one separator and the length digits
  std::uint64_t payload_size{0};
};

// On-disk record format: <id> <decimal payload length> <payload><terminator>
// Payload bytes are never escaped, they are always read by declared length.
class RecordCodec {
public:
  // ---- ENCODING ----
  // Writes one complete record and returns its header size
  static std::uint64_t encode(std::ostream& output, const std::string& object_id,
                              const std::string& payload);
  // Size of the "<id> <length>" prefix, excluding the separator before the payload
  static std::uint64_t header_size(const std::string& object_id, std::uint64_t payload_size);
  // Full record size: header, separator, payload and terminator
  static std::uint64_t encoded_size(std::uint64_t header_size, std::uint64_t payload_size) {
    return header_size + payload_size + 2;
  }


  // ---- DECODING ----
  // Reads the next record prefix (including the separator before the payload).
  // Returns nullopt on a clean end of input at a record boundary, throws
  // FormatError on anything else that is not a well formed prefix.
  static std::optional<RecordHeader> decode_header(std::istream& input);
  // Consumes the payload and terminator that follow a decoded header
  static void skip_payload(std::istream& input, const RecordHeader& header);


  // ---- IDENTIFIERS ----
  // True when the identifier is non-empty and only holds [a-z0-9_-]
  static bool is_valid_identifier(const std::string& identifier);
  // Throws InvalidIdentifierError naming the kind of identifier rejected
  static void validate_identifier(const std::string& identifier, const char* kind);

private:
  static void read_terminator(std::istream& input, const RecordHeader& header);
};

} // namespace objstore::store

#endif // OBJSTORE_STORE_RECORD_CODEC_HPP
