#include "store/log_rewriter.hpp"
#include "store/record_codec.hpp"
#include "store/store_error.hpp"
#include <openssl/rand.h>
#include <algorithm>
#include <iomanip>
#include <sstream>
#include <system_error>

namespace objstore::store {

namespace {

constexpr std::size_t kCopyBufferSize = 4096;

} // namespace

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

LogRewriter::LogRewriter(std::filesystem::path bucket_file, const std::string& bucket_id)
  : bucket_file_(std::move(bucket_file)) {
  // Same directory as the bucket file so the final rename stays on one filesystem
  temp_path_ = bucket_file_.parent_path() / (bucket_id + "_" + random_suffix() + kTempFileExtension);

  output_.open(temp_path_, std::ios::binary | std::ios::trunc);
  if (!output_) {
    throw IOError("failed to create temporary file " + temp_path_.string());
  }
}

LogRewriter::~LogRewriter() {
  if (committed_) {
    return;
  }
  if (output_.is_open()) {
    output_.close();
  }
  // Best effort, the original bucket file is intact either way
  std::error_code ec;
  std::filesystem::remove(temp_path_, ec);
}


//==============================================
// REWRITE STEPS
//==============================================

void LogRewriter::copy_all() {
  stream_copy(open_source(), 0, false);
}

void LogRewriter::copy_prefix(std::uint64_t length) {
  std::ifstream& input = open_source();
  if (stream_copy(input, length, true) != length) {
    throw IOError("bucket file " + bucket_file_.string() + " is shorter than " +
                  std::to_string(length) + " bytes");
  }
}

void LogRewriter::copy_from(std::uint64_t offset) {
  std::ifstream& input = open_source();
  input.clear();
  input.seekg(static_cast<std::streamoff>(offset), std::ios::beg);
  if (!input) {
    throw IOError("failed to seek to offset " + std::to_string(offset) + " in " + bucket_file_.string());
  }
  stream_copy(input, 0, false);
}

std::uint64_t LogRewriter::append_record(const std::string& object_id, const std::string& payload) {
  const std::uint64_t header_size = RecordCodec::encode(output_, object_id, payload);
  bytes_written_ += RecordCodec::encoded_size(header_size, payload.size());
  return header_size;
}


//==============================================
// COMMIT
//==============================================

void LogRewriter::commit() {
  if (source_.is_open()) {
    source_.close();
  }

  output_.flush();
  output_.close();
  if (output_.fail()) {
    throw IOError("failed to flush temporary file " + temp_path_.string());
  }

  std::error_code ec;
  std::filesystem::rename(temp_path_, bucket_file_, ec);
  if (ec) {
    throw IOError("failed to rename " + temp_path_.string() + " over " +
                  bucket_file_.string() + ": " + ec.message());
  }
  committed_ = true;
}

std::string LogRewriter::random_suffix() {
  unsigned char bytes[kTempSuffixLength / 2];
  if (RAND_bytes(bytes, sizeof(bytes)) != 1) {
    throw IOError("failed to generate temporary file name");
  }

  std::stringstream ss;
  for (unsigned char byte : bytes) {
    ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(byte);
  }
  return ss.str();
}

bool LogRewriter::is_temp_file_name(const std::string& filename) {
  const std::string extension = kTempFileExtension;
  // bucket id, separator, suffix, extension
  if (filename.size() < 1 + 1 + kTempSuffixLength + extension.size() ||
      filename.compare(filename.size() - extension.size(), extension.size(), extension) != 0) {
    return false;
  }

  const std::size_t suffix_start = filename.size() - extension.size() - kTempSuffixLength;
  const std::string suffix = filename.substr(suffix_start, kTempSuffixLength);
  const bool hex = std::all_of(suffix.begin(), suffix.end(), [](char c) {
    return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f');
  });
  if (!hex || filename[suffix_start - 1] != '_') {
    return false;
  }
  return RecordCodec::is_valid_identifier(filename.substr(0, suffix_start - 1));
}


//==============================================
// STREAM OPERATIONS
//==============================================

std::ifstream& LogRewriter::open_source() {
  if (!source_.is_open()) {
    source_.open(bucket_file_, std::ios::binary);
    if (!source_) {
      throw IOError("failed to open bucket file " + bucket_file_.string());
    }
  }
  return source_;
}

std::uint64_t LogRewriter::stream_copy(std::istream& input, std::uint64_t limit, bool bounded) {
  char buffer[kCopyBufferSize];
  std::uint64_t copied = 0;

  while (!bounded || copied < limit) {
    std::uint64_t chunk = sizeof(buffer);
    if (bounded) {
      chunk = std::min<std::uint64_t>(chunk, limit - copied);
    }

    input.read(buffer, static_cast<std::streamsize>(chunk));
    const std::streamsize got = input.gcount();
    if (got > 0) {
      output_.write(buffer, got);
      if (!output_) {
        throw IOError("failed to write temporary file " + temp_path_.string());
      }
      copied += static_cast<std::uint64_t>(got);
    }

    if (!input) {
      if (input.bad()) {
        throw IOError("failed to read bucket file " + bucket_file_.string());
      }
      break;  // end of file
    }
  }

  bytes_written_ += copied;
  return copied;
}

} // namespace objstore::store
