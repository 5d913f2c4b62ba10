#ifndef OBJSTORE_STORE_LOG_REWRITER_HPP
#define OBJSTORE_STORE_LOG_REWRITER_HPP

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>

namespace objstore::store {

// Extension of the temporary files a rewrite goes through
constexpr const char* kTempFileExtension = ".tmp";
// Hex digits of the random part of a temporary file name
constexpr std::size_t kTempSuffixLength = 16;

// Builds the next version of a bucket file in a temporary file next to it,
// then commits it with a single rename over the bucket file.
//
// Until commit() succeeds the bucket file is never touched, and the
// temporary file is removed when the rewriter goes out of scope.
class LogRewriter {
public:
  // Delete copy constructor and assignment operator
  LogRewriter(const LogRewriter&) = delete;
  LogRewriter& operator=(const LogRewriter&) = delete;


  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  // Opens a fresh temporary file in the directory of bucket_file
  LogRewriter(std::filesystem::path bucket_file, const std::string& bucket_id);
  ~LogRewriter();


  // ---- REWRITE STEPS ----
  // Copies the whole current bucket file
  void copy_all();
  // Copies bytes [0, length) of the current bucket file
  void copy_prefix(std::uint64_t length);
  // Copies the current bucket file from offset to its end
  void copy_from(std::uint64_t offset);
  // Writes a new record and returns its header size
  std::uint64_t append_record(const std::string& object_id, const std::string& payload);
  // Bytes written to the temporary file so far
  std::uint64_t bytes_written() const { return bytes_written_; }


  // ---- COMMIT ----
  // Closes the temporary file and renames it over the bucket file
  void commit();

  const std::filesystem::path& temp_path() const { return temp_path_; }

  // Random suffix used in temporary file names
  static std::string random_suffix();
  // True for <bucket_id>_<16 lowercase hex digits>.tmp, the only names a rewriter creates
  static bool is_temp_file_name(const std::string& filename);

private:
  // ---- PARAMETERS ----
  const std::filesystem::path bucket_file_;
  std::filesystem::path temp_path_;
  std::ofstream output_;
  std::ifstream source_;
  std::uint64_t bytes_written_{0};
  bool committed_{false};


  // ---- STREAM OPERATIONS ----
  std::ifstream& open_source();
  // Streams at most limit bytes from input, or all of it when bounded is false
  std::uint64_t stream_copy(std::istream& input, std::uint64_t limit, bool bounded);
};

} // namespace objstore::store

#endif // OBJSTORE_STORE_LOG_REWRITER_HPP
