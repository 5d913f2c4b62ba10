// ---- STORE ----
// RecordCodec Documentation
/*
DOCUMENTATION:
CLASS: RecordCodec (static helpers)

FORMAT:
  . <object_id> <decimal payload length> <payload>\n
      - Records are written back to back, no file header
      - Payload bytes are never escaped, they are read by declared length
      - header_size covers "<object_id> <length>" without the separator after it
      - Encoded size of a record is header_size + payload_size + 2

METHODS:
  Encoding:
  . static uint64_t encode(ostream& output, const string& object_id, const string& payload)
      - Writes one complete record
      - Returns the header size
      - Throws IOError when the stream fails
  . static uint64_t header_size(const string& object_id, uint64_t payload_size)
  . static uint64_t encoded_size(uint64_t header_size, uint64_t payload_size)

  Decoding:
  . static optional<RecordHeader> decode_header(istream& input)
      - Returns nullopt on a clean end of input between records
      - Throws FormatError on a truncated header, an invalid identifier
        or a length field that is not a plain decimal number
  . static void skip_payload(istream& input, const RecordHeader& header)
      - Verifies the terminator byte after the payload

  Identifiers:
  . static bool is_valid_identifier(const string& identifier)
      - Non-empty, only [a-z0-9_-]
  . static void validate_identifier(const string& identifier, const char* kind)
      - Throws InvalidIdentifierError
*/

// StripeLockManager Documentation
/*
DOCUMENTATION:
CLASS: StripeLockManager

VARIABLES:
  . const uint32_t stripe_count_
      - Number of stripes, FileStore uses 100 unless told otherwise
  . unique_ptr<shared_mutex[]> locks_
      - One reader/writer lock per stripe

CONSTRUCTOR:
  . StripeLockManager(uint32_t stripe_count)
      - Throws invalid_argument for a zero stripe count

METHODS:
  . static uint32_t hash(const string& bucket_id)
      - First four bytes of the SHA-256 digest, read big-endian
  . uint32_t stripe_for(const string& bucket_id) const
      - hash(bucket_id) % stripe_count_
  . shared_mutex& lock_for(uint32_t stripe_index)
      - Throws out_of_range for an index past the last stripe
*/

// MetadataChain Documentation
/*
DOCUMENTATION:
CLASS: MetadataChain

VARIABLES:
  . vector<Slot> slots_
      - Entries with prev/next slot indices, in allocation order
  . vector<size_t> free_slots_
      - Slots released by unlink, reused by append
  . unordered_map<string, size_t> index_
      - Object identifier to slot
  . optional<size_t> head_, tail_
      - First and last record in physical order

INVARIANTS:
  . Head record sits at offset 0
  . next.offset == offset + header_size + payload_size + 2
  . end_offset() equals the bucket file size

METHODS:
  . const ObjectEntry& append(id, header_size, payload_size)
      - Links after the tail, throws invalid_argument on a duplicate
  . void resize(id, header_size, payload_size)
      - Keeps the record in its slot, shifts every later record
  . void unlink(id)
      - Shifts every later record back, frees the slot
  . vector<ObjectLayout> layout() const
      - Records in physical order
*/

// BucketRegistry Documentation
/*
DOCUMENTATION:
CLASS: BucketRegistry

VARIABLES:
  . map<string, shared_ptr<BucketEntry>> buckets_
  . mutable shared_mutex mutex_
      - Held only for map access and the wait for a stripe lock

LOCK ORDER:
  . Registry lock first, stripe lock second
  . Nothing waits on the registry while holding a stripe

METHODS:
  . WriteHandle resolve_or_create(const string& bucket_id)
      - Creates an entry for an unknown or retired bucket, never a file
      - Returns with the stripe held exclusively
  . optional<ReadHandle> lookup_for_read(const string& bucket_id) const
  . optional<WriteHandle> lookup_for_write(const string& bucket_id) const
      - nullopt for unknown and retired buckets
  . bool remove(const string& bucket_id, const shared_ptr<BucketEntry>& expected)
      - Drops the bucket only while it still maps to expected
*/

// LogRewriter Documentation
/*
DOCUMENTATION:
CLASS: LogRewriter (RAII temporary file)

CONSTRUCTOR:
  . LogRewriter(path bucket_file, const string& bucket_id)
      - Opens <bucket_id>_<16 hex digits>.tmp next to the bucket file
      - Random suffix comes from RAND_bytes

METHODS:
  . void copy_all()
  . void copy_prefix(uint64_t length)
      - Throws IOError when the bucket file is shorter than length
  . void copy_from(uint64_t offset)
  . uint64_t append_record(const string& object_id, const string& payload)
  . void commit()
      - Flushes, closes and renames over the bucket file
  . ~LogRewriter()
      - Removes the temporary file unless commit() succeeded
*/

// BootstrapLoader Documentation
/*
DOCUMENTATION:
CLASS: BootstrapLoader

METHODS:
  . size_t load()
      - Removes stray <bucket_id>_<16 hex>.tmp files, other .tmp files are kept
      - Parses every regular *.dat file whose stem is a valid bucket id
      - Removes empty bucket files
      - Throws FormatError naming the file and offset of the bad record
  . static MetadataChain parse_bucket_file(const path& file_path)
      - Duplicate object identifiers are a FormatError
*/

// FileStore Documentation
/*
DOCUMENTATION:
CLASS: FileStore

CONSTRUCTOR:
  . FileStore(const string& storage_path, Logger& logger, uint32_t stripe_count = 100)
      - Throws ConfigurationError when the directory is missing or unreadable
      - Loads every bucket before returning

METHODS:
  . bool store(payload, object_id, bucket_id)
      - New objects go after the last record, replaced ones keep their slot
      - Returns true when an object was replaced
  . optional<string> retrieve(object_id, bucket_id)
      - Seeks to offset + header_size + 1 and reads payload_size bytes
  . bool remove(object_id, bucket_id)
      - Removing the last object removes the bucket file and the bucket
      - Returns false when there was nothing to remove

FAILURES:
  . Index is updated only after the rename commits
  . A failed first store into a new bucket leaves no bucket behind
*/

// MemoryStore Documentation
/*
DOCUMENTATION:
CLASS: MemoryStore

  . Nested unordered_map guarded by one shared_mutex
  . Same store/retrieve/remove contract as FileStore, nothing persisted
*/

// ---- HTTP ----
// RequestHandler Documentation
/*
DOCUMENTATION:
CLASS: RequestHandler

ROUTES:
  . PUT    /objects/{bucket}/{object}  -> 201 created, 200 replaced, {"id":"<object>"}
  . GET    /objects/{bucket}/{object}  -> 200 with the payload as text/plain
  . DELETE /objects/{bucket}/{object}  -> 200
  . Anything else                      -> 404, or 405 for other methods on an object route

ERRORS:
  . 415 Content type "<type>" not supported
  . 400 Object content not set
  . 413 Object size exceeds maximum size of <size>
  . 404 Object <bucket>/<object> not found
  . 500 Error storing|retrieving|deleting object: <reason>
*/

// HttpServer Documentation
/*
DOCUMENTATION:
CLASS: HttpServer

VARIABLES:
  . io_context io_context_ with a pool of worker threads
  . unique_ptr<tcp::acceptor> acceptor_
  . work guard keeping the pool alive between connections

METHODS:
  . bool start_listener()
      - Returns false when already running or the bind fails
  . void shutdown()
      - Closes the acceptor, stops the pool, joins the workers
  . uint16_t bound_port() const
      - Actual port, useful after binding port 0

CLASS: HttpSession
  . Reads the header first and lets RequestHandler::check_headers reject
    the request before any body is read
  . Headers are read with no body limit, the body read uses the maximum object size
  . Keeps the connection open while the client asks for keep-alive
*/

// ---- CONFIG ----
/*
DOCUMENTATION:
FUNCTION: load_config(argc, argv[, environment])

PRECEDENCE:
  . Command line, then OBJSTORE_* environment variables, then the INI file, then defaults

OPTIONS:
  . -h, --help
  . -v, --verbose
  . -c, --config           default config.ini, missing file is fine unless given explicitly
  . -l, --listen-address   <port> or <host>:<port>, default 0.0.0.0:8080
  . -p, --persist          use FileStore instead of MemoryStore
  . --data-path            default "."
  . --max-object-size      default 10485760
  . --workers              default hardware concurrency
  . --log-file             optional file sink
*/

// ---- LOGGER ----
/*
DOCUMENTATION:
FUNCTIONS:
  . void init_logging(severity_level min_level = info, const string& log_file = "")
      - Replaces every sink with a console sink and an optional file sink
  . void shutdown_logging()

MACROS:
  . OBJSTORE_LOG_TRACE(lg)
  . OBJSTORE_LOG_DEBUG(lg)
  . OBJSTORE_LOG_INFO(lg)
  . OBJSTORE_LOG_WARN(lg)
  . OBJSTORE_LOG_ERROR(lg)
  . OBJSTORE_LOG_FATAL(lg)
      - lg is a logging::Logger handed down from main
*/
