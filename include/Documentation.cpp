// ---- CRYPTO ----
// CipherContext Documentation
/*
DOCUMENTATION:
CLASS: CipherContext (RAII Wrapper)

VARIABLES:
  . EVP_CIPHER_CTX* ctx
      - OpenSSL cipher context pointer
      - Initialized to nullptr

CONSTRUCTOR:
  . CipherContext()
      - Creates new EVP cipher context
      - Throws InitializationError if context creation fails

METHODS:
  . ~CipherContext()
      - Destructor that frees the cipher context
*/

// CipherStream Documentation
/*
DOCUMENTATION:
CLASS: CipherStream

VARIABLES:
. Algorithm algorithm_ = Algorithm::NONE
    - AES (AES-192-CBC), DES (DES-CBC), TRIPLE_DES (DES-EDE3-CBC) or NONE
. static constexpr size_t BUFFER_SIZE = 8192
    - Size of buffer for stream processing
. vector<uint8_t> key_
    - Leading key_size(algorithm) bytes of the key passed to initialize()
. vector<uint8_t> iv_
    - Initialization vector, iv_size(algorithm) bytes
. unique_ptr<CipherContext> context_
    - RAII managed cipher context
. bool is_initialized_ = false
    - Tracks initialization state
. Mode mode_ = Mode::Encrypt
    - Current operation mode

CONSTRUCTOR:
. CipherStream()
    - Creates cipher context

METHODS:
Public:
  Algorithm Parameters:
  . static size_t key_size(Algorithm algorithm)
      - 24 for AES and 3DES, 8 for DES, 0 for NONE
  . static size_t iv_size(Algorithm algorithm)
      - 16 for AES, 8 for DES and 3DES, 0 for NONE
  . static size_t block_size(Algorithm algorithm)
  . vector<uint8_t> generate_IV() const
      - Generates random initialization vector with RAND_bytes

  Initialization:
  . void initialize(Algorithm algorithm, const vector<uint8_t>& key, const vector<uint8_t>& iv)
      - Keys shorter than key_size(algorithm) are rejected
      - Longer keys are truncated
      - IV must be exactly iv_size(algorithm) bytes
      - Throws InitializationError

  Encryption/Decryption Operations:
  . ostream& encrypt(istream& input, ostream& output)
  . ostream& decrypt(istream& input, ostream& output)
      - Every call reinitializes the cipher with the same key and IV
      - NONE copies the input unchanged
  . string encrypt(const string& plaintext)
  . string decrypt(const string& ciphertext)
      - String forms of the stream operations

Private:
  . void initializeCipher(bool encrypting)
      - Selects the EVP cipher and loads key and IV into the context
  . void processStream(istream& input, ostream& output, bool encrypting)
      - Main stream processing loop
  . void passThrough(istream& input, ostream& output)
  . void processStreamData(istream& input, ostream& output, bool encrypting)
      - Processes data in BUFFER_SIZE chunks
  . size_t processDataBlock(const uint8_t* inbuf, size_t bytes_read, uint8_t* outbuf, bool encrypting)
  . void writeOutputBlock(ostream& output, const uint8_t* data, size_t length)
  . void processFinalBlock(uint8_t* outbuf, int& outlen, bool encrypting)
      - Handles final block with PKCS#7 padding
      - A padding failure on decrypt throws DecryptionError

EXCEPTIONS:
. InitializationError
    - Bad key or IV size, unusable cipher
. EncryptionError
    - Thrown during encryption failures
. DecryptionError
    - Bad padding or tampered ciphertext
*/

// PasswordKeyring Documentation
/*
DOCUMENTATION:
CLASS: PasswordKeyring

VARIABLES:
. vector<string> passwords_
    - Passwords accepted from senders

METHODS:
. static vector<uint8_t> derive_key(HashAlgorithm algorithm, const string& password, const vector<uint8_t>& salt)
    - digest(password bytes ++ salt bytes)
. optional<vector<uint8_t>> matching_key(HashAlgorithm algorithm, const string& hash_hex, const string& salt_hex) const
    - Tries every password; the first derived key equal to hash_hex wins
    - The derived key doubles as the decryption key
    - Throws std::invalid_argument on malformed hex
. void add_password(const string& password)
. bool empty() const
    - True when no password is configured and requests need no key hash
*/

// CryptoError Documentation
/*
DOCUMENTATION:
CLASS: CryptoError

VARIABLES:
 None (Inherits from std::runtime_error)
CONSTRUCTOR:
 . explicit CryptoError(const string& message)
METHODS:
 None (Uses inherited std::runtime_error functionality)

CLASS: InitializationError
 . Prepends "Initialization error: " to message

CLASS: EncryptionError
 . Prepends "Encryption error: " to message

CLASS: DecryptionError
 . Prepends "Decryption error: " to message
 . Mapped to a 300 response with description "Unable to decrypt message"

CLASS: DigestError
 . Prepends "Digest error: " to message
*/


// ---- LOGGER ----
// Logger Documentation
/*
DOCUMENTATION:
FUNCTION: init_logging

  . void init_logging(const string& log_file = "", severity_level min_level = info)
      - Removes existing sinks
      - Adds a console sink on std::clog
      - Adds a text file sink rotated at 10 MB when log_file is not empty
      - Filters records below min_level
      - Rethrows after reporting on std::cerr if a sink cannot be created

LOG FORMAT:
  . Timestamp: YYYY-MM-DD HH:MM:SS.ffffff
  . Severity Level: [trace/debug/info/warning/error/fatal]
  . Thread: [Thread <id>]
  . Message: "<Component>: <text>"
*/


// ---- PROTOCOL ----
// LineReader Documentation
/*
DOCUMENTATION:
CLASS: LineReader

VARIABLES:
. istream& input_
    - Connection stream
. deque<string> queued_lines_
    - Lines of a decrypted header block, returned before the stream is read again
. uint64_t bytes_consumed_
    - Raw bytes taken off the stream

METHODS:
  . bool read_line(string& line)
      - Accepts "\r\n" or a bare "\n" terminator
      - Lines over MAX_LINE_LENGTH throw GntpException(INVALID_REQUEST)
      - Returns false at end of stream
  . string read_bytes(uint64_t count)
      - Exactly count raw bytes, EndOfStream if fewer arrive
      - Throws INVALID_REQUEST while decrypted lines are still queued
  . void read_encrypted_block(const EncryptionLayer& encryption)
      - Reads ciphertext up to the first CRLF CRLF
      - Decrypts it and queues its lines plus the closing blank line
*/

// RequestParser Documentation
/*
DOCUMENTATION:
CLASS: RequestParser

STATES:
. CONNECTED -> READING_REQUEST_HEADERS
    - Request line parsed, sender authenticated, encryption configured
. READING_REQUEST_HEADERS -> READING_NOTIFICATION_HEADERS
    - REGISTER with a nonzero Notifications-Count
. READING_REQUEST_HEADERS -> READING_RESOURCE_HEADERS
    - Referenced resources not yet read
. READING_REQUEST_HEADERS -> END_OF_REQUEST
    - Nothing left to read
. READING_NOTIFICATION_HEADERS
    - One block per declared type; a missing block ends the stream with nullopt
. READING_RESOURCE_HEADERS -> READING_RESOURCE_DATA
    - Identifier and Length read
. READING_RESOURCE_DATA -> READING_RESOURCE_HEADERS | END_OF_REQUEST
    - Payload handed to the resource store, trailing blank line checked
    - Payloads of ignored requests go to a DiscardStore instead
. END_OF_REQUEST -> RESPONSE_SENT
    - Set by the protocol engine once the response is written

METHODS:
. optional<PendingRequest> parse()
    - Runs the state machine to END_OF_REQUEST
    - Returns nullopt if the stream ended first
    - Throws GntpException or DecryptionError on malformed input
. State get_state() const
. static string state_to_string(State state)
*/

// ProtocolEngine Documentation
/*
DOCUMENTATION:
CLASS: ProtocolEngine

CONSTRUCTOR:
. ProtocolEngine(Registry& registry, NotificationSink& sink, ResourceStore& store, EngineOptions options)
    - options.auth_failure_policy: REJECT or IGNORE_NOTIFY
    - options.origin: Origin-* headers added to every response

METHODS:
. bool handle(istream& input, ostream& output, uint64_t connection_id)
    - Parses one request, dispatches it and writes exactly one response
    - Every exception becomes an ERROR response through map_exception
    - Returns false with nothing written when the stream ended mid-request
*/


// ---- NETWORK ----
// ConnectionManager Documentation
/*
DOCUMENTATION:
CLASS: ConnectionManager

VARIABLES:
. ProtocolEngine& engine_
    - Shared by every connection
. const seconds read_timeout_
    - Whole-request deadline, 0 disables it
. map<uint64_t, shared_ptr<Connection>> connections_
    - Live connections keyed by id
. vector<shared_ptr<Connection>> finished_
    - Closed connections kept until their threads are joined
. bool accepting_
    - Cleared by shutdown()

METHODS:
. uint64_t create_connection(tcp::socket socket)
    - Wraps the socket in a Connection and starts its thread
    - Returns 0 when shut down or when the connection fails to start
    - Joins the threads of connections that finished since the last call
. void remove_connection(uint64_t connection_id)
    - Called from the connection thread once it closes
    - Moves the connection to finished_
. void shutdown(milliseconds grace)
    - Stops accepting, closes live sockets, waits up to grace for them to go idle
    - Then joins every connection thread, however long dispatch takes
. bool wait_idle(milliseconds timeout) const
*/

// TCP_Server Documentation
/*
DOCUMENTATION:
CLASS: TCP_Server

VARIABLES:
 . const uint16_t port_
     - Port number server listens on, 0 for an ephemeral port
 . const string address_
     - Network address server binds to
 . unique_ptr<thread> io_thread_
     - Thread running io_context event loop
 . atomic<bool> is_running_
     - Indicates if server is actively running
 . io_context io_context_
     - Manages asynchronous accepts
 . unique_ptr<tcp::acceptor> acceptor_
     - Accepts incoming TCP connections
 . ConnectionManager& connection_manager_
     - Receives every accepted socket

CONSTRUCTOR:
 . TCP_Server(uint16_t port, const string& address, ConnectionManager& connection_manager)
     - Does not start listening immediately

METHODS:
 Public:
   . bool start_listener()
       - Binds, listens and starts io_thread
       - Returns false if already running or the bind fails
   . void shutdown()
       - Closes the acceptor, stops io_context and joins io_thread
       - Call before ConnectionManager::shutdown(); accepted sockets use io_context_
   . uint16_t get_port() const
       - Bound port while running

 Private:
   . void start_accept()
       - Sets up async accept for new connections
       - Continues accepting while running
*/


// ---- STORE ----
// Store Documentation
/*
DOCUMENTATION:
CLASS: Store

VARIABLES:
. std::filesystem::path base_path_
    - Root directory path for all stored files
. std::map<const std::ostream*, std::filesystem::path> pending_
    - Partial file behind each open cache slot

CONSTRUCTOR:
. explicit Store(const std::string& base_path)
    - Creates directory if it doesn't exist

METHODS:
Public:
  Resource Store:
  . CacheSlot acquire_cache_slot(const string& identifier, const HeaderBlock& headers)
      - Cache hit when the resource file exists
      - Otherwise opens "<location>.<n>.part" as the slot sink
  . void commit_cache_slot(const CacheSlot& slot)
      - Renames the partial file into place
      - Throws StoreError for unknown slots and write failures
  . void abandon_cache_slot(const CacheSlot& slot)
      - Deletes the partial file

  Query Operations:
  . bool has(const std::string& key) const
  . std::filesystem::path resolve_key_path(const std::string& key) const
      - Format: base_path/hash[0:2]/hash[2:4]/hash[4:6]/remaining_hash

Private:
  . std::string hash_key(const std::string& key) const
      - SHA-256 of key as lowercase hex
  . std::filesystem::path get_path_for_hash(const std::string& hash) const
*/

// MemoryStore Documentation
/*
DOCUMENTATION:
CLASS: MemoryStore

VARIABLES:
. const size_t max_bytes_
    - Total payload bytes held, DEFAULT_MAX_BYTES (64 MiB) unless set by --memory-limit
. map<string, string> resources_
. deque<string> order_
    - Identifiers in commit order, oldest first

METHODS:
. CacheSlot acquire_cache_slot(const string& identifier, const HeaderBlock& headers)
    - Location "memory://<identifier>", sink is an ostringstream on a miss
. void commit_cache_slot(const CacheSlot& slot)
    - Evicts the oldest payloads until the new one fits
    - A payload over max_bytes_ is dropped with a warning
. optional<string> get(const string& identifier) const
. size_t total_bytes() const

CLASS: DiscardStore
. Never caches; commit only logs
. Also receives the payloads of ignored requests inside RequestParser
*/
