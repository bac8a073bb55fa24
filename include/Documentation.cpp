// ---- CRYPTO ----
// Hash Documentation
/*
DOCUMENTATION:
MODULE: crypto/hash

CONSTANTS:
  . HASH_SIZE = 64
      - SHA-512 digest length in bytes

TYPES:
  . HashCode = array<uint8_t, HASH_SIZE>

FUNCTIONS:
  . HashCode hash(const uint8_t* data, size_t length)
  . HashCode hash(const vector<uint8_t>& data)
      - SHA-512 of the input, computed through OpenSSL EVP
      - Throws HashError if OpenSSL fails
  . HashCode hash_from_bytes(const uint8_t* data, size_t length)
      - Copies exactly HASH_SIZE bytes into a HashCode
      - Throws PreconditionError for any other length
  . string to_hex(const HashCode& code)
      - Lowercase hex, used in log messages
*/

// BlockCipher Documentation
/*
DOCUMENTATION:
CLASS: BlockCipher

VARIABLES:
  . static constexpr size_t BLOCK_SIZE = 16
      - AES block size
  . const SessionKey session_key_
      - 32 byte AES-256 key and 16 byte IV

CONSTRUCTOR:
  . BlockCipher(const SessionKey& session_key)

METHODS:
  Public:
    . static SessionKey derive_key_iv(const uint8_t* digest, size_t length)
        - key = digest[0, 32), iv = digest[32, 48)
        - Missing bytes are zero
    . static SessionKey derive_key_iv(const HashCode& digest)
    . vector<uint8_t> encrypt(const uint8_t* data, size_t length) const
    . vector<uint8_t> decrypt(const uint8_t* data, size_t length) const
        - AES-256-CFB128, output length equals input length
        - Empty input gives empty output
        - Throws EncryptionError / DecryptionError if OpenSSL fails
        - Throws PreconditionError if length exceeds INT_MAX
    . const SessionKey& session_key() const

  Private:
    . vector<uint8_t> process(const uint8_t* data, size_t length, bool encrypting) const
        - Shared one-shot EVP pass for both directions
    . void initializeCipher(CipherContext& context, bool encrypting) const
*/

// CipherContext / DigestContext Documentation
/*
DOCUMENTATION:
CLASS: CipherContext, DigestContext (RAII Wrappers)

  . Own an EVP_CIPHER_CTX / EVP_MD_CTX for one operation
  . Throw EncryptionError / HashError if allocation fails
  . Free the context in the destructor
*/

// CryptoError Documentation
/*
DOCUMENTATION:
CLASSES: CryptoError hierarchy

  . CryptoError : runtime_error
      - Base class for OpenSSL failures
  . HashError : CryptoError
      - "Hash error: " prefix
  . EncryptionError : CryptoError
      - "Encryption error: " prefix
  . DecryptionError : CryptoError
      - "Decryption error: " prefix
  . PreconditionError : logic_error
      - "Precondition violated: " prefix
      - Raised for caller mistakes, never for bad input data
*/


// ---- ENCODING ----
// Base32 Documentation
/*
DOCUMENTATION:
CLASS: Base32

VARIABLES:
  . static constexpr const char* ALPHABET = "0123456789ABCDEFGHIJKLMNOPQRSTUV"
  . static constexpr unsigned BITS_PER_SYMBOL = 5

METHODS:
  . static string encode(const uint8_t* data, size_t length)
  . static string encode(const vector<uint8_t>& data)
      - Most significant bit first, last symbol zero padded
      - 64 bytes encode to 103 symbols
  . static vector<uint8_t> decode(const string& text, size_t expected_length)
      - Throws EncodingError on wrong length, symbols outside the
        alphabet, or padding bits that are not zero
  . static size_t encoded_length(size_t length)
      - ceil(length * 8 / 5)
*/


// ---- TREE ----
// ChkRecord Documentation
/*
DOCUMENTATION:
STRUCT: ChkRecord, FileIdentifier

  . ChkRecord
      - HashCode key: hash of the block plaintext, decrypts the block
      - HashCode query: hash of the block ciphertext, names the block
      - SERIALIZED_SIZE = 128, key then query
      - void append_to(vector<uint8_t>& out) const
  . FileIdentifier
      - ChkRecord chk: record of the root block
      - uint64_t file_length
*/

// TreeGeometry Documentation
/*
DOCUMENTATION:
CLASS: TreeGeometry

VARIABLES:
  . CANONICAL_LEAF_SIZE = 32768, CANONICAL_FAN_OUT = 256
  . uint64_t leaf_size_
  . unsigned fan_out_

CONSTRUCTOR:
  . TreeGeometry(uint64_t leaf_size, unsigned fan_out)
      - Throws ShapeError unless fan_out >= 2 and
        leaf_size == fan_out * ChkRecord::SERIALIZED_SIZE

METHODS:
  . static const TreeGeometry& canonical()
  . unsigned depth_for_size(uint64_t size) const
      - 1 for any size up to one leaf
      - Stops at the first depth whose span would overflow
  . uint64_t span_at_depth(unsigned depth) const
      - Throws ShapeError on overflow
  . unsigned child_slot_index(unsigned depth, uint64_t offset) const
      - Leaves: start offset, internal blocks: end offset
  . unsigned internal_block_child_count(unsigned depth, uint64_t offset) const
      - Between 1 and fan_out
*/

// TreeEncoder Documentation
/*
DOCUMENTATION:
CLASS: TreeEncoder

VARIABLES:
  . istream& input_
  . const uint64_t size_
  . const TreeGeometry geometry_
  . const unsigned tree_depth_
  . unsigned current_depth_
      - Level of the next block
  . uint64_t publish_offset_
      - File bytes consumed so far
  . vector<ChkWindow> levels_
      - One window of fan_out records per level
  . optional<FileIdentifier> result_
  . BlockHandler block_handler_
  . ProgressHandler progress_handler_

CONSTRUCTOR:
  . TreeEncoder(istream& input, uint64_t size, const TreeGeometry& geometry)

METHODS:
  Public:
    . FileIdentifier run()
        - Calls next() until done, returns result()
    . bool next()
        - Emits one block, or records the root
        - Returns false once finished
        - Throws io::IoError on a short or failed read
    . const FileIdentifier& result() const
        - Throws logic_error before the encoder has finished
    . void set_block_handler(BlockHandler handler)
    . void set_progress_handler(ProgressHandler handler)

  Private:
    . vector<uint8_t> read_leaf()
    . vector<uint8_t> assemble_internal_block() const
    . uint64_t block_start_offset(uint64_t slot_offset) const
    . void advance()
        - Moves up after a full block or at the end of the file,
          otherwise back to the leaves

BLOCK ORDER:
  . Children before every emission of their parent
  . Leaves appear in file order
  . An open internal block is emitted once per completed child below it,
    the last emission is the final one
*/


// ---- LOCATOR ----
// Locator Documentation
/*
DOCUMENTATION:
MODULE: locator

FUNCTIONS:
  . string format(const FileIdentifier& identifier)
      - gnunet://fs/chk/<key>.<query>.<size>
  . FileIdentifier parse(const string& locator)
      - Throws LocatorError for anything format cannot produce
  . string locator_for_stream(istream& input, uint64_t size, ...)
  . string locator_for_file(const string& path, ...)
      - Throws io::IoError if the file cannot be opened or read
*/


// ---- LOGGER ----
// Logging Documentation
/*
DOCUMENTATION:
MODULE: logger

FUNCTIONS:
  . void init_logging(const string& log_file = "", severity_level min_level = warning)
      - Console sink on clog
      - File sink truncated on open when log_file is given
      - Format: timestamp [severity] message
  . void set_log_level(severity_level min_level)
  . optional<severity_level> parse_severity(const string& name)

USAGE:
  . BOOST_LOG_TRIVIAL(level) << "Component: message"
*/


// ---- CLI ----
// CLI Documentation
/*
DOCUMENTATION:
CLASS: CLI

VARIABLES:
  . const ProgramOptions options_
  . ostream& out_
      - Locator and block listing
  . ostream& err_
      - Progress and errors

CONSTRUCTOR:
  . CLI(const ProgramOptions& options, ostream& out, ostream& err)

METHODS:
  Public:
    . int run()
        - Prints the locator of options_.file
        - Returns 0 on success, 1 on any error

  Private:
    . void print_block(const BlockEvent& event)
    . void print_progress(uint64_t completed, uint64_t size, unsigned depth)
    . void log_and_display_error(const string& message, const string& error)

FUNCTIONS:
  . ProgramOptions parse_command_line(int argc, const char* const argv[], ostream& err)
      - valid is false on any usage error
  . void print_usage(const string& program_name, ostream& out)
*/
