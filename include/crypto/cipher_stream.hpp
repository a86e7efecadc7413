#ifndef GNTP_CRYPTO_CIPHER_STREAM_HPP
#define GNTP_CRYPTO_CIPHER_STREAM_HPP

#include <istream>
#include <ostream>
#include <vector>
#include <memory>
#include <optional>
#include <string>
#include <cstdint>
#include "crypto_error.hpp"

namespace gntp::crypto {

// Forward declaration for OpenSSL cipher context
struct CipherContext;

// Symmetric algorithms a sender may name on the request line
enum class Algorithm {
  NONE,
  AES,        // AES-192-CBC
  DES,        // DES-CBC
  TRIPLE_DES  // DES-EDE3-CBC
};

// Maps the wire names NONE, AES, DES and 3DES
std::optional<Algorithm> algorithm_from_string(const std::string& name);
const char* algorithm_to_string(Algorithm algorithm);

class CipherStream {
public:

  enum class Mode {
    Encrypt,
    Decrypt
  };

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  CipherStream();
  ~CipherStream();

  CipherStream(const CipherStream&) = delete;
  CipherStream& operator=(const CipherStream&) = delete;


  // ---- ALGORITHM PARAMETERS ----
  static std::size_t key_size(Algorithm algorithm);
  static std::size_t iv_size(Algorithm algorithm);
  static std::size_t block_size(Algorithm algorithm);

  // Generate an initialization vector sized for the configured algorithm
  std::vector<uint8_t> generate_IV() const;


  // ---- INITIALIZATION ----
  // Keys longer than the cipher needs are truncated to key_size(algorithm)
  void initialize(Algorithm algorithm, const std::vector<uint8_t>& key, const std::vector<uint8_t>& iv);


  // ---- ENCRYPTION/DECRYPTION OPERATIONS ----
  // Every call starts from a freshly initialized cipher with the same key and IV
  std::ostream& encrypt(std::istream& input, std::ostream& output);
  std::ostream& decrypt(std::istream& input, std::ostream& output);

  std::string encrypt(const std::string& plaintext);
  std::string decrypt(const std::string& ciphertext);


  // ---- GETTERS/SETTERS ----
  Algorithm getAlgorithm() const { return algorithm_; }
  void setMode(Mode mode) { mode_ = mode; }
  Mode getMode() const { return mode_; }

private:
  // ---- PARAMETERS ----
  Algorithm algorithm_ = Algorithm::NONE;
  std::vector<uint8_t> key_;
  std::vector<uint8_t> iv_;
  std::unique_ptr<CipherContext> context_;
  bool is_initialized_ = false;
  Mode mode_ = Mode::Encrypt;
  static constexpr size_t BUFFER_SIZE = 8192;


  // ---- INITIALIZATION ----
  // Initializes cipher context
  void initializeCipher(bool encrypting);


  // ---- STREAM PROCESSING - ENCRYPTION/DECRYPTION ----
  // Process data through OpenSSL cipher context
  void processStream(std::istream& input, std::ostream& output, bool encrypting);
  // Copies the input unchanged when the algorithm is NONE
  void passThrough(std::istream& input, std::ostream& output);
  // Performs the main encryption/decryption loop on the input stream
  void processStreamData(std::istream& input, std::ostream& output, bool encrypting);
  // Encrypts or decrypts a single block of data using the configured cipher
  size_t processDataBlock(const uint8_t* inbuf, size_t bytes_read, uint8_t* outbuf,
                        bool encrypting);
  // Safely writes a block of processed data to the output stream
  void writeOutputBlock(std::ostream& output, const uint8_t* data, size_t length);
  // Handles the final block with padding in encryption/decryption operations
  void processFinalBlock(uint8_t* outbuf, int& outlen, bool encrypting);
};

} // namespace gntp::crypto

#endif // GNTP_CRYPTO_CIPHER_STREAM_HPP
