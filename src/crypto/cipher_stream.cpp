#include "crypto/cipher_stream.hpp"
#include <openssl/evp.h>
#include <openssl/err.h>
#include <openssl/rand.h>
#include <array>
#include <sstream>
#include <stdexcept>
#include <boost/log/trivial.hpp>

namespace gntp::crypto {

//=================================================
// RAII WRAPPER TO MANAGE CIPHER CONTEXT LIFECYCLE
//=================================================

struct CipherContext {
  EVP_CIPHER_CTX* ctx = nullptr;

  CipherContext() {
    ctx = EVP_CIPHER_CTX_new();
    if (!ctx) {
      throw InitializationError("Cipher stream: Failed to create cipher context");
    }
  }

  ~CipherContext() {
    if (ctx) {
      EVP_CIPHER_CTX_free(ctx);
    }
  }

  EVP_CIPHER_CTX* get() { return ctx; }
};

namespace {

const EVP_CIPHER* evp_cipher(Algorithm algorithm) {
  switch (algorithm) {
    case Algorithm::AES:        return EVP_aes_192_cbc();
    case Algorithm::DES:        return EVP_des_cbc();
    case Algorithm::TRIPLE_DES: return EVP_des_ede3_cbc();
    case Algorithm::NONE:       break;
  }
  return nullptr;
}

} // namespace

//==============================================
// ALGORITHM NAMES
//==============================================

std::optional<Algorithm> algorithm_from_string(const std::string& name) {
  if (name == "NONE") return Algorithm::NONE;
  if (name == "AES")  return Algorithm::AES;
  if (name == "DES")  return Algorithm::DES;
  if (name == "3DES") return Algorithm::TRIPLE_DES;
  return std::nullopt;
}

const char* algorithm_to_string(Algorithm algorithm) {
  switch (algorithm) {
    case Algorithm::NONE:       return "NONE";
    case Algorithm::AES:        return "AES";
    case Algorithm::DES:        return "DES";
    case Algorithm::TRIPLE_DES: return "3DES";
  }
  return "UNKNOWN";
}

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

CipherStream::CipherStream()
  : context_(std::make_unique<CipherContext>()) {
  BOOST_LOG_TRIVIAL(trace) << "Cipher stream: CipherStream created";
}

CipherStream::~CipherStream() = default;

//==============================================
// ALGORITHM PARAMETERS
//==============================================

std::size_t CipherStream::key_size(Algorithm algorithm) {
  switch (algorithm) {
    case Algorithm::AES:        return 24;
    case Algorithm::DES:        return 8;
    case Algorithm::TRIPLE_DES: return 24;
    case Algorithm::NONE:       break;
  }
  return 0;
}

std::size_t CipherStream::iv_size(Algorithm algorithm) {
  switch (algorithm) {
    case Algorithm::AES:        return 16;
    case Algorithm::DES:        return 8;
    case Algorithm::TRIPLE_DES: return 8;
    case Algorithm::NONE:       break;
  }
  return 0;
}

std::size_t CipherStream::block_size(Algorithm algorithm) {
  // CBC block size equals the IV size for every supported cipher
  return iv_size(algorithm);
}

//==============================================
// CRYPTO UNIT INITIALIZATION
//==============================================

void CipherStream::initialize(Algorithm algorithm, const std::vector<uint8_t>& key,
                              const std::vector<uint8_t>& iv) {
  BOOST_LOG_TRIVIAL(debug) << "Cipher stream: Initializing " << algorithm_to_string(algorithm)
                           << " parameters";

  if (algorithm == Algorithm::NONE) {
    algorithm_ = algorithm;
    key_.clear();
    iv_.clear();
    is_initialized_ = true;
    return;
  }

  const std::size_t required_key = key_size(algorithm);
  if (key.size() < required_key) {
    BOOST_LOG_TRIVIAL(error) << "Cipher stream: Key too short: " << key.size()
                             << " bytes (expected at least " << required_key << " bytes)";
    throw InitializationError("Key too short for " + std::string(algorithm_to_string(algorithm)));
  }

  if (iv.size() != iv_size(algorithm)) {
    BOOST_LOG_TRIVIAL(error) << "Cipher stream: Invalid IV size: " << iv.size()
                             << " bytes (expected " << iv_size(algorithm) << " bytes)";
    throw InitializationError("Invalid IV size for " + std::string(algorithm_to_string(algorithm)));
  }

  algorithm_ = algorithm;
  key_.assign(key.begin(), key.begin() + required_key);
  iv_ = iv;
  is_initialized_ = true;
  BOOST_LOG_TRIVIAL(trace) << "Cipher stream: Crypto parameters initialized successfully";
}

void CipherStream::initializeCipher(bool encrypting) {
  if (!is_initialized_) {
    throw InitializationError("Cipher stream: CipherStream not initialized");
  }

  // Reset the context so that no state carries over from a previous block
  EVP_CIPHER_CTX_reset(context_->get());

  const EVP_CIPHER* cipher = evp_cipher(algorithm_);
  if (!cipher) {
    throw InitializationError("Cipher stream: Cipher unavailable");
  }

  if (encrypting) {
    if (!EVP_EncryptInit_ex(context_->get(), cipher, nullptr, key_.data(), iv_.data())) {
      throw EncryptionError("Cipher stream: Failed to initialize encryption context");
    }
  } else {
    if (!EVP_DecryptInit_ex(context_->get(), cipher, nullptr, key_.data(), iv_.data())) {
      throw DecryptionError("Cipher stream: Failed to initialize decryption context");
    }
  }
}

//==============================================
// STREAM PROCESSING - ENCRYPTION/DECRYPTION
//==============================================

void CipherStream::processStream(std::istream& input, std::ostream& output, bool encrypting) {
  BOOST_LOG_TRIVIAL(debug) << "Cipher stream: Starting stream " << (encrypting ? "encryption" : "decryption");

  if (!is_initialized_) {
    throw InitializationError("Cipher stream: CipherStream not initialized");
  }

  if (!input.good() || !output.good()) {
    throw CryptoError("Cipher stream: Invalid stream state");
  }

  if (algorithm_ == Algorithm::NONE) {
    passThrough(input, output);
    return;
  }

  initializeCipher(encrypting);
  processStreamData(input, output, encrypting);
  output.flush();
}

void CipherStream::passThrough(std::istream& input, std::ostream& output) {
  std::array<char, BUFFER_SIZE> buffer;
  while (input.read(buffer.data(), buffer.size()) || input.gcount() > 0) {
    writeOutputBlock(output, reinterpret_cast<const uint8_t*>(buffer.data()),
                     static_cast<size_t>(input.gcount()));
  }
}

void CipherStream::processStreamData(std::istream& input, std::ostream& output, bool encrypting) {
  std::array<uint8_t, BUFFER_SIZE> inbuf;
  std::array<uint8_t, BUFFER_SIZE + EVP_MAX_BLOCK_LENGTH> outbuf;
  size_t block_count = 0;
  size_t total_bytes_processed = 0;

  // Process the input stream in chunks
  while (input.good() && !input.eof()) {
    input.read(reinterpret_cast<char*>(inbuf.data()), inbuf.size());
    auto bytes_read = input.gcount();

    if (bytes_read <= 0) {
      if (!input.eof()) {
        throw CryptoError("Cipher stream: Failed to read from input stream");
      }
      break;
    }

    auto outlen = processDataBlock(inbuf.data(), static_cast<size_t>(bytes_read), outbuf.data(), encrypting);
    writeOutputBlock(output, outbuf.data(), outlen);
    total_bytes_processed += outlen;
    block_count++;
  }

  // Process final block with padding
  int final_outlen = 0;
  processFinalBlock(outbuf.data(), final_outlen, encrypting);
  writeOutputBlock(output, outbuf.data(), static_cast<size_t>(final_outlen));
  total_bytes_processed += final_outlen;

  BOOST_LOG_TRIVIAL(debug) << "Cipher stream: Completed " << (encrypting ? "encryption" : "decryption")
                           << ": Processed " << total_bytes_processed
                           << " bytes in " << block_count << " blocks";
}

size_t CipherStream::processDataBlock(const uint8_t* inbuf, size_t bytes_read, uint8_t* outbuf,
                                      bool encrypting) {
  int outlen = 0;
  if (encrypting) {
    if (!EVP_EncryptUpdate(context_->get(), outbuf, &outlen,
                           inbuf, static_cast<int>(bytes_read))) {
      throw EncryptionError("Cipher stream: Failed to encrypt data block");
    }
  } else {
    if (!EVP_DecryptUpdate(context_->get(), outbuf, &outlen,
                           inbuf, static_cast<int>(bytes_read))) {
      throw DecryptionError("Cipher stream: Failed to decrypt data block");
    }
  }
  return static_cast<size_t>(outlen);
}

void CipherStream::writeOutputBlock(std::ostream& output, const uint8_t* data, size_t length) {
  if (length > 0) {
    output.write(reinterpret_cast<const char*>(data), static_cast<std::streamsize>(length));
    if (!output.good()) {
      throw CryptoError("Cipher stream: Failed to write to output stream");
    }
  }
}

void CipherStream::processFinalBlock(uint8_t* outbuf, int& outlen, bool encrypting) {
  if (encrypting) {
    if (!EVP_EncryptFinal_ex(context_->get(), outbuf, &outlen)) {
      throw EncryptionError("Cipher stream: Failed to finalize encryption");
    }
  } else {
    if (!EVP_DecryptFinal_ex(context_->get(), outbuf, &outlen)) {
      // Leave nothing behind for the next caller on this thread
      ERR_clear_error();
      throw DecryptionError("Cipher stream: Bad padding or corrupted ciphertext");
    }
  }
}

//==============================================
// ENCRYPTION/DECRYPTION OPERATIONS
//==============================================

std::ostream& CipherStream::encrypt(std::istream& input, std::ostream& output) {
  processStream(input, output, true);
  return output;
}

std::ostream& CipherStream::decrypt(std::istream& input, std::ostream& output) {
  processStream(input, output, false);
  return output;
}

std::string CipherStream::encrypt(const std::string& plaintext) {
  std::istringstream input(plaintext);
  std::ostringstream output;
  encrypt(input, output);
  return output.str();
}

std::string CipherStream::decrypt(const std::string& ciphertext) {
  std::istringstream input(ciphertext);
  std::ostringstream output;
  decrypt(input, output);
  return output.str();
}

//==============================================
// PUBLIC IV GENERATION METHOD
//==============================================

std::vector<uint8_t> CipherStream::generate_IV() const {
  std::vector<uint8_t> iv(iv_size(algorithm_));
  if (iv.empty()) {
    return iv;
  }

  if (RAND_bytes(iv.data(), static_cast<int>(iv.size())) != 1) {
    throw CryptoError("Cipher stream: Failed to generate random IV");
  }

  BOOST_LOG_TRIVIAL(trace) << "Cipher stream: Generated initialization vector";
  return iv;
}

} // namespace gntp::crypto
