#ifndef GNTP_PROTOCOL_LINE_READER_HPP
#define GNTP_PROTOCOL_LINE_READER_HPP

#include <cstdint>
#include <deque>
#include <istream>
#include <string>
#include "protocol/encryption_layer.hpp"

namespace gntp {
namespace protocol {

class LineReader {
public:
  static constexpr std::size_t MAX_LINE_LENGTH = 64 * 1024;
  static constexpr std::size_t MAX_ENCRYPTED_BLOCK_SIZE = 4 * 1024 * 1024;

  // ---- CONSTRUCTOR ----
  explicit LineReader(std::istream& input);


  // ---- LINE OPERATIONS ----
  // Reads the next line without its "\n" or "\r\n" terminator. Lines queued by
  // read_encrypted_block() are returned first.
  // @return false once the stream has ended and nothing is left to read
  bool read_line(std::string& line);


  // ---- BLOCK OPERATIONS ----
  // Reads exactly count raw bytes. Throws EndOfStream if the stream ends early.
  std::string read_bytes(std::uint64_t count);
  // Reads the ciphertext header block that ends at the first CRLF CRLF, decrypts
  // it and queues its lines, followed by the blank line that closes the block.
  // Does nothing when encryption is disabled.
  void read_encrypted_block(const EncryptionLayer& encryption);


  // ---- GETTERS ----
  std::uint64_t bytes_consumed() const { return bytes_consumed_; }
  bool has_queued_lines() const { return !queued_lines_.empty(); }

private:
  // ---- PARAMETERS ----
  std::istream& input_;
  std::deque<std::string> queued_lines_;
  std::uint64_t bytes_consumed_ = 0;

  // Splits decrypted plaintext into queued lines
  void queue_lines(const std::string& plaintext);
};

} // namespace protocol
} // namespace gntp

#endif // GNTP_PROTOCOL_LINE_READER_HPP
