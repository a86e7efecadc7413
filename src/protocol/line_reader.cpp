#include "protocol/line_reader.hpp"
#include "protocol/gntp_error.hpp"
#include <algorithm>
#include <array>
#include <boost/log/trivial.hpp>

namespace gntp {
namespace protocol {

LineReader::LineReader(std::istream& input)
  : input_(input) {
}

//==============================================
// LINE OPERATIONS
//==============================================

bool LineReader::read_line(std::string& line) {
  if (!queued_lines_.empty()) {
    line = std::move(queued_lines_.front());
    queued_lines_.pop_front();
    return true;
  }

  line.clear();
  bool read_any = false;
  std::istream::int_type c;
  while ((c = input_.get()) != std::istream::traits_type::eof()) {
    ++bytes_consumed_;
    read_any = true;
    if (c == '\n') {
      break;
    }
    if (line.size() >= MAX_LINE_LENGTH) {
      throw GntpException(ErrorCode::INVALID_REQUEST, "Line exceeds maximum length");
    }
    line.push_back(static_cast<char>(c));
  }

  if (!read_any) {
    return false;
  }

  if (!line.empty() && line.back() == '\r') {
    line.pop_back();
  }
  return true;
}

//==============================================
// BLOCK OPERATIONS
//==============================================

std::string LineReader::read_bytes(std::uint64_t count) {
  if (!queued_lines_.empty()) {
    throw GntpException(ErrorCode::INVALID_REQUEST, "Binary data inside an encrypted header block");
  }

  std::string data;
  std::array<char, 8192> buffer;
  std::uint64_t remaining = count;

  // Read in chunks so a bogus length cannot force one huge allocation up front
  while (remaining > 0) {
    const auto chunk = static_cast<std::streamsize>(
        std::min<std::uint64_t>(remaining, buffer.size()));
    input_.read(buffer.data(), chunk);
    const auto bytes_read = input_.gcount();
    if (bytes_read <= 0) {
      throw EndOfStream("expected " + std::to_string(remaining) + " more bytes of binary data");
    }
    data.append(buffer.data(), static_cast<std::size_t>(bytes_read));
    remaining -= static_cast<std::uint64_t>(bytes_read);
    bytes_consumed_ += static_cast<std::uint64_t>(bytes_read);
  }

  return data;
}

void LineReader::read_encrypted_block(const EncryptionLayer& encryption) {
  if (!encryption.enabled()) {
    return;
  }

  static const std::string terminator = "\r\n\r\n";
  std::string ciphertext;
  std::istream::int_type c;

  while ((c = input_.get()) != std::istream::traits_type::eof()) {
    ++bytes_consumed_;
    ciphertext.push_back(static_cast<char>(c));
    if (ciphertext.size() >= terminator.size() &&
        ciphertext.compare(ciphertext.size() - terminator.size(), terminator.size(), terminator) == 0) {
      ciphertext.resize(ciphertext.size() - terminator.size());
      BOOST_LOG_TRIVIAL(debug) << "Line reader: Read " << ciphertext.size() << " bytes of encrypted headers";
      queue_lines(encryption.decrypt(ciphertext));
      return;
    }
    if (ciphertext.size() > MAX_ENCRYPTED_BLOCK_SIZE) {
      throw GntpException(ErrorCode::INVALID_REQUEST, "Encrypted header block too large");
    }
  }

  throw EndOfStream("inside encrypted header block");
}

void LineReader::queue_lines(const std::string& plaintext) {
  std::size_t start = 0;
  while (start < plaintext.size()) {
    std::size_t end = plaintext.find('\n', start);
    if (end == std::string::npos) {
      end = plaintext.size();
    }
    std::string line = plaintext.substr(start, end - start);
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    queued_lines_.push_back(std::move(line));
    start = end + 1;
  }

  // The CRLF CRLF after the ciphertext closes the last header block
  if (queued_lines_.empty() || !queued_lines_.back().empty()) {
    queued_lines_.emplace_back();
  }

  BOOST_LOG_TRIVIAL(debug) << "Line reader: Queued " << queued_lines_.size() << " decrypted header lines";
}

} // namespace protocol
} // namespace gntp
