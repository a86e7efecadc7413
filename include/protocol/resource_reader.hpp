#ifndef GNTP_PROTOCOL_RESOURCE_READER_HPP
#define GNTP_PROTOCOL_RESOURCE_READER_HPP

#include <cstdint>
#include "protocol/encryption_layer.hpp"
#include "protocol/header_block.hpp"
#include "protocol/line_reader.hpp"
#include "protocol/resource.hpp"
#include "store/resource_store.hpp"

namespace gntp {
namespace protocol {

/**
 * Reads the payload that follows one resource header block:
 *   Identifier: <id>
 *   Length: <n>
 *   <blank line>
 *   <n bytes>
 *   <blank line>
 * The payload is always consumed off the wire, even when the store already
 * holds it.
 */
class ResourceReader {
public:
  static constexpr std::uint64_t MAX_RESOURCE_LENGTH = 64ull * 1024 * 1024;

  ResourceReader(LineReader& reader, const EncryptionLayer& encryption, store::ResourceStore& store);

  // Throws GntpException(INVALID_REQUEST) for missing or malformed headers and
  // for anything but a blank line after the payload; EndOfStream if the stream
  // ends early
  Resource read(const HeaderBlock& headers);

private:
  LineReader& reader_;
  const EncryptionLayer& encryption_;
  store::ResourceStore& store_;

  static std::uint64_t parse_length(const std::string& value);
};

} // namespace protocol
} // namespace gntp

#endif // GNTP_PROTOCOL_RESOURCE_READER_HPP
