#include "protocol/resource_reader.hpp"
#include "protocol/constants.hpp"
#include "protocol/gntp_error.hpp"
#include <algorithm>
#include <cctype>
#include <boost/algorithm/string/trim.hpp>
#include <boost/log/trivial.hpp>

namespace gntp {
namespace protocol {

ResourceReader::ResourceReader(LineReader& reader, const EncryptionLayer& encryption, store::ResourceStore& store)
  : reader_(reader)
  , encryption_(encryption)
  , store_(store) {}

Resource ResourceReader::read(const HeaderBlock& headers) {
  auto identifier = headers.get(headers::RESOURCE_IDENTIFIER);
  if (!identifier || identifier->empty()) {
    throw GntpException(ErrorCode::INVALID_REQUEST, "Resource without Identifier header");
  }
  auto length_value = headers.get(headers::RESOURCE_LENGTH);
  if (!length_value) {
    throw GntpException(ErrorCode::INVALID_REQUEST, "Resource without Length header");
  }

  Resource resource;
  resource.identifier = *identifier;
  resource.length = parse_length(*length_value);
  resource.headers = headers;

  store::CacheSlot slot = store_.acquire_cache_slot(resource.identifier, headers);
  resource.cached = slot.already_cached;
  resource.location = slot.location;

  BOOST_LOG_TRIVIAL(debug) << "Resource reader: Reading " << resource.length << " bytes for "
                           << resource.identifier << (slot.already_cached ? " (cached)" : "");

  if (slot.already_cached) {
    reader_.read_bytes(resource.length);
  } else {
    try {
      const std::string payload = encryption_.decrypt(reader_.read_bytes(resource.length));
      if (slot.sink) {
        slot.sink->write(payload.data(), static_cast<std::streamsize>(payload.size()));
        slot.sink->flush();
      }
    } catch (...) {
      store_.abandon_cache_slot(slot);
      throw;
    }
    store_.commit_cache_slot(slot);
  }

  // Each payload is followed by exactly one blank line
  std::string line;
  if (!reader_.read_line(line)) {
    throw EndOfStream("after resource " + resource.identifier);
  }
  boost::algorithm::trim(line);
  if (!line.empty()) {
    throw GntpException(ErrorCode::INVALID_REQUEST, "Expected blank line after resource, not: " + line);
  }

  return resource;
}

std::uint64_t ResourceReader::parse_length(const std::string& value) {
  const bool all_digits = !value.empty() &&
      std::all_of(value.begin(), value.end(), [](unsigned char c) { return std::isdigit(c); });
  if (!all_digits || value.size() > 19) {
    throw GntpException(ErrorCode::INVALID_REQUEST, "Invalid resource length: " + value);
  }

  const std::uint64_t length = std::stoull(value);
  if (length > MAX_RESOURCE_LENGTH) {
    throw GntpException(ErrorCode::INVALID_REQUEST, "Resource too large: " + value);
  }
  return length;
}

} // namespace protocol
} // namespace gntp
