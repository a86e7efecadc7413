#ifndef GNTP_PROTOCOL_HEADER_BLOCK_HPP
#define GNTP_PROTOCOL_HEADER_BLOCK_HPP

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace gntp {
namespace protocol {

// Ordered "Key: Value" map for one header block. Keys are unique; setting an
// existing key replaces its value in place.
class HeaderBlock {
public:
  using Entry = std::pair<std::string, std::string>;
  using const_iterator = std::vector<Entry>::const_iterator;

  void set(const std::string& key, const std::string& value);

  std::optional<std::string> get(const std::string& key) const;
  std::string get_or(const std::string& key, const std::string& fallback) const;
  bool has(const std::string& key) const;

  bool empty() const { return entries_.empty(); }
  std::size_t size() const { return entries_.size(); }
  void clear() { entries_.clear(); }

  const_iterator begin() const { return entries_.begin(); }
  const_iterator end() const { return entries_.end(); }

private:
  std::vector<Entry> entries_;
};

// Splits a header line on its first colon and stores it in headers. The value
// is trimmed. Throws GntpException(INVALID_REQUEST) if the line has no colon.
HeaderBlock::Entry parse_header(const std::string& line, HeaderBlock& headers);

// Returns the identifier if value is an x-growl-resource:// reference
std::optional<std::string> resource_reference(const std::string& value);

} // namespace protocol
} // namespace gntp

#endif // GNTP_PROTOCOL_HEADER_BLOCK_HPP
