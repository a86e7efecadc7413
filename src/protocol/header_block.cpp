#include "protocol/header_block.hpp"
#include "protocol/constants.hpp"
#include "protocol/gntp_error.hpp"
#include <algorithm>
#include <boost/algorithm/string/predicate.hpp>
#include <boost/algorithm/string/trim.hpp>

namespace gntp {
namespace protocol {

void HeaderBlock::set(const std::string& key, const std::string& value) {
  auto it = std::find_if(entries_.begin(), entries_.end(),
                         [&key](const Entry& entry) { return entry.first == key; });
  if (it != entries_.end()) {
    it->second = value;
  } else {
    entries_.emplace_back(key, value);
  }
}

std::optional<std::string> HeaderBlock::get(const std::string& key) const {
  auto it = std::find_if(entries_.begin(), entries_.end(),
                         [&key](const Entry& entry) { return entry.first == key; });
  if (it == entries_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::string HeaderBlock::get_or(const std::string& key, const std::string& fallback) const {
  auto value = get(key);
  return value ? *value : fallback;
}

bool HeaderBlock::has(const std::string& key) const {
  return get(key).has_value();
}

HeaderBlock::Entry parse_header(const std::string& line, HeaderBlock& headers) {
  const auto colon = line.find(':');
  if (colon == std::string::npos) {
    throw GntpException(ErrorCode::INVALID_REQUEST, "Unable to parse header: " + line);
  }

  std::string key = line.substr(0, colon);
  std::string value = boost::algorithm::trim_copy(line.substr(colon + 1));
  if (key.empty()) {
    throw GntpException(ErrorCode::INVALID_REQUEST, "Empty header name: " + line);
  }

  headers.set(key, value);
  return {key, value};
}

std::optional<std::string> resource_reference(const std::string& value) {
  if (!boost::algorithm::starts_with(value, RESOURCE_URI_PREFIX)) {
    return std::nullopt;
  }

  std::string identifier = value.substr(std::char_traits<char>::length(RESOURCE_URI_PREFIX));
  if (identifier.empty()) {
    throw GntpException(ErrorCode::INVALID_REQUEST, "Resource reference without identifier");
  }
  return identifier;
}

} // namespace protocol
} // namespace gntp
