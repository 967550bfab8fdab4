#include "client/file_id.hpp"
#include "protocol/errors.hpp"
#include "protocol/types.hpp"

namespace fdfs {
namespace client {

FileId FileId::parse(const std::string& text) {
  std::string remainder = text;

  // Drop scheme and host of a URL; "://" further along is part of a bare path
  std::size_t scheme_end = remainder.find("://");
  if (scheme_end != std::string::npos && scheme_end < remainder.find('/')) {
    std::size_t path_start = remainder.find('/', scheme_end + 3);
    if (path_start == std::string::npos) {
      throw IdentifierError("URL has no group segment: " + text);
    }
    remainder = remainder.substr(path_start + 1);
  }

  std::size_t separator = remainder.find('/');
  if (separator == std::string::npos) {
    throw IdentifierError("no group separator in: " + text);
  }

  FileId id;
  id.group_name = remainder.substr(0, separator);
  id.remote_filename = remainder.substr(separator + 1);

  if (id.group_name.empty()) {
    throw IdentifierError("empty group name in: " + text);
  }
  if (id.group_name.size() > protocol::GROUP_NAME_MAX_LENGTH) {
    throw IdentifierError("group name longer than " +
                          std::to_string(protocol::GROUP_NAME_MAX_LENGTH) + " bytes in: " + text);
  }
  if (id.remote_filename.empty()) {
    throw IdentifierError("empty remote path in: " + text);
  }
  return id;
}

std::string FileId::to_string() const {
  return group_name + "/" + remote_filename;
}

std::string FileId::format(const std::string& base_url) const {
  if (base_url.empty()) {
    return to_string();
  }
  std::string base = base_url;
  while (!base.empty() && base.back() == '/') {
    base.pop_back();
  }
  return base + "/" + to_string();
}

bool operator==(const FileId& lhs, const FileId& rhs) {
  return lhs.group_name == rhs.group_name && lhs.remote_filename == rhs.remote_filename;
}

bool operator!=(const FileId& lhs, const FileId& rhs) {
  return !(lhs == rhs);
}

} // namespace client
} // namespace fdfs
