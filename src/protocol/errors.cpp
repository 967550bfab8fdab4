#include "protocol/errors.hpp"
#include <cerrno>
#include <cstring>

namespace fdfs {

std::string describe_status(uint8_t status) {
  return "status " + std::to_string(static_cast<int>(status)) + ": " + std::strerror(status);
}

StorageErrorCode StorageError::code_for_status(uint8_t status) {
  // Other codes vary between server versions
  if (status == ENOENT) {
    return StorageErrorCode::NOT_FOUND;
  }
  return StorageErrorCode::SERVER_ERROR;
}

} // namespace fdfs
