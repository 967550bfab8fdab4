#ifndef FDFS_PROTOCOL_ERRORS_HPP
#define FDFS_PROTOCOL_ERRORS_HPP

#include <cstdint>
#include <stdexcept>
#include <string>

namespace fdfs {

// Connection level failure kinds
enum class TransportErrorCode {
  CONNECTION_REFUSED,
  CONNECTION_FAILED,
  CONNECTION_LOST,
  RESOLVE_FAILED,
  TIMEOUT,
  CANCELLED
};

inline const char* transport_error_to_string(TransportErrorCode code) {
  switch (code) {
    case TransportErrorCode::CONNECTION_REFUSED: return "Connection refused";
    case TransportErrorCode::CONNECTION_FAILED: return "Connection failed";
    case TransportErrorCode::CONNECTION_LOST: return "Connection lost";
    case TransportErrorCode::RESOLVE_FAILED: return "Resolve failed";
    case TransportErrorCode::TIMEOUT: return "Timeout";
    case TransportErrorCode::CANCELLED: return "Cancelled";
    default: return "Undefined error";
  }
}

enum class StorageErrorCode {
  NOT_FOUND,
  SERVER_ERROR
};

// Describes a server status byte, which carries an errno value
std::string describe_status(uint8_t status);


class FdfsError : public std::runtime_error {
public:
  explicit FdfsError(const std::string& message)
    : std::runtime_error(message) {}
};

// Malformed header or body; the connection is out of sync
class FrameError : public FdfsError {
public:
  explicit FrameError(const std::string& message)
    : FdfsError("Frame error: " + message) {}
};

class TransportError : public FdfsError {
public:
  TransportError(TransportErrorCode code, const std::string& message)
    : FdfsError(std::string("Transport error (") + transport_error_to_string(code) + "): " + message)
    , code_(code) {}

  TransportErrorCode code() const { return code_; }

private:
  TransportErrorCode code_;
};

// Valid negative answer from a tracker
class TrackerError : public FdfsError {
public:
  TrackerError(uint8_t status, const std::string& message)
    : FdfsError("Tracker error: " + message + " (" + describe_status(status) + ")")
    , status_(status) {}

  uint8_t status() const { return status_; }

private:
  uint8_t status_;
};

class StorageError : public FdfsError {
public:
  StorageError(uint8_t status, const std::string& message)
    : FdfsError("Storage error: " + message + " (" + describe_status(status) + ")")
    , status_(status)
    , code_(code_for_status(status)) {}

  uint8_t status() const { return status_; }
  StorageErrorCode code() const { return code_; }
  bool not_found() const { return code_ == StorageErrorCode::NOT_FOUND; }

  static StorageErrorCode code_for_status(uint8_t status);

private:
  uint8_t status_;
  StorageErrorCode code_;
};

class IdentifierError : public FdfsError {
public:
  explicit IdentifierError(const std::string& message)
    : FdfsError("Identifier error: " + message) {}
};

class ConfigError : public FdfsError {
public:
  explicit ConfigError(const std::string& message)
    : FdfsError("Config error: " + message) {}
};

class LocalFileError : public FdfsError {
public:
  explicit LocalFileError(const std::string& message)
    : FdfsError("Local file error: " + message) {}
};

} // namespace fdfs

#endif // FDFS_PROTOCOL_ERRORS_HPP
