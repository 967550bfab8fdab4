#ifndef FDFS_PROTOCOL_TYPES_HPP
#define FDFS_PROTOCOL_TYPES_HPP

#include <cstdint>
#include <string>
#include <vector>

namespace fdfs {
namespace protocol {

using Bytes = std::vector<uint8_t>;

// ---- WIRE CONSTANTS ----
constexpr std::size_t HEADER_LENGTH = 10;
constexpr std::size_t LENGTH_FIELD_SIZE = 8;
constexpr std::size_t GROUP_NAME_MAX_LENGTH = 16;
// Addresses travel as 15 bytes, the server's 16-byte buffer minus its terminator
constexpr std::size_t IP_ADDRESS_LENGTH = 15;
constexpr std::size_t FILE_EXT_NAME_MAX_LENGTH = 6;

// group + ip + port
constexpr std::size_t FETCH_RESPONSE_LENGTH = GROUP_NAME_MAX_LENGTH + IP_ADDRESS_LENGTH + LENGTH_FIELD_SIZE;
// group + ip + port + store path index
constexpr std::size_t STORE_RESPONSE_LENGTH = FETCH_RESPONSE_LENGTH + 1;

// Ceiling applied to every declared body length
constexpr uint64_t MAX_BODY_LENGTH = 1ULL << 40;

constexpr uint16_t TRACKER_DEFAULT_PORT = 22122;
constexpr uint16_t STORAGE_DEFAULT_PORT = 23000;


// Command codes, bit-for-bit as the tracker and storage servers expect them
enum class Command : uint8_t {
  UPLOAD_FILE = 11,
  DELETE_FILE = 12,
  DOWNLOAD_FILE = 14,
  RESPONSE = 100,
  QUERY_STORE_WITHOUT_GROUP = 101,
  QUERY_FETCH_ONE = 102,
  QUERY_UPDATE = 103,
  QUERY_STORE_WITH_GROUP = 104,
  ACTIVE_TEST = 111
};

const char* command_to_string(Command command);


// Fixed ten byte frame header
struct Header {
  uint64_t length;
  uint8_t command;
  uint8_t status;
};


// Network location of a tracker or storage node
struct Address {
  std::string host;
  uint16_t port;

  std::string to_string() const;
};

bool operator==(const Address& lhs, const Address& rhs);
bool operator!=(const Address& lhs, const Address& rhs);


// Storage node nominated by a tracker, valid for one operation only
struct StorageEndpoint {
  std::string group_name;
  Address address;
};

// Tracker answer to a store query
struct StoreTarget {
  StorageEndpoint endpoint;
  uint8_t store_path_index;
};

// Group and remote filename as reported by a storage node after an upload
struct StoredFile {
  std::string group_name;
  std::string remote_filename;
};

} // namespace protocol
} // namespace fdfs

#endif // FDFS_PROTOCOL_TYPES_HPP
