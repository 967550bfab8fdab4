#ifndef FDFS_PROTOCOL_CODEC_HPP
#define FDFS_PROTOCOL_CODEC_HPP

#include <array>
#include <cstdint>
#include <string>
#include <variant>
#include "protocol/types.hpp"

namespace fdfs {
namespace protocol {

// One request type per command, each with its own field set

// Empty group name lets the tracker choose
struct QueryStoreRequest {
  std::string group_name;
};

struct QueryFetchRequest {
  std::string group_name;
  std::string remote_filename;
};

struct QueryUpdateRequest {
  std::string group_name;
  std::string remote_filename;
};

// Payload is borrowed and must outlive the encoded frame
struct UploadRequest {
  uint8_t store_path_index;
  std::string file_ext_name;
  const uint8_t* data;
  std::size_t size;
};

// A length of zero reads to the end of the file
struct DownloadRequest {
  std::string group_name;
  std::string remote_filename;
  uint64_t offset;
  uint64_t length;
};

struct DeleteRequest {
  std::string group_name;
  std::string remote_filename;
};

struct ActiveTestRequest {};

using Request = std::variant<QueryStoreRequest, QueryFetchRequest, QueryUpdateRequest,
                             UploadRequest, DownloadRequest, DeleteRequest, ActiveTestRequest>;

// Response shape of commands answering with an empty body
struct EmptyResponse {};


// Encoded request: header plus fixed fields, followed by an optional borrowed payload
struct Frame {
  Bytes head;
  const uint8_t* payload = nullptr;
  std::size_t payload_size = 0;

  // Total number of bytes on the wire
  std::size_t size() const { return head.size() + payload_size; }
  // Contiguous copy of the whole frame
  Bytes to_bytes() const;
};


// ---- HEADER ----
std::array<uint8_t, HEADER_LENGTH> encode_header(const Header& header);
// Throws FrameError for negative or implausibly large lengths
Header decode_header(const std::array<uint8_t, HEADER_LENGTH>& raw,
                     uint64_t max_body_length = MAX_BODY_LENGTH);


// ---- FRAMES ----
// Body length is computed from the fields and payload actually supplied
Frame encode(Command command, Bytes fields, const uint8_t* payload = nullptr, std::size_t payload_size = 0);
Frame encode(const Request& request);

// Throws FrameError unless the body holds exactly header.length bytes
void check_body_length(const Header& header, const Bytes& body);
// Throws FrameError unless a successful header carries the response command
void check_response_header(const Header& header);


// ---- CODEC TABLE ----
// Maps each request type to its command, encoder and response decoder
template <typename RequestT>
struct Codec;

template <>
struct Codec<QueryStoreRequest> {
  using Response = StoreTarget;
  static Command command(const QueryStoreRequest& request);
  static Frame encode(const QueryStoreRequest& request);
  static Response decode(const Header& header, const Bytes& body);
};

template <>
struct Codec<QueryFetchRequest> {
  using Response = StorageEndpoint;
  static Command command(const QueryFetchRequest&) { return Command::QUERY_FETCH_ONE; }
  static Frame encode(const QueryFetchRequest& request);
  static Response decode(const Header& header, const Bytes& body);
};

template <>
struct Codec<QueryUpdateRequest> {
  using Response = StorageEndpoint;
  static Command command(const QueryUpdateRequest&) { return Command::QUERY_UPDATE; }
  static Frame encode(const QueryUpdateRequest& request);
  static Response decode(const Header& header, const Bytes& body);
};

template <>
struct Codec<UploadRequest> {
  using Response = StoredFile;
  static Command command(const UploadRequest&) { return Command::UPLOAD_FILE; }
  static Frame encode(const UploadRequest& request);
  static Response decode(const Header& header, const Bytes& body);
};

template <>
struct Codec<DownloadRequest> {
  using Response = Bytes;
  static Command command(const DownloadRequest&) { return Command::DOWNLOAD_FILE; }
  static Frame encode(const DownloadRequest& request);
  static Response decode(const Header& header, const Bytes& body);
};

template <>
struct Codec<DeleteRequest> {
  using Response = EmptyResponse;
  static Command command(const DeleteRequest&) { return Command::DELETE_FILE; }
  static Frame encode(const DeleteRequest& request);
  static Response decode(const Header& header, const Bytes& body);
};

template <>
struct Codec<ActiveTestRequest> {
  using Response = EmptyResponse;
  static Command command(const ActiveTestRequest&) { return Command::ACTIVE_TEST; }
  static Frame encode(const ActiveTestRequest& request);
  static Response decode(const Header& header, const Bytes& body);
};


// ---- FIELD HELPERS ----
// Appends value null-padded to width; throws IdentifierError when it does not fit
void put_fixed_string(Bytes& out, const std::string& value, std::size_t width, const char* field);
void put_uint64(Bytes& out, uint64_t value);
// Reads a fixed-width field, trimming null and space padding
std::string get_fixed_string(const uint8_t* data, std::size_t width);
uint64_t get_uint64(const uint8_t* data);

} // namespace protocol
} // namespace fdfs

#endif // FDFS_PROTOCOL_CODEC_HPP
