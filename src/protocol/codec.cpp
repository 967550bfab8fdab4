#include "protocol/codec.hpp"
#include "protocol/errors.hpp"
#include <boost/endian/conversion.hpp>
#include <boost/log/trivial.hpp>
#include <algorithm>
#include <cstring>
#include <limits>

namespace fdfs {
namespace protocol {

//==============================================
// TYPES
//==============================================

const char* command_to_string(Command command) {
  switch (command) {
    case Command::UPLOAD_FILE: return "upload-file";
    case Command::DELETE_FILE: return "delete-file";
    case Command::DOWNLOAD_FILE: return "download-file";
    case Command::RESPONSE: return "response";
    case Command::QUERY_STORE_WITHOUT_GROUP: return "query-store-without-group";
    case Command::QUERY_FETCH_ONE: return "query-fetch-one";
    case Command::QUERY_UPDATE: return "query-update";
    case Command::QUERY_STORE_WITH_GROUP: return "query-store-with-group";
    case Command::ACTIVE_TEST: return "active-test";
    default: return "unknown";
  }
}

std::string Address::to_string() const {
  return host + ":" + std::to_string(port);
}

bool operator==(const Address& lhs, const Address& rhs) {
  return lhs.host == rhs.host && lhs.port == rhs.port;
}

bool operator!=(const Address& lhs, const Address& rhs) {
  return !(lhs == rhs);
}

Bytes Frame::to_bytes() const {
  Bytes bytes(head);
  if (payload_size > 0) {
    bytes.insert(bytes.end(), payload, payload + payload_size);
  }
  return bytes;
}

//==============================================
// FIELD HELPERS
//==============================================

void put_fixed_string(Bytes& out, const std::string& value, std::size_t width, const char* field) {
  if (value.size() > width) {
    throw IdentifierError(std::string(field) + " longer than " + std::to_string(width) + " bytes: " + value);
  }
  out.insert(out.end(), value.begin(), value.end());
  out.insert(out.end(), width - value.size(), '\0');
}

void put_uint64(Bytes& out, uint64_t value) {
  uint64_t network_value = boost::endian::native_to_big(value);
  const uint8_t* raw = reinterpret_cast<const uint8_t*>(&network_value);
  out.insert(out.end(), raw, raw + sizeof(network_value));
}

std::string get_fixed_string(const uint8_t* data, std::size_t width) {
  const uint8_t* end = std::find(data, data + width, '\0');
  std::string value(reinterpret_cast<const char*>(data), end - data);
  value.erase(value.find_last_not_of(' ') + 1);
  return value;
}

uint64_t get_uint64(const uint8_t* data) {
  uint64_t network_value;
  std::memcpy(&network_value, data, sizeof(network_value));
  return boost::endian::big_to_native(network_value);
}

namespace {

void check_fixed_length(const Header& header, const Bytes& body, std::size_t expected, Command command) {
  check_body_length(header, body);
  if (body.size() != expected) {
    BOOST_LOG_TRIVIAL(error) << "Codec: Unexpected " << command_to_string(command)
                             << " response length " << body.size() << ", expected " << expected;
    throw FrameError(std::string(command_to_string(command)) + " response must be " +
                     std::to_string(expected) + " bytes, got " + std::to_string(body.size()));
  }
}

StorageEndpoint decode_endpoint(const Bytes& body) {
  StorageEndpoint endpoint;
  endpoint.group_name = get_fixed_string(body.data(), GROUP_NAME_MAX_LENGTH);
  endpoint.address.host = get_fixed_string(body.data() + GROUP_NAME_MAX_LENGTH, IP_ADDRESS_LENGTH);

  uint64_t port = get_uint64(body.data() + GROUP_NAME_MAX_LENGTH + IP_ADDRESS_LENGTH);
  if (port == 0 || port > std::numeric_limits<uint16_t>::max()) {
    throw FrameError("invalid storage port " + std::to_string(port));
  }
  endpoint.address.port = static_cast<uint16_t>(port);

  if (endpoint.address.host.empty()) {
    throw FrameError("empty storage address");
  }
  return endpoint;
}

Bytes group_and_filename(const std::string& group_name, const std::string& remote_filename) {
  Bytes fields;
  fields.reserve(GROUP_NAME_MAX_LENGTH + remote_filename.size());
  put_fixed_string(fields, group_name, GROUP_NAME_MAX_LENGTH, "group name");
  fields.insert(fields.end(), remote_filename.begin(), remote_filename.end());
  return fields;
}

} // namespace

//==============================================
// HEADER
//==============================================

std::array<uint8_t, HEADER_LENGTH> encode_header(const Header& header) {
  std::array<uint8_t, HEADER_LENGTH> raw{};
  uint64_t network_length = boost::endian::native_to_big(header.length);
  std::memcpy(raw.data(), &network_length, sizeof(network_length));
  raw[8] = header.command;
  raw[9] = header.status;
  return raw;
}

Header decode_header(const std::array<uint8_t, HEADER_LENGTH>& raw, uint64_t max_body_length) {
  Header header;
  header.length = get_uint64(raw.data());
  header.command = raw[8];
  header.status = raw[9];

  if (header.length > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
    BOOST_LOG_TRIVIAL(error) << "Codec: Negative body length in header";
    throw FrameError("negative body length " + std::to_string(static_cast<int64_t>(header.length)));
  }
  if (header.length > max_body_length) {
    BOOST_LOG_TRIVIAL(error) << "Codec: Body length " << header.length << " exceeds limit " << max_body_length;
    throw FrameError("body length " + std::to_string(header.length) + " exceeds limit " +
                     std::to_string(max_body_length));
  }

  BOOST_LOG_TRIVIAL(trace) << "Codec: Decoded header - length: " << header.length
                           << ", command: " << static_cast<int>(header.command)
                           << ", status: " << static_cast<int>(header.status);
  return header;
}

void check_body_length(const Header& header, const Bytes& body) {
  if (body.size() != header.length) {
    throw FrameError("header declares " + std::to_string(header.length) + " body bytes, got " +
                     std::to_string(body.size()));
  }
}

void check_response_header(const Header& header) {
  if (header.status == 0 && header.command != static_cast<uint8_t>(Command::RESPONSE)) {
    throw FrameError("unexpected response command " + std::to_string(static_cast<int>(header.command)));
  }
}

//==============================================
// FRAMES
//==============================================

Frame encode(Command command, Bytes fields, const uint8_t* payload, std::size_t payload_size) {
  Header header{fields.size() + payload_size, static_cast<uint8_t>(command), 0};
  auto raw_header = encode_header(header);

  Frame frame;
  frame.head.reserve(HEADER_LENGTH + fields.size());
  frame.head.insert(frame.head.end(), raw_header.begin(), raw_header.end());
  frame.head.insert(frame.head.end(), fields.begin(), fields.end());
  frame.payload = payload_size > 0 ? payload : nullptr;
  frame.payload_size = payload_size;

  BOOST_LOG_TRIVIAL(debug) << "Codec: Encoded " << command_to_string(command)
                           << " frame with body length " << header.length;
  return frame;
}

Frame encode(const Request& request) {
  return std::visit([](const auto& typed) {
    return Codec<std::decay_t<decltype(typed)>>::encode(typed);
  }, request);
}

//==============================================
// CODEC TABLE
//==============================================

Command Codec<QueryStoreRequest>::command(const QueryStoreRequest& request) {
  return request.group_name.empty() ? Command::QUERY_STORE_WITHOUT_GROUP : Command::QUERY_STORE_WITH_GROUP;
}

Frame Codec<QueryStoreRequest>::encode(const QueryStoreRequest& request) {
  Bytes fields;
  if (!request.group_name.empty()) {
    put_fixed_string(fields, request.group_name, GROUP_NAME_MAX_LENGTH, "group name");
  }
  return protocol::encode(command(request), std::move(fields));
}

StoreTarget Codec<QueryStoreRequest>::decode(const Header& header, const Bytes& body) {
  check_fixed_length(header, body, STORE_RESPONSE_LENGTH, Command::QUERY_STORE_WITHOUT_GROUP);
  StoreTarget target;
  target.endpoint = decode_endpoint(body);
  target.store_path_index = body[FETCH_RESPONSE_LENGTH];
  return target;
}

Frame Codec<QueryFetchRequest>::encode(const QueryFetchRequest& request) {
  return protocol::encode(Command::QUERY_FETCH_ONE, group_and_filename(request.group_name, request.remote_filename));
}

StorageEndpoint Codec<QueryFetchRequest>::decode(const Header& header, const Bytes& body) {
  check_fixed_length(header, body, FETCH_RESPONSE_LENGTH, Command::QUERY_FETCH_ONE);
  return decode_endpoint(body);
}

Frame Codec<QueryUpdateRequest>::encode(const QueryUpdateRequest& request) {
  return protocol::encode(Command::QUERY_UPDATE, group_and_filename(request.group_name, request.remote_filename));
}

StorageEndpoint Codec<QueryUpdateRequest>::decode(const Header& header, const Bytes& body) {
  check_fixed_length(header, body, FETCH_RESPONSE_LENGTH, Command::QUERY_UPDATE);
  return decode_endpoint(body);
}

Frame Codec<UploadRequest>::encode(const UploadRequest& request) {
  Bytes fields;
  fields.reserve(1 + LENGTH_FIELD_SIZE + FILE_EXT_NAME_MAX_LENGTH);
  fields.push_back(request.store_path_index);
  put_uint64(fields, request.size);
  put_fixed_string(fields, request.file_ext_name, FILE_EXT_NAME_MAX_LENGTH, "file extension");
  return protocol::encode(Command::UPLOAD_FILE, std::move(fields), request.data, request.size);
}

StoredFile Codec<UploadRequest>::decode(const Header& header, const Bytes& body) {
  check_body_length(header, body);
  if (body.size() <= GROUP_NAME_MAX_LENGTH) {
    throw FrameError("upload response too short: " + std::to_string(body.size()) + " bytes");
  }
  StoredFile stored;
  stored.group_name = get_fixed_string(body.data(), GROUP_NAME_MAX_LENGTH);
  stored.remote_filename.assign(body.begin() + GROUP_NAME_MAX_LENGTH, body.end());
  return stored;
}

Frame Codec<DownloadRequest>::encode(const DownloadRequest& request) {
  Bytes fields;
  fields.reserve(2 * LENGTH_FIELD_SIZE + GROUP_NAME_MAX_LENGTH + request.remote_filename.size());
  put_uint64(fields, request.offset);
  put_uint64(fields, request.length);
  put_fixed_string(fields, request.group_name, GROUP_NAME_MAX_LENGTH, "group name");
  fields.insert(fields.end(), request.remote_filename.begin(), request.remote_filename.end());
  return protocol::encode(Command::DOWNLOAD_FILE, std::move(fields));
}

Bytes Codec<DownloadRequest>::decode(const Header& header, const Bytes& body) {
  check_body_length(header, body);
  return body;
}

Frame Codec<DeleteRequest>::encode(const DeleteRequest& request) {
  return protocol::encode(Command::DELETE_FILE, group_and_filename(request.group_name, request.remote_filename));
}

EmptyResponse Codec<DeleteRequest>::decode(const Header& header, const Bytes& body) {
  check_fixed_length(header, body, 0, Command::DELETE_FILE);
  return EmptyResponse{};
}

Frame Codec<ActiveTestRequest>::encode(const ActiveTestRequest&) {
  return protocol::encode(Command::ACTIVE_TEST, Bytes{});
}

EmptyResponse Codec<ActiveTestRequest>::decode(const Header& header, const Bytes& body) {
  check_fixed_length(header, body, 0, Command::ACTIVE_TEST);
  return EmptyResponse{};
}

} // namespace protocol
} // namespace fdfs
