#include "client/storage_client.hpp"
#include "protocol/codec.hpp"
#include "protocol/errors.hpp"
#include <boost/log/trivial.hpp>

namespace fdfs {
namespace client {

StorageClient::StorageClient(network::Transport& transport, protocol::StorageEndpoint endpoint)
  : transport_(transport),
    endpoint_(std::move(endpoint)) {}

//==============================================
// UPLOAD
//==============================================

FileId StorageClient::upload(const uint8_t* data, std::size_t size, const std::string& file_ext_name,
                             uint8_t store_path_index) {
  BOOST_LOG_TRIVIAL(info) << "Storage client: Uploading " << size << " bytes to "
                          << endpoint_.address.to_string() << " in group " << endpoint_.group_name;

  protocol::UploadRequest request{store_path_index, file_ext_name, data, size};
  network::Response response = transport_.send_receive(endpoint_.address,
                                                       protocol::Codec<protocol::UploadRequest>::encode(request));
  check_status(response.header, "upload", nullptr);

  protocol::StoredFile stored = protocol::Codec<protocol::UploadRequest>::decode(response.header, response.body);
  FileId file_id{stored.group_name, stored.remote_filename};
  BOOST_LOG_TRIVIAL(info) << "Storage client: Stored as " << file_id.to_string();
  return file_id;
}

//==============================================
// DOWNLOAD
//==============================================

protocol::Bytes StorageClient::download(const FileId& file_id, const ByteRange& range) {
  BOOST_LOG_TRIVIAL(info) << "Storage client: Downloading " << file_id.to_string()
                          << " from " << endpoint_.address.to_string();

  protocol::DownloadRequest request{file_id.group_name, file_id.remote_filename, range.offset, range.length};
  network::Response response = transport_.send_receive(endpoint_.address,
                                                       protocol::Codec<protocol::DownloadRequest>::encode(request));
  check_status(response.header, "download", &file_id);
  return protocol::Codec<protocol::DownloadRequest>::decode(response.header, response.body);
}

void StorageClient::download(const FileId& file_id, const network::BodySink& sink, const ByteRange& range) {
  BOOST_LOG_TRIVIAL(info) << "Storage client: Streaming " << file_id.to_string()
                          << " from " << endpoint_.address.to_string();

  protocol::DownloadRequest request{file_id.group_name, file_id.remote_filename, range.offset, range.length};
  protocol::Header header = transport_.send_receive_streamed(
    endpoint_.address, protocol::Codec<protocol::DownloadRequest>::encode(request), sink);
  check_status(header, "download", &file_id);
}

//==============================================
// DELETE
//==============================================

DeleteResult StorageClient::delete_file(const FileId& file_id) {
  BOOST_LOG_TRIVIAL(info) << "Storage client: Deleting " << file_id.to_string()
                          << " on " << endpoint_.address.to_string();

  protocol::DeleteRequest request{file_id.group_name, file_id.remote_filename};
  network::Response response = transport_.send_receive(endpoint_.address,
                                                       protocol::Codec<protocol::DeleteRequest>::encode(request));
  check_status(response.header, "delete", &file_id);
  protocol::Codec<protocol::DeleteRequest>::decode(response.header, response.body);

  DeleteResult result;
  result.status = DELETE_SUCCEEDED;
  result.remote_path = file_id.remote_filename;
  result.storage_host = endpoint_.address.host;
  return result;
}

//==============================================
// STATUS
//==============================================

void StorageClient::check_status(const protocol::Header& header, const char* operation,
                                 const FileId* file_id) const {
  if (header.status == 0) {
    return;
  }

  std::string message = std::string(operation) + " failed on " + endpoint_.address.to_string();
  if (file_id) {
    message += " for " + file_id->to_string();
  }
  BOOST_LOG_TRIVIAL(warning) << "Storage client: " << message
                             << " with status " << static_cast<int>(header.status);
  throw StorageError(header.status, message);
}

} // namespace client
} // namespace fdfs
