#include "client/operations.hpp"
#include "client/storage_client.hpp"
#include "client/tracker_client.hpp"
#include "protocol/codec.hpp"
#include "protocol/errors.hpp"
#include <boost/log/trivial.hpp>
#include <random>

namespace fdfs {
namespace client {

std::string normalize_extension(const std::string& file_ext_name) {
  std::string extension = file_ext_name;
  if (!extension.empty() && extension.front() == '.') {
    extension.erase(0, 1);
  }
  if (extension.size() > protocol::FILE_EXT_NAME_MAX_LENGTH) {
    throw IdentifierError("file extension longer than " +
                          std::to_string(protocol::FILE_EXT_NAME_MAX_LENGTH) + " characters: " + file_ext_name);
  }
  return extension;
}

Operations::Operations(network::Transport& transport, const ClientConfig& config)
  : transport_(transport),
    config_(config) {}

//==============================================
// UPLOAD
//==============================================

UploadResult Operations::upload_bytes(const uint8_t* data, std::size_t size, const std::string& file_ext_name,
                                      const std::string& group_name) {
  std::string extension = normalize_extension(file_ext_name);

  TrackerClient tracker(transport_, pick_tracker());
  protocol::StoreTarget target = tracker.query_store(group_name);

  StorageClient storage(transport_, target.endpoint);
  UploadResult result;
  result.file_id = storage.upload(data, size, extension, target.store_path_index);
  result.uploaded_size = size;
  result.storage_host = target.endpoint.address.host;
  return result;
}

std::string Operations::upload_as_url(const uint8_t* data, std::size_t size, const std::string& file_ext_name,
                                      const std::string& group_name) {
  UploadResult result = upload_bytes(data, size, file_ext_name, group_name);
  return public_url(result.file_id, result.storage_host, config_.base_url);
}

std::string public_url(const FileId& file_id, const std::string& storage_host, const std::string& base_url) {
  if (base_url.empty()) {
    return file_id.format("http://" + storage_host);
  }
  return file_id.format(base_url);
}

//==============================================
// DOWNLOAD
//==============================================

protocol::Bytes Operations::download_to_bytes(const FileId& file_id, const ByteRange& range) {
  TrackerClient tracker(transport_, pick_tracker());
  StorageClient storage(transport_, tracker.query_fetch(file_id));
  return storage.download(file_id, range);
}

void Operations::download_to_sink(const FileId& file_id, const network::BodySink& sink, const ByteRange& range) {
  TrackerClient tracker(transport_, pick_tracker());
  StorageClient storage(transport_, tracker.query_fetch(file_id));
  storage.download(file_id, sink, range);
}

//==============================================
// DELETE
//==============================================

DeleteResult Operations::delete_file(const FileId& file_id) {
  TrackerClient tracker(transport_, pick_tracker());
  StorageClient storage(transport_, tracker.query_update(file_id));
  return storage.delete_file(file_id);
}

//==============================================
// HEALTH
//==============================================

bool Operations::active_test(const protocol::Address& address) {
  BOOST_LOG_TRIVIAL(debug) << "Operations: Active test against " << address.to_string();
  protocol::ActiveTestRequest request;
  network::Response response = transport_.send_receive(
    address, protocol::Codec<protocol::ActiveTestRequest>::encode(request));
  if (response.header.status != 0) {
    BOOST_LOG_TRIVIAL(warning) << "Operations: " << address.to_string() << " answered active test with status "
                               << static_cast<int>(response.header.status);
    return false;
  }
  protocol::Codec<protocol::ActiveTestRequest>::decode(response.header, response.body);
  return true;
}

//==============================================
// TRACKER SELECTION
//==============================================

const protocol::Address& Operations::pick_tracker() const {
  if (config_.trackers.empty()) {
    throw ConfigError("no tracker server configured");
  }
  thread_local std::mt19937 generator{std::random_device{}()};
  std::uniform_int_distribution<std::size_t> distribution(0, config_.trackers.size() - 1);
  const protocol::Address& tracker = config_.trackers[distribution(generator)];
  BOOST_LOG_TRIVIAL(trace) << "Operations: Using tracker " << tracker.to_string();
  return tracker;
}

} // namespace client
} // namespace fdfs
