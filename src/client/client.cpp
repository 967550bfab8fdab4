#include "client/client.hpp"
#include "client/local_file.hpp"
#include "client/operations.hpp"
#include "network/blocking_transport.hpp"
#include <boost/log/trivial.hpp>

namespace fdfs {
namespace client {

Client::Client(ClientConfig config)
  : config_(std::move(config)) {
  config_.validate();
  BOOST_LOG_TRIVIAL(info) << "Client: Created with " << config_.trackers.size() << " tracker(s)";
}

//==============================================
// UPLOAD
//==============================================

UploadResult Client::upload_bytes(const protocol::Bytes& data, const std::string& file_ext_name,
                                  const std::string& group_name, const CallOptions& options) {
  network::BlockingTransport transport(config_.transport_options(options.timeout));
  Operations operations(transport, config_);
  return operations.upload_bytes(data.data(), data.size(), file_ext_name, group_name);
}

UploadResult Client::upload_file(const std::string& local_path, const std::string& group_name,
                                 const CallOptions& options) {
  LocalFile file = read_local_file(local_path);
  return upload_bytes(file.data, file.extension, group_name, options);
}

std::string Client::upload_as_url(const protocol::Bytes& data, const std::string& file_ext_name,
                                  const std::string& group_name, const CallOptions& options) {
  network::BlockingTransport transport(config_.transport_options(options.timeout));
  Operations operations(transport, config_);
  return operations.upload_as_url(data.data(), data.size(), file_ext_name, group_name);
}

std::string Client::url_for(const UploadResult& result) const {
  return public_url(result.file_id, result.storage_host, config_.base_url);
}

//==============================================
// DOWNLOAD
//==============================================

protocol::Bytes Client::download_to_bytes(const std::string& file_id, const ByteRange& range,
                                          const CallOptions& options) {
  FileId id = FileId::parse(file_id);
  network::BlockingTransport transport(config_.transport_options(options.timeout));
  Operations operations(transport, config_);
  return operations.download_to_bytes(id, range);
}

void Client::download_to_sink(const std::string& file_id, const network::BodySink& sink,
                              const ByteRange& range, const CallOptions& options) {
  FileId id = FileId::parse(file_id);
  network::BlockingTransport transport(config_.transport_options(options.timeout));
  Operations operations(transport, config_);
  operations.download_to_sink(id, sink, range);
}

uint64_t Client::download_to_file(const std::string& file_id, const std::string& local_path,
                                  const ByteRange& range, const CallOptions& options) {
  LocalFileSink file(local_path);
  download_to_sink(file_id, [&file](const uint8_t* data, std::size_t size) {
    file.write(data, size);
  }, range, options);
  file.commit();
  return file.bytes_written();
}

//==============================================
// DELETE
//==============================================

DeleteResult Client::delete_file(const std::string& file_id, const CallOptions& options) {
  FileId id = FileId::parse(file_id);
  network::BlockingTransport transport(config_.transport_options(options.timeout));
  Operations operations(transport, config_);
  return operations.delete_file(id);
}

//==============================================
// HEALTH
//==============================================

bool Client::active_test(const protocol::Address& address, const CallOptions& options) {
  network::BlockingTransport transport(config_.transport_options(options.timeout));
  Operations operations(transport, config_);
  return operations.active_test(address);
}

} // namespace client
} // namespace fdfs
