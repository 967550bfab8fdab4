#include "client/coroutine_client.hpp"
#include "client/local_file.hpp"
#include "client/operations.hpp"
#include "network/coroutine_transport.hpp"
#include <boost/log/trivial.hpp>

namespace fdfs {
namespace client {

namespace {

network::CoroutineTransport make_transport(boost::asio::io_context& io_context, boost::asio::yield_context yield,
                                           const ClientConfig& config, const CoroutineCallOptions& options) {
  return network::CoroutineTransport(io_context, yield, config.transport_options(options.timeout),
                                     options.cancellation);
}

} // namespace

CoroutineClient::CoroutineClient(boost::asio::io_context& io_context, ClientConfig config)
  : io_context_(io_context),
    config_(std::move(config)) {
  config_.validate();
  BOOST_LOG_TRIVIAL(info) << "Coroutine client: Created with " << config_.trackers.size() << " tracker(s)";
}

//==============================================
// UPLOAD
//==============================================

UploadResult CoroutineClient::upload_bytes(boost::asio::yield_context yield, const protocol::Bytes& data,
                                           const std::string& file_ext_name, const std::string& group_name,
                                           const CoroutineCallOptions& options) {
  network::CoroutineTransport transport = make_transport(io_context_, yield, config_, options);
  Operations operations(transport, config_);
  return operations.upload_bytes(data.data(), data.size(), file_ext_name, group_name);
}

UploadResult CoroutineClient::upload_file(boost::asio::yield_context yield, const std::string& local_path,
                                          const std::string& group_name, const CoroutineCallOptions& options) {
  LocalFile file = read_local_file(local_path);
  return upload_bytes(yield, file.data, file.extension, group_name, options);
}

std::string CoroutineClient::upload_as_url(boost::asio::yield_context yield, const protocol::Bytes& data,
                                           const std::string& file_ext_name, const std::string& group_name,
                                           const CoroutineCallOptions& options) {
  network::CoroutineTransport transport = make_transport(io_context_, yield, config_, options);
  Operations operations(transport, config_);
  return operations.upload_as_url(data.data(), data.size(), file_ext_name, group_name);
}

//==============================================
// DOWNLOAD
//==============================================

protocol::Bytes CoroutineClient::download_to_bytes(boost::asio::yield_context yield, const std::string& file_id,
                                                   const ByteRange& range, const CoroutineCallOptions& options) {
  FileId id = FileId::parse(file_id);
  network::CoroutineTransport transport = make_transport(io_context_, yield, config_, options);
  Operations operations(transport, config_);
  return operations.download_to_bytes(id, range);
}

void CoroutineClient::download_to_sink(boost::asio::yield_context yield, const std::string& file_id,
                                       const network::BodySink& sink, const ByteRange& range,
                                       const CoroutineCallOptions& options) {
  FileId id = FileId::parse(file_id);
  network::CoroutineTransport transport = make_transport(io_context_, yield, config_, options);
  Operations operations(transport, config_);
  operations.download_to_sink(id, sink, range);
}

uint64_t CoroutineClient::download_to_file(boost::asio::yield_context yield, const std::string& file_id,
                                           const std::string& local_path, const ByteRange& range,
                                           const CoroutineCallOptions& options) {
  LocalFileSink file(local_path);
  download_to_sink(yield, file_id, [&file](const uint8_t* data, std::size_t size) {
    file.write(data, size);
  }, range, options);
  file.commit();
  return file.bytes_written();
}

//==============================================
// DELETE
//==============================================

DeleteResult CoroutineClient::delete_file(boost::asio::yield_context yield, const std::string& file_id,
                                          const CoroutineCallOptions& options) {
  FileId id = FileId::parse(file_id);
  network::CoroutineTransport transport = make_transport(io_context_, yield, config_, options);
  Operations operations(transport, config_);
  return operations.delete_file(id);
}

//==============================================
// HEALTH
//==============================================

bool CoroutineClient::active_test(boost::asio::yield_context yield, const protocol::Address& address,
                                  const CoroutineCallOptions& options) {
  network::CoroutineTransport transport = make_transport(io_context_, yield, config_, options);
  Operations operations(transport, config_);
  return operations.active_test(address);
}

} // namespace client
} // namespace fdfs
