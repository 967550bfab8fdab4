#ifndef FDFS_CLIENT_COROUTINE_CLIENT_HPP
#define FDFS_CLIENT_COROUTINE_CLIENT_HPP

#include <string>
#include <boost/asio/io_context.hpp>
#include <boost/asio/spawn.hpp>
#include "client/config.hpp"
#include "client/file_id.hpp"
#include "client/results.hpp"
#include "network/transport.hpp"

namespace fdfs {
namespace client {

// Cooperative facade. Calls must run inside boost::asio::spawn on the
// client's io_context and suspend only while waiting on the network, so
// any number of calls can share one thread. Semantics and wire traffic
// match Client.
class CoroutineClient {
public:
    // Throws ConfigError for an unusable configuration
    CoroutineClient(boost::asio::io_context& io_context, ClientConfig config);


    // ---- UPLOAD ----
    UploadResult upload_bytes(boost::asio::yield_context yield, const protocol::Bytes& data,
                              const std::string& file_ext_name, const std::string& group_name = "",
                              const CoroutineCallOptions& options = CoroutineCallOptions{});
    UploadResult upload_file(boost::asio::yield_context yield, const std::string& local_path,
                             const std::string& group_name = "",
                             const CoroutineCallOptions& options = CoroutineCallOptions{});
    std::string upload_as_url(boost::asio::yield_context yield, const protocol::Bytes& data,
                              const std::string& file_ext_name, const std::string& group_name = "",
                              const CoroutineCallOptions& options = CoroutineCallOptions{});


    // ---- DOWNLOAD ----
    protocol::Bytes download_to_bytes(boost::asio::yield_context yield, const std::string& file_id,
                                      const ByteRange& range = ByteRange{},
                                      const CoroutineCallOptions& options = CoroutineCallOptions{});
    void download_to_sink(boost::asio::yield_context yield, const std::string& file_id,
                          const network::BodySink& sink, const ByteRange& range = ByteRange{},
                          const CoroutineCallOptions& options = CoroutineCallOptions{});
    uint64_t download_to_file(boost::asio::yield_context yield, const std::string& file_id,
                              const std::string& local_path, const ByteRange& range = ByteRange{},
                              const CoroutineCallOptions& options = CoroutineCallOptions{});


    // ---- DELETE ----
    DeleteResult delete_file(boost::asio::yield_context yield, const std::string& file_id,
                             const CoroutineCallOptions& options = CoroutineCallOptions{});


    // ---- HEALTH ----
    bool active_test(boost::asio::yield_context yield, const protocol::Address& address,
                     const CoroutineCallOptions& options = CoroutineCallOptions{});

    const ClientConfig& config() const { return config_; }
    boost::asio::io_context& io_context() { return io_context_; }

private:
    boost::asio::io_context& io_context_;
    ClientConfig config_;
};

} // namespace client
} // namespace fdfs

#endif // FDFS_CLIENT_COROUTINE_CLIENT_HPP
