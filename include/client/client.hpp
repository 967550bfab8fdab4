#ifndef FDFS_CLIENT_CLIENT_HPP
#define FDFS_CLIENT_CLIENT_HPP

#include <string>
#include "client/config.hpp"
#include "client/file_id.hpp"
#include "client/results.hpp"
#include "network/transport.hpp"

namespace fdfs {
namespace client {

// Blocking facade. Each call occupies the calling thread until done and
// uses its own connections, so one client may serve many threads.
// File identifiers are accepted as "group/path" or as URLs.
class Client {
public:
    // Throws ConfigError for an unusable configuration
    explicit Client(ClientConfig config);


    // ---- UPLOAD ----
    UploadResult upload_bytes(const protocol::Bytes& data, const std::string& file_ext_name,
                              const std::string& group_name = "", const CallOptions& options = CallOptions{});
    UploadResult upload_file(const std::string& local_path, const std::string& group_name = "",
                             const CallOptions& options = CallOptions{});
    std::string upload_as_url(const protocol::Bytes& data, const std::string& file_ext_name,
                              const std::string& group_name = "", const CallOptions& options = CallOptions{});


    // ---- DOWNLOAD ----
    protocol::Bytes download_to_bytes(const std::string& file_id, const ByteRange& range = ByteRange{},
                                      const CallOptions& options = CallOptions{});
    void download_to_sink(const std::string& file_id, const network::BodySink& sink,
                          const ByteRange& range = ByteRange{}, const CallOptions& options = CallOptions{});
    // Returns the number of bytes written; no file is created when the download fails
    uint64_t download_to_file(const std::string& file_id, const std::string& local_path,
                              const ByteRange& range = ByteRange{}, const CallOptions& options = CallOptions{});


    // ---- DELETE ----
    DeleteResult delete_file(const std::string& file_id, const CallOptions& options = CallOptions{});


    // ---- HEALTH ----
    bool active_test(const protocol::Address& address, const CallOptions& options = CallOptions{});

    // Public URL of an earlier upload
    std::string url_for(const UploadResult& result) const;

    const ClientConfig& config() const { return config_; }

private:
    ClientConfig config_;
};

} // namespace client
} // namespace fdfs

#endif // FDFS_CLIENT_CLIENT_HPP
