#ifndef FDFS_CLIENT_OPERATIONS_HPP
#define FDFS_CLIENT_OPERATIONS_HPP

#include <string>
#include "client/config.hpp"
#include "client/file_id.hpp"
#include "client/results.hpp"
#include "network/transport.hpp"

namespace fdfs {
namespace client {

// Tracker-then-storage orchestration over any transport. Both facades
// drive their calls through this class, so they behave identically on
// the wire.
class Operations {
public:
    Operations(network::Transport& transport, const ClientConfig& config);


    // ---- UPLOAD ----
    // Empty group lets the tracker choose one
    UploadResult upload_bytes(const uint8_t* data, std::size_t size, const std::string& file_ext_name,
                              const std::string& group_name = "");
    // Public URL of the uploaded file, based on the storage host when no base URL is configured
    std::string upload_as_url(const uint8_t* data, std::size_t size, const std::string& file_ext_name,
                              const std::string& group_name = "");


    // ---- DOWNLOAD ----
    protocol::Bytes download_to_bytes(const FileId& file_id, const ByteRange& range = ByteRange{});
    void download_to_sink(const FileId& file_id, const network::BodySink& sink,
                          const ByteRange& range = ByteRange{});


    // ---- DELETE ----
    DeleteResult delete_file(const FileId& file_id);


    // ---- HEALTH ----
    // True when the node answers with status 0
    bool active_test(const protocol::Address& address);

private:
    // One of the configured trackers, chosen at random per operation
    const protocol::Address& pick_tracker() const;

    network::Transport& transport_;
    const ClientConfig& config_;
};


// URL under base_url, or under http://<storage_host> when base_url is empty
std::string public_url(const FileId& file_id, const std::string& storage_host, const std::string& base_url);

// Strips a leading dot; throws IdentifierError when longer than six characters
std::string normalize_extension(const std::string& file_ext_name);

} // namespace client
} // namespace fdfs

#endif // FDFS_CLIENT_OPERATIONS_HPP
