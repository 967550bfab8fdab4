#ifndef FDFS_CLIENT_STORAGE_CLIENT_HPP
#define FDFS_CLIENT_STORAGE_CLIENT_HPP

#include <string>
#include "client/file_id.hpp"
#include "client/results.hpp"
#include "network/transport.hpp"
#include "protocol/types.hpp"

namespace fdfs {
namespace client {

// Transfers file data with the storage node a tracker nominated.
// A nonzero storage status raises StorageError; status 2 means NotFound.
class StorageClient {
public:
    StorageClient(network::Transport& transport, protocol::StorageEndpoint endpoint);

    // ---- UPLOAD ----
    // Extension without a leading dot, at most six characters
    FileId upload(const uint8_t* data, std::size_t size, const std::string& file_ext_name,
                  uint8_t store_path_index);

    // ---- DOWNLOAD ----
    protocol::Bytes download(const FileId& file_id, const ByteRange& range = ByteRange{});
    // NotFound and other failures are raised before the sink sees any byte
    void download(const FileId& file_id, const network::BodySink& sink,
                  const ByteRange& range = ByteRange{});

    // ---- DELETE ----
    DeleteResult delete_file(const FileId& file_id);

    const protocol::StorageEndpoint& endpoint() const { return endpoint_; }

private:
    void check_status(const protocol::Header& header, const char* operation, const FileId* file_id) const;

    network::Transport& transport_;
    protocol::StorageEndpoint endpoint_;
};

} // namespace client
} // namespace fdfs

#endif // FDFS_CLIENT_STORAGE_CLIENT_HPP
