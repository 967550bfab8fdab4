#ifndef FDFS_CLIENT_TRACKER_CLIENT_HPP
#define FDFS_CLIENT_TRACKER_CLIENT_HPP

#include <string>
#include "client/file_id.hpp"
#include "network/transport.hpp"
#include "protocol/types.hpp"

namespace fdfs {
namespace client {

// Asks one tracker which storage node should serve an operation.
// A nonzero tracker status raises TrackerError; connection problems
// stay TransportError.
class TrackerClient {
public:
    TrackerClient(network::Transport& transport, protocol::Address tracker);

    // ---- QUERIES ----
    // Empty group lets the tracker choose one
    protocol::StoreTarget query_store(const std::string& group_name = "");
    // Node serving reads of the file
    protocol::StorageEndpoint query_fetch(const FileId& file_id);
    // Node accepting changes to the file, used for delete
    protocol::StorageEndpoint query_update(const FileId& file_id);

    const protocol::Address& address() const { return tracker_; }

private:
    template <typename RequestT>
    typename protocol::Codec<RequestT>::Response query(const RequestT& request);

    network::Transport& transport_;
    protocol::Address tracker_;
};

} // namespace client
} // namespace fdfs

#endif // FDFS_CLIENT_TRACKER_CLIENT_HPP
