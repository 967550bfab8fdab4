#include "client/tracker_client.hpp"
#include "protocol/codec.hpp"
#include "protocol/errors.hpp"
#include <boost/log/trivial.hpp>

namespace fdfs {
namespace client {

TrackerClient::TrackerClient(network::Transport& transport, protocol::Address tracker)
  : transport_(transport),
    tracker_(std::move(tracker)) {}

//==============================================
// QUERIES
//==============================================

protocol::StoreTarget TrackerClient::query_store(const std::string& group_name) {
  protocol::StoreTarget target = query(protocol::QueryStoreRequest{group_name});
  BOOST_LOG_TRIVIAL(debug) << "Tracker client: Store target " << target.endpoint.address.to_string()
                           << " in group " << target.endpoint.group_name
                           << ", path index " << static_cast<int>(target.store_path_index);
  return target;
}

protocol::StorageEndpoint TrackerClient::query_fetch(const FileId& file_id) {
  return query(protocol::QueryFetchRequest{file_id.group_name, file_id.remote_filename});
}

protocol::StorageEndpoint TrackerClient::query_update(const FileId& file_id) {
  return query(protocol::QueryUpdateRequest{file_id.group_name, file_id.remote_filename});
}

//==============================================
// ROUND TRIP
//==============================================

template <typename RequestT>
typename protocol::Codec<RequestT>::Response TrackerClient::query(const RequestT& request) {
  using RequestCodec = protocol::Codec<RequestT>;
  const char* command = protocol::command_to_string(RequestCodec::command(request));

  BOOST_LOG_TRIVIAL(debug) << "Tracker client: Sending " << command << " to " << tracker_.to_string();
  network::Response response = transport_.send_receive(tracker_, RequestCodec::encode(request));

  if (response.header.status != 0) {
    BOOST_LOG_TRIVIAL(warning) << "Tracker client: " << command << " refused by " << tracker_.to_string()
                               << " with status " << static_cast<int>(response.header.status);
    throw TrackerError(response.header.status, std::string(command) + " refused by " + tracker_.to_string());
  }
  return RequestCodec::decode(response.header, response.body);
}

} // namespace client
} // namespace fdfs
