#ifndef FDFS_NETWORK_SOCKET_ERRORS_HPP
#define FDFS_NETWORK_SOCKET_ERRORS_HPP

#include <string>
#include <boost/system/error_code.hpp>

namespace fdfs {
namespace network {
namespace detail {

enum class SocketStage {
  RESOLVE,
  CONNECT,
  WRITE,
  READ
};

// Throws the TransportError or FrameError matching a failed socket step.
// Timeout and cancellation take precedence over the raw error code.
void throw_socket_error(const boost::system::error_code& ec, SocketStage stage,
                        bool timed_out, bool cancelled, const std::string& peer);

} // namespace detail
} // namespace network
} // namespace fdfs

#endif // FDFS_NETWORK_SOCKET_ERRORS_HPP
