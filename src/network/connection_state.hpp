#ifndef FDFS_NETWORK_CONNECTION_STATE_HPP
#define FDFS_NETWORK_CONNECTION_STATE_HPP

#include <cstdint>
#include <boost/asio.hpp>

namespace fdfs {
namespace network {
namespace detail {

// Socket objects of one cooperative exchange, shared with the timer and
// cancellation handlers, which only ever hold weak references.
// Every I/O step opens a new generation; an expiry tagged with an older
// generation belongs to a finished step and is ignored.
struct ConnectionState {
  explicit ConnectionState(boost::asio::io_context& io_context)
    : socket(io_context),
      resolver(io_context),
      timer(io_context) {}

  void abort() {
    resolver.cancel();
    boost::system::error_code ignored;
    socket.close(ignored);
  }

  uint64_t begin_step() {
    timed_out = false;
    return ++generation;
  }

  void end_step() {
    ++generation;
  }

  // Returns true when the expiry hit the running step and aborted it
  bool expire(uint64_t step) {
    if (step != generation) {
      return false;
    }
    timed_out = true;
    abort();
    return true;
  }

  boost::asio::ip::tcp::socket socket;
  boost::asio::ip::tcp::resolver resolver;
  boost::asio::steady_timer timer;
  uint64_t generation = 0;
  bool timed_out = false;
};

} // namespace detail
} // namespace network
} // namespace fdfs

#endif // FDFS_NETWORK_CONNECTION_STATE_HPP
