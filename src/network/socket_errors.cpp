#include "socket_errors.hpp"
#include "protocol/errors.hpp"
#include <boost/asio/error.hpp>
#include <boost/log/trivial.hpp>

namespace fdfs {
namespace network {
namespace detail {

namespace {

const char* stage_to_string(SocketStage stage) {
  switch (stage) {
    case SocketStage::RESOLVE: return "resolving";
    case SocketStage::CONNECT: return "connecting to";
    case SocketStage::WRITE: return "writing to";
    case SocketStage::READ: return "reading from";
    default: return "talking to";
  }
}

} // namespace

void throw_socket_error(const boost::system::error_code& ec, SocketStage stage,
                        bool timed_out, bool cancelled, const std::string& peer) {
  std::string context = std::string(stage_to_string(stage)) + " " + peer;
  BOOST_LOG_TRIVIAL(debug) << "Transport: Failed " << context << ": " << ec.message();

  if (cancelled) {
    throw TransportError(TransportErrorCode::CANCELLED, "cancelled while " + context);
  }
  if (timed_out || ec == boost::asio::error::timed_out) {
    throw TransportError(TransportErrorCode::TIMEOUT, "timed out " + context);
  }

  switch (stage) {
    case SocketStage::RESOLVE:
      throw TransportError(TransportErrorCode::RESOLVE_FAILED, context + ": " + ec.message());
    case SocketStage::CONNECT:
      if (ec == boost::asio::error::connection_refused) {
        throw TransportError(TransportErrorCode::CONNECTION_REFUSED, context + ": " + ec.message());
      }
      throw TransportError(TransportErrorCode::CONNECTION_FAILED, context + ": " + ec.message());
    case SocketStage::READ:
      if (ec == boost::asio::error::eof) {
        throw FrameError("connection closed mid-frame while " + context);
      }
      break;
    default:
      break;
  }
  throw TransportError(TransportErrorCode::CONNECTION_LOST, context + ": " + ec.message());
}

} // namespace detail
} // namespace network
} // namespace fdfs
