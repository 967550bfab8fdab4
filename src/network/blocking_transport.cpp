#include "network/blocking_transport.hpp"
#include "exchange.hpp"
#include "socket_errors.hpp"
#include <boost/asio.hpp>
#include <boost/log/trivial.hpp>

namespace fdfs {
namespace network {

namespace {

using boost::asio::ip::tcp;

// Single connection driven by async operations on a private io_context,
// each followed by a bounded run of the context
class BlockingExchange {
public:
  explicit BlockingExchange(const TransportOptions& options)
    : options_(options),
      resolver_(io_context_),
      socket_(io_context_) {}

  ~BlockingExchange() {
    close();
  }

  BlockingExchange(const BlockingExchange&) = delete;
  BlockingExchange& operator=(const BlockingExchange&) = delete;

  void connect(const protocol::Address& address) {
    peer_ = address.to_string();
    BOOST_LOG_TRIVIAL(debug) << "Blocking transport: Connecting to " << peer_;

    boost::system::error_code ec;
    std::vector<tcp::endpoint> endpoints;
    if (auto literal = detail::literal_endpoint(address)) {
      endpoints.push_back(*literal);
    } else {
      // A hung lookup is only abandoned once getaddrinfo returns
      resolver_.async_resolve(address.host, std::to_string(address.port),
        [&](const boost::system::error_code& result_ec, tcp::resolver::results_type results) {
          ec = result_ec;
          endpoints.assign(results.begin(), results.end());
        });
      run(options_.connect_timeout);
      if (ec || timed_out_) {
        fail(ec, detail::SocketStage::RESOLVE);
      }
    }

    boost::asio::async_connect(socket_, endpoints,
      [&](const boost::system::error_code& result_ec, const tcp::endpoint&) {
        ec = result_ec;
      });
    run(options_.connect_timeout);
    if (ec || timed_out_) {
      fail(ec, detail::SocketStage::CONNECT);
    }

    boost::system::error_code ignored;
    socket_.set_option(tcp::no_delay(true), ignored);
  }

  void write(const uint8_t* data, std::size_t size) {
    boost::system::error_code ec;
    boost::asio::async_write(socket_, boost::asio::buffer(data, size),
      [&](const boost::system::error_code& result_ec, std::size_t) {
        ec = result_ec;
      });
    run(options_.network_timeout);
    if (ec || timed_out_) {
      fail(ec, detail::SocketStage::WRITE);
    }
  }

  void read(uint8_t* data, std::size_t size) {
    boost::system::error_code ec;
    boost::asio::async_read(socket_, boost::asio::buffer(data, size),
      [&](const boost::system::error_code& result_ec, std::size_t) {
        ec = result_ec;
      });
    run(options_.network_timeout);
    if (ec || timed_out_) {
      fail(ec, detail::SocketStage::READ);
    }
  }

  void close() {
    if (socket_.is_open()) {
      boost::system::error_code ignored;
      socket_.shutdown(tcp::socket::shutdown_both, ignored);
      socket_.close(ignored);
    }
  }

private:
  // A step that completed after its deadline still counts as timed out
  void fail(const boost::system::error_code& ec, detail::SocketStage stage) {
    boost::system::error_code error = ec ? ec : boost::asio::error::timed_out;
    detail::throw_socket_error(error, stage, timed_out_, false, peer_);
  }

  // Runs pending work until it completes or the timeout expires
  void run(std::chrono::milliseconds timeout) {
    timed_out_ = false;
    io_context_.restart();
    io_context_.run_for(timeout);

    if (!io_context_.stopped()) {
      timed_out_ = true;
      resolver_.cancel();
      boost::system::error_code ignored;
      socket_.close(ignored);
      io_context_.run();
    }
  }

  const TransportOptions& options_;
  boost::asio::io_context io_context_;
  tcp::resolver resolver_;
  tcp::socket socket_;
  std::string peer_;
  bool timed_out_ = false;
};

} // namespace

//==============================================
// CONSTRUCTOR
//==============================================

BlockingTransport::BlockingTransport(TransportOptions options)
  : options_(options) {
  BOOST_LOG_TRIVIAL(debug) << "Blocking transport: Created with connect timeout "
                           << options_.connect_timeout.count() << " ms, network timeout "
                           << options_.network_timeout.count() << " ms";
}

//==============================================
// EXCHANGES
//==============================================

Response BlockingTransport::send_receive(const protocol::Address& address, const protocol::Frame& frame) {
  BlockingExchange exchange(options_);
  return detail::buffered_round_trip(exchange, address, frame, options_);
}

protocol::Header BlockingTransport::send_receive_streamed(const protocol::Address& address,
                                                          const protocol::Frame& frame,
                                                          const BodySink& sink) {
  BlockingExchange exchange(options_);
  return detail::streamed_round_trip(exchange, address, frame, options_, sink);
}

} // namespace network
} // namespace fdfs
