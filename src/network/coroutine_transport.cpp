#include "network/coroutine_transport.hpp"
#include "connection_state.hpp"
#include "exchange.hpp"
#include "socket_errors.hpp"
#include <boost/asio.hpp>
#include <boost/log/trivial.hpp>

namespace fdfs {
namespace network {

namespace {

using boost::asio::ip::tcp;

using detail::ConnectionState;

class CoroutineExchange {
public:
  CoroutineExchange(boost::asio::io_context& io_context, boost::asio::yield_context yield,
                    const TransportOptions& options, std::shared_ptr<CancellationSignal> signal)
    : io_context_(io_context),
      yield_(yield),
      options_(options),
      signal_(std::move(signal)),
      state_(std::make_shared<ConnectionState>(io_context)) {}

  ~CoroutineExchange() {
    if (signal_) {
      signal_->detach();
    }
    close();
  }

  CoroutineExchange(const CoroutineExchange&) = delete;
  CoroutineExchange& operator=(const CoroutineExchange&) = delete;

  void connect(const protocol::Address& address) {
    peer_ = address.to_string();

    if (signal_) {
      std::weak_ptr<ConnectionState> weak_state = state_;
      auto executor = io_context_.get_executor();
      bool attached = signal_->attach([weak_state, executor]() {
        boost::asio::post(executor, [weak_state]() {
          if (auto state = weak_state.lock()) {
            state->abort();
          }
        });
      });
      if (!attached) {
        throw TransportError(TransportErrorCode::CANCELLED, "cancelled before connecting to " + peer_);
      }
    }

    BOOST_LOG_TRIVIAL(debug) << "Coroutine transport: Connecting to " << peer_;
    boost::system::error_code ec;

    std::vector<tcp::endpoint> endpoints;
    if (auto literal = detail::literal_endpoint(address)) {
      endpoints.push_back(*literal);
    } else {
      arm(options_.connect_timeout);
      tcp::resolver::results_type results =
        state_->resolver.async_resolve(address.host, std::to_string(address.port), yield_[ec]);
      disarm();
      if (ec || cancelled()) {
        fail(ec, detail::SocketStage::RESOLVE);
      }
      endpoints.assign(results.begin(), results.end());
    }

    arm(options_.connect_timeout);
    boost::asio::async_connect(state_->socket, endpoints, yield_[ec]);
    disarm();
    if (ec || cancelled()) {
      fail(ec, detail::SocketStage::CONNECT);
    }

    boost::system::error_code ignored;
    state_->socket.set_option(tcp::no_delay(true), ignored);
  }

  void write(const uint8_t* data, std::size_t size) {
    boost::system::error_code ec;
    arm(options_.network_timeout);
    boost::asio::async_write(state_->socket, boost::asio::buffer(data, size), yield_[ec]);
    disarm();
    if (ec || cancelled()) {
      fail(ec, detail::SocketStage::WRITE);
    }
  }

  void read(uint8_t* data, std::size_t size) {
    boost::system::error_code ec;
    arm(options_.network_timeout);
    boost::asio::async_read(state_->socket, boost::asio::buffer(data, size), yield_[ec]);
    disarm();
    if (ec || cancelled()) {
      fail(ec, detail::SocketStage::READ);
    }
  }

  void close() {
    if (state_->socket.is_open()) {
      boost::system::error_code ignored;
      state_->socket.shutdown(tcp::socket::shutdown_both, ignored);
      state_->socket.close(ignored);
    }
  }

private:
  // Closes the connection if the next step outlives the timeout
  void arm(std::chrono::milliseconds timeout) {
    uint64_t step = state_->begin_step();
    state_->timer.expires_after(timeout);
    std::weak_ptr<ConnectionState> weak_state = state_;
    state_->timer.async_wait([weak_state, step](const boost::system::error_code& ec) {
      if (ec) {
        return;
      }
      if (auto state = weak_state.lock()) {
        state->expire(step);
      }
    });
  }

  // An expiry already queued for this step is ignored from here on
  void disarm() {
    state_->end_step();
    state_->timer.cancel();
  }

  bool cancelled() const {
    return signal_ && signal_->cancelled();
  }

  void fail(const boost::system::error_code& ec, detail::SocketStage stage) {
    boost::system::error_code error = ec ? ec : boost::asio::error::operation_aborted;
    detail::throw_socket_error(error, stage, state_->timed_out, cancelled(), peer_);
  }

  boost::asio::io_context& io_context_;
  boost::asio::yield_context yield_;
  const TransportOptions& options_;
  std::shared_ptr<CancellationSignal> signal_;
  std::shared_ptr<ConnectionState> state_;
  std::string peer_;
};

} // namespace

//==============================================
// CONSTRUCTOR
//==============================================

CoroutineTransport::CoroutineTransport(boost::asio::io_context& io_context,
                                       boost::asio::yield_context yield,
                                       TransportOptions options,
                                       std::shared_ptr<CancellationSignal> signal)
  : io_context_(io_context),
    yield_(yield),
    options_(options),
    signal_(std::move(signal)) {}

//==============================================
// EXCHANGES
//==============================================

Response CoroutineTransport::send_receive(const protocol::Address& address, const protocol::Frame& frame) {
  CoroutineExchange exchange(io_context_, yield_, options_, signal_);
  return detail::buffered_round_trip(exchange, address, frame, options_);
}

protocol::Header CoroutineTransport::send_receive_streamed(const protocol::Address& address,
                                                           const protocol::Frame& frame,
                                                           const BodySink& sink) {
  CoroutineExchange exchange(io_context_, yield_, options_, signal_);
  return detail::streamed_round_trip(exchange, address, frame, options_, sink);
}

} // namespace network
} // namespace fdfs
