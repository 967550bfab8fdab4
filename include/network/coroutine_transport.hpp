#ifndef FDFS_NETWORK_COROUTINE_TRANSPORT_HPP
#define FDFS_NETWORK_COROUTINE_TRANSPORT_HPP

#include <memory>
#include <boost/asio/io_context.hpp>
#include <boost/asio/spawn.hpp>
#include "network/cancellation.hpp"
#include "network/transport.hpp"

namespace fdfs {
namespace network {

// Transport for code running inside boost::asio::spawn. Exchanges
// suspend the calling coroutine instead of blocking the thread.
// Bound to one coroutine; do not share an instance between coroutines.
class CoroutineTransport : public Transport {
public:
    // ---- CONSTRUCTOR ----
    CoroutineTransport(boost::asio::io_context& io_context,
                       boost::asio::yield_context yield,
                       TransportOptions options = TransportOptions{},
                       std::shared_ptr<CancellationSignal> signal = nullptr);


    // ---- EXCHANGES ----
    // Throws TransportError with code CANCELLED once the signal fires
    Response send_receive(const protocol::Address& address, const protocol::Frame& frame) override;
    protocol::Header send_receive_streamed(const protocol::Address& address,
                                           const protocol::Frame& frame,
                                           const BodySink& sink) override;

private:
    boost::asio::io_context& io_context_;
    boost::asio::yield_context yield_;
    TransportOptions options_;
    std::shared_ptr<CancellationSignal> signal_;
};

} // namespace network
} // namespace fdfs

#endif // FDFS_NETWORK_COROUTINE_TRANSPORT_HPP
