#ifndef FDFS_NETWORK_BLOCKING_TRANSPORT_HPP
#define FDFS_NETWORK_BLOCKING_TRANSPORT_HPP

#include "network/transport.hpp"

namespace fdfs {
namespace network {

// Transport for plain threads. Every exchange runs on a private
// io_context, so one instance may be shared between threads.
class BlockingTransport : public Transport {
public:
    // ---- CONSTRUCTOR ----
    explicit BlockingTransport(TransportOptions options = TransportOptions{});


    // ---- EXCHANGES ----
    Response send_receive(const protocol::Address& address, const protocol::Frame& frame) override;
    protocol::Header send_receive_streamed(const protocol::Address& address,
                                           const protocol::Frame& frame,
                                           const BodySink& sink) override;


    // ---- GETTERS ----
    const TransportOptions& options() const { return options_; }

private:
    TransportOptions options_;
};

} // namespace network
} // namespace fdfs

#endif // FDFS_NETWORK_BLOCKING_TRANSPORT_HPP
