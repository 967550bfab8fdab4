#ifndef FDFS_NETWORK_TRANSPORT_HPP
#define FDFS_NETWORK_TRANSPORT_HPP

#include <chrono>
#include <cstdint>
#include <functional>
#include "protocol/codec.hpp"
#include "protocol/types.hpp"

namespace fdfs {
namespace network {

// Receives response body bytes in arrival order
using BodySink = std::function<void(const uint8_t*, std::size_t)>;

struct Response {
    protocol::Header header;
    protocol::Bytes body;
};

struct TransportOptions {
    // Applies to each resolve and connect step
    std::chrono::milliseconds connect_timeout{std::chrono::seconds(30)};
    // Applies to each read or write step
    std::chrono::milliseconds network_timeout{std::chrono::seconds(30)};
    // Bodies above this are refused by the buffered exchange
    uint64_t max_buffered_body = 256ULL * 1024 * 1024;
    // Ceiling for any declared body length
    uint64_t max_body_length = protocol::MAX_BODY_LENGTH;
};


// One request and one response over a fresh connection per exchange.
// Implementations throw TransportError for connection failures and
// FrameError for malformed or truncated responses.
class Transport {
public:
    virtual ~Transport() = default;

    // ---- EXCHANGES ----
    // Sends the frame and returns the whole response body
    virtual Response send_receive(const protocol::Address& address, const protocol::Frame& frame) = 0;
    // Sends the frame and hands the body to sink in chunks. A nonzero
    // status body is drained and never reaches the sink.
    virtual protocol::Header send_receive_streamed(const protocol::Address& address,
                                                   const protocol::Frame& frame,
                                                   const BodySink& sink) = 0;
};

} // namespace network
} // namespace fdfs

#endif // FDFS_NETWORK_TRANSPORT_HPP
