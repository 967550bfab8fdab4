#ifndef FDFS_NETWORK_EXCHANGE_HPP
#define FDFS_NETWORK_EXCHANGE_HPP

#include <algorithm>
#include <array>
#include <optional>
#include <boost/asio/ip/address.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/log/trivial.hpp>
#include "network/transport.hpp"
#include "protocol/codec.hpp"
#include "protocol/errors.hpp"

// Round trip logic shared by the blocking and cooperative transports.
// An Exchange provides connect(address), write(data, size),
// read(data, size) reading exactly size bytes, and close().

namespace fdfs {
namespace network {
namespace detail {

constexpr std::size_t IO_CHUNK_SIZE = 64 * 1024;

// Endpoint for an IPv4 or IPv6 literal host. Such hosts skip the
// resolver, whose lookups cannot be interrupted once started.
inline std::optional<boost::asio::ip::tcp::endpoint> literal_endpoint(const protocol::Address& address) {
  boost::system::error_code ec;
  boost::asio::ip::address ip = boost::asio::ip::make_address(address.host, ec);
  if (ec) {
    return std::nullopt;
  }
  return boost::asio::ip::tcp::endpoint(ip, address.port);
}

template <typename Exchange>
void write_frame(Exchange& exchange, const protocol::Frame& frame) {
  exchange.write(frame.head.data(), frame.head.size());

  std::size_t offset = 0;
  while (offset < frame.payload_size) {
    std::size_t chunk = std::min(IO_CHUNK_SIZE, frame.payload_size - offset);
    exchange.write(frame.payload + offset, chunk);
    offset += chunk;
  }
}

template <typename Exchange>
protocol::Header read_header(Exchange& exchange, const TransportOptions& options) {
  std::array<uint8_t, protocol::HEADER_LENGTH> raw;
  exchange.read(raw.data(), raw.size());
  protocol::Header header = protocol::decode_header(raw, options.max_body_length);
  protocol::check_response_header(header);
  return header;
}

template <typename Exchange>
Response buffered_round_trip(Exchange& exchange, const protocol::Address& address,
                             const protocol::Frame& frame, const TransportOptions& options) {
  exchange.connect(address);
  write_frame(exchange, frame);

  Response response;
  response.header = read_header(exchange, options);
  if (response.header.length > options.max_buffered_body) {
    BOOST_LOG_TRIVIAL(error) << "Transport: Response of " << response.header.length
                             << " bytes exceeds buffered limit from " << address.to_string();
    throw FrameError("response body of " + std::to_string(response.header.length) +
                     " bytes exceeds buffered limit of " + std::to_string(options.max_buffered_body));
  }

  response.body.resize(static_cast<std::size_t>(response.header.length));
  std::size_t offset = 0;
  while (offset < response.body.size()) {
    std::size_t chunk = std::min(IO_CHUNK_SIZE, response.body.size() - offset);
    exchange.read(response.body.data() + offset, chunk);
    offset += chunk;
  }
  exchange.close();

  BOOST_LOG_TRIVIAL(debug) << "Transport: Received " << response.body.size()
                           << " body bytes, status " << static_cast<int>(response.header.status)
                           << " from " << address.to_string();
  return response;
}

template <typename Exchange>
protocol::Header streamed_round_trip(Exchange& exchange, const protocol::Address& address,
                                     const protocol::Frame& frame, const TransportOptions& options,
                                     const BodySink& sink) {
  exchange.connect(address);
  write_frame(exchange, frame);

  protocol::Header header = read_header(exchange, options);
  bool deliver = header.status == 0;

  protocol::Bytes chunk_buffer(static_cast<std::size_t>(
      std::min<uint64_t>(IO_CHUNK_SIZE, header.length)));
  uint64_t remaining = header.length;
  while (remaining > 0) {
    std::size_t chunk = static_cast<std::size_t>(std::min<uint64_t>(chunk_buffer.size(), remaining));
    exchange.read(chunk_buffer.data(), chunk);
    if (deliver) {
      sink(chunk_buffer.data(), chunk);
    }
    remaining -= chunk;
  }
  exchange.close();

  BOOST_LOG_TRIVIAL(debug) << "Transport: Streamed " << header.length
                           << " body bytes, status " << static_cast<int>(header.status)
                           << " from " << address.to_string();
  return header;
}

} // namespace detail
} // namespace network
} // namespace fdfs

#endif // FDFS_NETWORK_EXCHANGE_HPP
