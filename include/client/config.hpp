#ifndef FDFS_CLIENT_CONFIG_HPP
#define FDFS_CLIENT_CONFIG_HPP

#include <chrono>
#include <string>
#include <vector>
#include "network/transport.hpp"
#include "protocol/types.hpp"

namespace fdfs {
namespace client {

// Parses "host[:port]"; throws ConfigError on an empty host or a bad port
protocol::Address parse_address(const std::string& text,
                                uint16_t default_port = protocol::TRACKER_DEFAULT_PORT);


// Immutable connection parameters shared by every operation of a client
struct ClientConfig {
    std::vector<protocol::Address> trackers;
    std::chrono::milliseconds connect_timeout{std::chrono::seconds(30)};
    std::chrono::milliseconds network_timeout{std::chrono::seconds(30)};
    // Public prefix for formatted URLs, scheme://host[:port] without a path; empty means none is known
    std::string base_url;
    uint64_t max_buffered_body = 256ULL * 1024 * 1024;
    uint64_t max_body_length = protocol::MAX_BODY_LENGTH;

    static ClientConfig from_hosts(const std::vector<std::string>& hosts,
                                   uint16_t default_port = protocol::TRACKER_DEFAULT_PORT);

    // Throws ConfigError when the values cannot drive a client
    void validate() const;

    // Transport settings, with a per-call timeout overriding both timeouts when nonzero
    network::TransportOptions transport_options(std::chrono::milliseconds timeout_override =
                                                std::chrono::milliseconds(0)) const;
};


// Reads a client.conf style key=value file. Recognised keys:
// tracker_server (repeated), connect_timeout, network_timeout (seconds), base_url.
ClientConfig load_client_config(const std::string& path);

} // namespace client
} // namespace fdfs

#endif // FDFS_CLIENT_CONFIG_HPP
