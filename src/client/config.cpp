#include "client/config.hpp"
#include "protocol/errors.hpp"
#include <boost/log/trivial.hpp>
#include <boost/program_options.hpp>
#include <filesystem>
#include <fstream>
#include <limits>

namespace fdfs {
namespace client {

namespace po = boost::program_options;

//==============================================
// ADDRESSES
//==============================================

protocol::Address parse_address(const std::string& text, uint16_t default_port) {
  protocol::Address address;
  address.port = default_port;

  std::size_t colon = text.rfind(':');
  if (colon == std::string::npos) {
    address.host = text;
  } else {
    address.host = text.substr(0, colon);
    std::string port_text = text.substr(colon + 1);
    if (port_text.empty() || port_text.find_first_not_of("0123456789") != std::string::npos) {
      throw ConfigError("invalid port in address: " + text);
    }
    unsigned long port = 0;
    try {
      port = std::stoul(port_text);
    } catch (const std::out_of_range&) {
      throw ConfigError("port out of range in address: " + text);
    }
    if (port == 0 || port > std::numeric_limits<uint16_t>::max()) {
      throw ConfigError("port out of range in address: " + text);
    }
    address.port = static_cast<uint16_t>(port);
  }

  if (address.host.empty()) {
    throw ConfigError("empty host in address: " + text);
  }
  return address;
}

//==============================================
// CLIENT CONFIG
//==============================================

namespace {

// Identifiers are parsed back from URLs by dropping scheme and host, so
// the base may not carry a path of its own
void check_base_url(const std::string& base_url) {
  std::size_t scheme_end = base_url.find("://");
  if (scheme_end == std::string::npos || scheme_end == 0) {
    throw ConfigError("base_url needs a scheme: " + base_url);
  }
  std::size_t host_start = scheme_end + 3;
  std::size_t path_start = base_url.find('/', host_start);
  if (path_start == host_start || host_start >= base_url.size()) {
    throw ConfigError("base_url has no host: " + base_url);
  }
  if (path_start != std::string::npos &&
      base_url.find_first_not_of('/', path_start) != std::string::npos) {
    throw ConfigError("base_url may not contain a path: " + base_url);
  }
}

// Config values are seconds; anything beyond the millisecond range is refused
std::chrono::milliseconds timeout_seconds(const po::variables_map& values, const std::string& key) {
  long seconds = values[key].as<long>();
  constexpr long limit = std::numeric_limits<std::chrono::milliseconds::rep>::max() / 1000;
  if (seconds <= 0 || seconds > limit) {
    throw ConfigError(key + " out of range: " + std::to_string(seconds));
  }
  return std::chrono::seconds(seconds);
}

} // namespace

ClientConfig ClientConfig::from_hosts(const std::vector<std::string>& hosts, uint16_t default_port) {
  ClientConfig config;
  for (const auto& host : hosts) {
    config.trackers.push_back(parse_address(host, default_port));
  }
  return config;
}

void ClientConfig::validate() const {
  if (trackers.empty()) {
    throw ConfigError("no tracker server configured");
  }
  if (connect_timeout.count() <= 0) {
    throw ConfigError("connect_timeout must be positive");
  }
  if (network_timeout.count() <= 0) {
    throw ConfigError("network_timeout must be positive");
  }
  if (max_buffered_body > max_body_length) {
    throw ConfigError("max_buffered_body exceeds max_body_length");
  }
  if (!base_url.empty()) {
    check_base_url(base_url);
  }
}

network::TransportOptions ClientConfig::transport_options(std::chrono::milliseconds timeout_override) const {
  network::TransportOptions options;
  options.connect_timeout = timeout_override.count() > 0 ? timeout_override : connect_timeout;
  options.network_timeout = timeout_override.count() > 0 ? timeout_override : network_timeout;
  options.max_buffered_body = max_buffered_body;
  options.max_body_length = max_body_length;
  return options;
}

//==============================================
// CONFIG FILE
//==============================================

ClientConfig load_client_config(const std::string& path) {
  BOOST_LOG_TRIVIAL(debug) << "Config: Loading client config from " << path;

  if (!std::filesystem::is_regular_file(path)) {
    throw ConfigError("config file not found: " + path);
  }
  std::ifstream input(path);
  if (!input) {
    throw ConfigError("cannot open config file: " + path);
  }

  po::options_description description("client config");
  description.add_options()
    ("tracker_server", po::value<std::vector<std::string>>()->composing(), "tracker host:port, repeatable")
    ("connect_timeout", po::value<long>(), "connect timeout in seconds")
    ("network_timeout", po::value<long>(), "network timeout in seconds")
    ("base_url", po::value<std::string>(), "public URL prefix");

  po::variables_map values;
  try {
    po::store(po::parse_config_file(input, description, true), values);
    po::notify(values);
  } catch (const po::error& e) {
    throw ConfigError(path + ": " + e.what());
  }

  ClientConfig config;
  if (values.count("tracker_server")) {
    for (const auto& entry : values["tracker_server"].as<std::vector<std::string>>()) {
      config.trackers.push_back(parse_address(entry));
    }
  }
  if (values.count("connect_timeout")) {
    config.connect_timeout = timeout_seconds(values, "connect_timeout");
  }
  if (values.count("network_timeout")) {
    config.network_timeout = timeout_seconds(values, "network_timeout");
  }
  if (values.count("base_url")) {
    config.base_url = values["base_url"].as<std::string>();
  }

  config.validate();
  BOOST_LOG_TRIVIAL(info) << "Config: Loaded " << config.trackers.size() << " tracker(s) from " << path;
  return config;
}

} // namespace client
} // namespace fdfs
