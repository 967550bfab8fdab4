#include "cli/cli.hpp"
#include "client/file_id.hpp"
#include "protocol/errors.hpp"
#include <boost/log/trivial.hpp>

namespace fdfs {
namespace cli {

//==============================================
// COMMAND LINE
//==============================================

void print_usage(const std::string& program_name, std::ostream& err) {
  err << "Usage: " << program_name << " [-c <client.conf> | -t <host[:port]>...] [-b <base_url>]"
      << " [--log-level <level>] <command> [args]\n"
      << "Options:\n"
      << "  -c, --config      client.conf with tracker_server entries\n"
      << "  -t, --tracker     tracker address, repeatable\n"
      << "  -b, --base-url    public URL prefix for upload-url\n"
      << "  --log-level       trace, debug, info, warning, error or fatal\n"
      << "Commands:\n"
      << "  upload <local_file>\n"
      << "  upload-url <local_file>\n"
      << "  download <file_id> <local_file>\n"
      << "  cat <file_id>\n"
      << "  delete <file_id>\n"
      << "  ping <host:port>\n"
      << "Example: " << program_name << " -t 127.0.0.1:22122 upload notes.txt\n";
}

ProgramOptions parse_command_line(int argc, const char* const argv[], std::ostream& err) {
  ProgramOptions options;
  const std::string program_name = argc > 0 ? argv[0] : "fdfs_cli";

  int i = 1;
  for (; i < argc; ++i) {
    const std::string flag(argv[i]);
    if (flag.empty() || flag[0] != '-') {
      break;
    }
    if (i + 1 >= argc) {
      err << "Error: Missing value for " << flag << '\n';
      print_usage(program_name, err);
      return options;
    }
    const std::string value(argv[++i]);

    if (flag == "-c" || flag == "--config") {
      options.config_file = value;
    } else if (flag == "-t" || flag == "--tracker") {
      options.trackers.push_back(value);
    } else if (flag == "-b" || flag == "--base-url") {
      options.base_url = value;
    } else if (flag == "--log-level") {
      options.log_level = value;
    } else {
      err << "Error: Unknown argument: " << flag << '\n';
      print_usage(program_name, err);
      return options;
    }
  }

  if (i >= argc) {
    err << "Error: No command given\n";
    print_usage(program_name, err);
    return options;
  }
  options.command = argv[i++];
  for (; i < argc; ++i) {
    options.arguments.emplace_back(argv[i]);
  }

  if (options.config_file.empty() && options.trackers.empty()) {
    err << "Error: Either -c or -t is required\n";
    print_usage(program_name, err);
    return options;
  }

  options.valid = true;
  return options;
}

client::ClientConfig make_config(const ProgramOptions& options) {
  client::ClientConfig config = options.config_file.empty()
    ? client::ClientConfig::from_hosts(options.trackers)
    : client::load_client_config(options.config_file);
  if (!options.base_url.empty()) {
    config.base_url = options.base_url;
  }
  config.validate();
  return config;
}

//==============================================
// CONSTRUCTOR
//==============================================

CLI::CLI(client::Client& client, std::ostream& out, std::ostream& err)
  : client_(client),
    out_(out),
    err_(err) {
  BOOST_LOG_TRIVIAL(debug) << "CLI: Initialized";
}

//==============================================
// EXECUTION
//==============================================

int CLI::execute(const std::string& command, const std::vector<std::string>& arguments) {
  BOOST_LOG_TRIVIAL(debug) << "CLI: Processing command " << command << " with " << arguments.size() << " argument(s)";

  const std::size_t expected = command == "download" ? 2 : 1;
  if (arguments.size() != expected) {
    err_ << "Invalid arguments for '" << command << "', expected " << expected << std::endl;
    return 1;
  }

  try {
    if (command == "upload") {
      handle_upload_command(arguments[0]);
    } else if (command == "upload-url") {
      handle_upload_url_command(arguments[0]);
    } else if (command == "download") {
      handle_download_command(arguments[0], arguments[1]);
    } else if (command == "cat") {
      handle_cat_command(arguments[0]);
    } else if (command == "delete") {
      handle_delete_command(arguments[0]);
    } else if (command == "ping") {
      return handle_ping_command(arguments[0]) ? 0 : 1;
    } else {
      err_ << "Unknown command: " << command << std::endl;
      return 1;
    }
  } catch (const FdfsError& e) {
    log_and_display_error("Command '" + command + "' failed", e.what());
    return 1;
  }
  return 0;
}

//==============================================
// COMMAND PROCESSING
//==============================================

void CLI::handle_upload_command(const std::string& local_file) {
  client::UploadResult result = client_.upload_file(local_file);
  out_ << result.file_id.to_string() << std::endl;
}

void CLI::handle_upload_url_command(const std::string& local_file) {
  client::UploadResult result = client_.upload_file(local_file);
  out_ << client_.url_for(result) << std::endl;
}

void CLI::handle_download_command(const std::string& file_id, const std::string& local_file) {
  uint64_t size = client_.download_to_file(file_id, local_file);
  out_ << "Downloaded " << size << " bytes to " << local_file << std::endl;
}

void CLI::handle_cat_command(const std::string& file_id) {
  client_.download_to_sink(file_id, [this](const uint8_t* data, std::size_t size) {
    out_.write(reinterpret_cast<const char*>(data), static_cast<std::streamsize>(size));
  });
  out_.flush();
}

void CLI::handle_delete_command(const std::string& file_id) {
  client::DeleteResult result = client_.delete_file(file_id);
  out_ << result.status << " " << result.remote_path << " on " << result.storage_host << std::endl;
}

bool CLI::handle_ping_command(const std::string& address) {
  protocol::Address target = client::parse_address(address);
  if (client_.active_test(target)) {
    out_ << target.to_string() << " is alive" << std::endl;
    return true;
  }
  err_ << target.to_string() << " answered with an error status" << std::endl;
  return false;
}

void CLI::log_and_display_error(const std::string& message, const std::string& error) {
  BOOST_LOG_TRIVIAL(error) << "CLI: " << message << ": " << error;
  err_ << message << ": " << error << std::endl;
}

} // namespace cli
} // namespace fdfs
