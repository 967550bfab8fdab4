#ifndef FDFS_CLI_CLI_HPP
#define FDFS_CLI_CLI_HPP

#include <iostream>
#include <string>
#include <vector>
#include "client/client.hpp"

namespace fdfs {
namespace cli {

struct ProgramOptions {
    std::string config_file;
    std::vector<std::string> trackers;
    std::string base_url;
    std::string log_level = "warning";
    std::string command;
    std::vector<std::string> arguments;
    bool valid{false};
};

// Parses flags up to the command name; the rest become its arguments
ProgramOptions parse_command_line(int argc, const char* const argv[], std::ostream& err = std::cerr);
void print_usage(const std::string& program_name, std::ostream& err = std::cerr);

// Builds the client configuration from -c or -t plus -b; throws ConfigError
client::ClientConfig make_config(const ProgramOptions& options);


// Runs one command against the cluster and reports on the given streams
class CLI {
public:
    // ---- CONSTRUCTOR ----
    CLI(client::Client& client, std::ostream& out = std::cout, std::ostream& err = std::cerr);


    // ---- EXECUTION ----
    // Returns the process exit code: 0 on success, 1 on any error
    int execute(const std::string& command, const std::vector<std::string>& arguments);

private:
    // ---- COMMAND PROCESSING ----
    void handle_upload_command(const std::string& local_file);
    void handle_upload_url_command(const std::string& local_file);
    void handle_download_command(const std::string& file_id, const std::string& local_file);
    void handle_cat_command(const std::string& file_id);
    void handle_delete_command(const std::string& file_id);
    bool handle_ping_command(const std::string& address);
    void log_and_display_error(const std::string& message, const std::string& error);

    client::Client& client_;
    std::ostream& out_;
    std::ostream& err_;
};

} // namespace cli
} // namespace fdfs

#endif // FDFS_CLI_CLI_HPP
