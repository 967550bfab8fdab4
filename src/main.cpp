#include "cli/cli.hpp"
#include "logger/logger.hpp"
#include "protocol/errors.hpp"
#include <iostream>

int main(int argc, char* argv[]) {
  const auto options = fdfs::cli::parse_command_line(argc, argv);
  if (!options.valid) {
    return 1;
  }

  try {
    fdfs::logger::init_console_logging(fdfs::logger::parse_severity(options.log_level));
    fdfs::client::Client client(fdfs::cli::make_config(options));
    fdfs::cli::CLI cli(client);
    return cli.execute(options.command, options.arguments);
  } catch (const fdfs::FdfsError& e) {
    std::cerr << "Error: " << e.what() << '\n';
    return 1;
  }
}
