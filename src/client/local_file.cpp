#include "client/local_file.hpp"
#include "protocol/errors.hpp"
#include "protocol/types.hpp"
#include <boost/log/trivial.hpp>
#include <filesystem>
#include <iterator>

namespace fdfs {
namespace client {

namespace fs = std::filesystem;

//==============================================
// READING
//==============================================

LocalFile read_local_file(const std::string& path) {
  std::error_code ec;
  if (!fs::exists(path, ec)) {
    throw LocalFileError("file not found: " + path);
  }
  if (!fs::is_regular_file(path, ec)) {
    throw LocalFileError("not a regular file: " + path);
  }

  std::ifstream input(path, std::ios::binary);
  if (!input) {
    throw LocalFileError("cannot open for reading: " + path);
  }

  LocalFile file;
  file.data.assign(std::istreambuf_iterator<char>(input), std::istreambuf_iterator<char>());
  if (input.bad()) {
    throw LocalFileError("read failed: " + path);
  }

  std::string extension = fs::path(path).extension().string();
  if (!extension.empty() && extension.front() == '.') {
    extension.erase(0, 1);
  }
  if (extension.size() > protocol::FILE_EXT_NAME_MAX_LENGTH) {
    BOOST_LOG_TRIVIAL(debug) << "Local file: Extension of " << path << " too long, uploading without one";
    extension.clear();
  }
  file.extension = extension;

  BOOST_LOG_TRIVIAL(debug) << "Local file: Read " << file.data.size() << " bytes from " << path;
  return file;
}

//==============================================
// WRITING
//==============================================

LocalFileSink::LocalFileSink(std::string path)
  : path_(std::move(path)) {}

LocalFileSink::~LocalFileSink() {
  if (committed_ || !output_.is_open()) {
    return;
  }
  output_.close();
  std::error_code ec;
  fs::remove(path_, ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(warning) << "Local file: Could not remove partial file " << path_ << ": " << ec.message();
  } else {
    BOOST_LOG_TRIVIAL(debug) << "Local file: Removed partial file " << path_;
  }
}

void LocalFileSink::open() {
  output_.open(path_, std::ios::binary | std::ios::trunc);
  if (!output_) {
    throw LocalFileError("cannot open for writing: " + path_);
  }
}

void LocalFileSink::write(const uint8_t* data, std::size_t size) {
  if (!output_.is_open()) {
    open();
  }
  output_.write(reinterpret_cast<const char*>(data), static_cast<std::streamsize>(size));
  if (!output_) {
    throw LocalFileError("write failed: " + path_);
  }
  bytes_written_ += size;
}

void LocalFileSink::commit() {
  if (!output_.is_open()) {
    open();
  }
  output_.close();
  if (output_.fail()) {
    throw LocalFileError("close failed: " + path_);
  }
  committed_ = true;
  BOOST_LOG_TRIVIAL(debug) << "Local file: Wrote " << bytes_written_ << " bytes to " << path_;
}

} // namespace client
} // namespace fdfs
