#ifndef FDFS_CLIENT_LOCAL_FILE_HPP
#define FDFS_CLIENT_LOCAL_FILE_HPP

#include <cstdint>
#include <fstream>
#include <string>
#include "protocol/types.hpp"

namespace fdfs {
namespace client {

struct LocalFile {
    protocol::Bytes data;
    // Last dot segment of the file name; empty when none or too long to store
    std::string extension;
};

// Throws LocalFileError for a missing or non-regular file
LocalFile read_local_file(const std::string& path);


// Download target that creates its file on the first chunk. An
// uncommitted file is removed again on destruction.
class LocalFileSink {
public:
    explicit LocalFileSink(std::string path);
    ~LocalFileSink();

    LocalFileSink(const LocalFileSink&) = delete;
    LocalFileSink& operator=(const LocalFileSink&) = delete;

    void write(const uint8_t* data, std::size_t size);
    // Flushes and keeps the file, creating it empty when nothing arrived
    void commit();

    uint64_t bytes_written() const { return bytes_written_; }

private:
    void open();

    std::string path_;
    std::ofstream output_;
    uint64_t bytes_written_ = 0;
    bool committed_ = false;
};

} // namespace client
} // namespace fdfs

#endif // FDFS_CLIENT_LOCAL_FILE_HPP
