#ifndef FDFS_CLIENT_RESULTS_HPP
#define FDFS_CLIENT_RESULTS_HPP

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include "client/file_id.hpp"
#include "network/cancellation.hpp"

namespace fdfs {
namespace client {

struct UploadResult {
    FileId file_id;
    uint64_t uploaded_size = 0;
    std::string storage_host;
};

struct DeleteResult {
    std::string status;
    // Remote path without the group
    std::string remote_path;
    std::string storage_host;
};

// Partial read; a length of zero reads to the end of the file
struct ByteRange {
    uint64_t offset = 0;
    uint64_t length = 0;
};

struct CallOptions {
    // Zero keeps the configured timeouts
    std::chrono::milliseconds timeout{0};
};

struct CoroutineCallOptions : CallOptions {
    std::shared_ptr<network::CancellationSignal> cancellation;
};

constexpr const char* DELETE_SUCCEEDED = "Delete file succeeded.";

} // namespace client
} // namespace fdfs

#endif // FDFS_CLIENT_RESULTS_HPP
