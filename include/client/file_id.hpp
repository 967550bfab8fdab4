#ifndef FDFS_CLIENT_FILE_ID_HPP
#define FDFS_CLIENT_FILE_ID_HPP

#include <string>

namespace fdfs {
namespace client {

// Externally visible identifier of a stored file: "group/path" or a URL
// ending in it. The scheme and host of a URL are not kept.
struct FileId {
    std::string group_name;
    std::string remote_filename;

    // Throws IdentifierError when no group or path segment can be found
    static FileId parse(const std::string& text);

    // Bare "group/path" form
    std::string to_string() const;
    // "base/group/path"; an empty base gives the bare form
    std::string format(const std::string& base_url) const;
};

bool operator==(const FileId& lhs, const FileId& rhs);
bool operator!=(const FileId& lhs, const FileId& rhs);

} // namespace client
} // namespace fdfs

#endif // FDFS_CLIENT_FILE_ID_HPP
