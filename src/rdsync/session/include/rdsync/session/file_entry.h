#ifndef RDSYNC_SRC_SESSION_INCLUDE_RDSYNC_SESSION_FILE_ENTRY_H
#define RDSYNC_SRC_SESSION_INCLUDE_RDSYNC_SESSION_FILE_ENTRY_H

#include <cstdint>
#include <ios>
#include <string>

namespace rdsync {

struct FileEntry {
  // relative to the store root, '/' separated
  std::string path;
  std::streamsize size{};
  int64_t mtime{};
  uint32_t mode{};
  // unseeded StrongChecksum bytes of the whole file, empty when unknown
  std::string checksum;

  bool operator==(const FileEntry &other) const = default;
};

}  // namespace rdsync

#endif  // RDSYNC_SRC_SESSION_INCLUDE_RDSYNC_SESSION_FILE_ENTRY_H
