#ifndef RDSYNC_SRC_SESSION_PB_FILE_LIST_ADAPTER_H
#define RDSYNC_SRC_SESSION_PB_FILE_LIST_ADAPTER_H

#include <rdsync/session/file_entry.h>

#include <string>
#include <vector>

namespace rdsync {

/***
 * Keeps the generated protobuf types out of the session code.
 * The file list travels as a varint length followed by the serialized
 * FileList message.
 */
class FileListAdapter {
public:
  static std::string Serialize(const std::vector<FileEntry> &entries);

  // @throws ProtocolError if `data` is not a valid FileList
  static std::vector<FileEntry> Parse(const std::string &data);
};

}  // namespace rdsync

#endif  // RDSYNC_SRC_SESSION_PB_FILE_LIST_ADAPTER_H
