#include "file_list_adapter.h"

#include <glog/logging.h>
#include <rdsync/common/errors.h>
#include <src/rdsync/session/pb/file_list.pb.h>

namespace rdsync {

std::string FileListAdapter::Serialize(const std::vector<FileEntry> &entries) {
  auto list = FileList();
  for (const auto &entry : entries) {
    auto *item = list.add_entries();
    item->set_path(entry.path);
    item->set_size(static_cast<uint64_t>(entry.size));
    item->set_mtime(entry.mtime);
    item->set_mode(entry.mode);
    item->set_checksum(entry.checksum);
  }

  std::string result;
  CHECK(list.SerializeToString(&result)) << "cannot serialize file list";
  return result;
}

std::vector<FileEntry> FileListAdapter::Parse(const std::string &data) {
  auto list = FileList();
  if (!list.ParseFromString(data)) {
    throw ProtocolError("malformed file list");
  }

  VLOG(2) << list.DebugString();

  std::vector<FileEntry> result;
  result.reserve(list.entries_size());
  for (const auto &item : list.entries()) {
    if (item.path().empty()) {
      throw ProtocolError("file list entry without a path");
    }
    result.push_back(
        {.path = item.path(),
         .size = static_cast<std::streamsize>(item.size()),
         .mtime = item.mtime(),
         .mode = item.mode(),
         .checksum = item.checksum()});
  }
  return result;
}

}  // namespace rdsync
