#ifndef RDSYNC_SRC_READERS_INCLUDE_RDSYNC_READERS_FILE_READER_H
#define RDSYNC_SRC_READERS_INCLUDE_RDSYNC_READERS_FILE_READER_H

#include <rdsync/readers/reader.h>

#include <filesystem>
#include <fstream>

namespace rdsync {

class FileReader final : public Reader {
  std::filesystem::path path_;
  std::ifstream data_;
  std::streamsize size_;

public:
  // @throws IoError if the file cannot be opened
  explicit FileReader(const std::filesystem::path &path);

  [[nodiscard]] std::streamsize GetSize() const override;

  std::streamsize
  Read(void *buffer, std::streamoff offset, std::streamsize size) override;
};

}  // namespace rdsync

#endif  // RDSYNC_SRC_READERS_INCLUDE_RDSYNC_READERS_FILE_READER_H
