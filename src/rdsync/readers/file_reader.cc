#include <rdsync/common/errors.h>
#include <rdsync/readers/file_reader.h>

#include <algorithm>

namespace rdsync {

namespace fs = std::filesystem;

FileReader::FileReader(const fs::path &path)
    : path_(path),
      data_(path, std::ios::binary),
      size_(0) {
  std::error_code ec;
  auto size = fs::file_size(path_, ec);
  if (!data_ || ec) {
    throw IoError("unable to open " + path_.string() + " for reading");
  }
  size_ = static_cast<std::streamsize>(size);
}

// the size is captured at open time, a file growing underneath us is read
// only up to that size
std::streamsize FileReader::GetSize() const { return size_; }

std::streamsize
FileReader::Read(void *buffer, std::streamoff offset, std::streamsize size) {
  if (offset >= size_) {
    return Reader::Read(buffer, offset, 0);
  }

  // the seekg was failing if the eof bit was set... clear it first
  data_.clear();

  data_.seekg(offset);
  data_.read(static_cast<char *>(buffer), std::min(size, size_ - offset));
  if (data_.bad()) {
    throw IoError("error reading " + path_.string());
  }
  return Reader::Read(buffer, offset, data_.gcount());
}

}  // namespace rdsync
