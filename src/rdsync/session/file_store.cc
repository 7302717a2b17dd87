#include <glog/logging.h>
#include <rdsync/checksums/strong_checksum.h>
#include <rdsync/common/errors.h>
#include <rdsync/readers/file_reader.h>
#include <rdsync/readers/memory_reader.h>
#include <rdsync/session/file_store.h>

#include <fcntl.h>
#include <sys/stat.h>

#include <algorithm>
#include <random>

namespace rdsync {

namespace fs = std::filesystem;

bool FileStore::IsSafePath(const std::string &path) {
  if (path.empty() || path.front() == '/') {
    return false;
  }
  std::size_t begin = 0;
  while (begin <= path.size()) {
    auto end = path.find('/', begin);
    if (end == std::string::npos) {
      end = path.size();
    }
    auto component = path.substr(begin, end - begin);
    if (component.empty() || component == "." || component == "..") {
      return false;
    }
    begin = end + 1;
  }
  return path.find('\0') == std::string::npos;
}

namespace {

std::string RandomSuffix() {
  static constexpr char kDigits[] = "0123456789abcdef";
  std::random_device device;
  std::string result;
  for (int i = 0; i < 8; i++) {
    result += kDigits[device() % 16];
  }
  return result;
}

class LocalStagedFile final : public StagedFile {
  fs::path destination_;
  fs::path temporary_;
  FileEntry entry_;
  std::ofstream stream_;
  bool committed_{};

  void ApplyAttributes() const {
    std::error_code error;
    if (entry_.mode != 0) {
      fs::permissions(
          destination_,
          static_cast<fs::perms>(entry_.mode & 07777),
          error);
      LOG_IF(WARNING, error)
          << "cannot set mode of " << destination_ << ": " << error.message();
    }
    if (entry_.mtime != 0) {
      timespec times[2] = {{0, UTIME_OMIT}, {entry_.mtime, 0}};
      if (utimensat(AT_FDCWD, destination_.c_str(), times, 0) != 0) {
        PLOG(WARNING) << "cannot set mtime of " << destination_;
      }
    }
  }

public:
  LocalStagedFile(fs::path destination, FileEntry entry)
      : destination_(std::move(destination)),
        entry_(std::move(entry)) {
    std::error_code error;
    fs::create_directories(destination_.parent_path(), error);
    if (error) {
      throw IoError(
          "cannot create " + destination_.parent_path().string() + ": " +
          error.message());
    }

    temporary_ = destination_.parent_path() /
                 ("." + destination_.filename().string() + ".rdsync." +
                  RandomSuffix());
    stream_.open(temporary_, std::ios::binary | std::ios::trunc);
    if (!stream_) {
      throw IoError("cannot create " + temporary_.string());
    }
    VLOG(2) << "staging " << destination_ << " in " << temporary_;
  }

  ~LocalStagedFile() override {
    if (committed_) {
      return;
    }
    stream_.close();
    std::error_code error;
    fs::remove(temporary_, error);
    LOG_IF(WARNING, error) << "cannot remove " << temporary_ << ": "
                           << error.message();
  }

  std::ostream &Stream() override { return stream_; }

  void Commit() override {
    CHECK(!committed_) << "already committed";
    stream_.close();
    if (!stream_) {
      throw IoError("cannot write " + temporary_.string());
    }

    std::error_code error;
    fs::rename(temporary_, destination_, error);
    if (error) {
      throw IoError(
          "cannot rename " + temporary_.string() + " to " +
          destination_.string() + ": " + error.message());
    }
    committed_ = true;

    ApplyAttributes();
  }
};

class MemoryStagedFile final : public StagedFile {
  MemoryFileStore &store_;
  FileEntry entry_;
  std::ostringstream stream_;

public:
  MemoryStagedFile(MemoryFileStore &store, FileEntry entry)
      : store_(store),
        entry_(std::move(entry)) {}

  std::ostream &Stream() override { return stream_; }

  void Commit() override { store_.Put(entry_, stream_.str()); }
};

}  // namespace

LocalFileStore::LocalFileStore(fs::path root, bool compute_checksums)
    : root_(std::move(root)),
      compute_checksums_(compute_checksums) {}

std::vector<FileEntry> LocalFileStore::List() {
  std::vector<FileEntry> result;

  std::error_code error;
  if (!fs::exists(root_, error)) {
    LOG(WARNING) << "root " << root_ << " does not exist";
    return result;
  }

  for (fs::recursive_directory_iterator i(root_, error), end; i != end;
       i.increment(error)) {
    if (error) {
      throw IoError("cannot list " + root_.string() + ": " + error.message());
    }
    if (!i->is_regular_file()) {
      continue;
    }

    struct stat info {};
    if (stat(i->path().c_str(), &info) != 0) {
      throw IoError("cannot stat " + i->path().string());
    }

    FileEntry entry{
        .path = fs::relative(i->path(), root_).generic_string(),
        .size = static_cast<std::streamsize>(info.st_size),
        .mtime = static_cast<int64_t>(info.st_mtime),
        .mode = static_cast<uint32_t>(info.st_mode & 07777)};

    if (compute_checksums_) {
      std::ifstream input(i->path(), std::ios::binary);
      if (!input) {
        throw IoError("cannot open " + i->path().string());
      }
      auto bytes = StrongChecksum::Compute(0, input).ToBytes();
      entry.checksum.assign(bytes.begin(), bytes.end());
    }

    result.push_back(std::move(entry));
  }
  if (error) {
    throw IoError("cannot list " + root_.string() + ": " + error.message());
  }

  std::sort(result.begin(), result.end(), [](const auto &a, const auto &b) {
    return a.path < b.path;
  });

  LOG(INFO) << "listed " << result.size() << " files under " << root_;
  return result;
}

std::unique_ptr<Reader> LocalFileStore::OpenForRead(const std::string &path) {
  auto full_path = root_ / path;
  std::error_code error;
  if (!fs::is_regular_file(full_path, error)) {
    return nullptr;
  }
  return std::make_unique<FileReader>(full_path);
}

std::unique_ptr<StagedFile> LocalFileStore::CreateStaged(
    const FileEntry &entry) {
  CHECK(IsSafePath(entry.path)) << "unsafe path " << entry.path;
  return std::make_unique<LocalStagedFile>(root_ / entry.path, entry);
}

void MemoryFileStore::Put(const std::string &path, std::string data) {
  Put(FileEntry{.path = path}, std::move(data));
}

void MemoryFileStore::Put(const FileEntry &entry, std::string data) {
  auto stored = entry;
  stored.size = static_cast<std::streamsize>(data.size());
  entries_[entry.path] = stored;
  data_[entry.path] = std::move(data);
}

bool MemoryFileStore::Contains(const std::string &path) const {
  return data_.contains(path);
}

const std::string &MemoryFileStore::Get(const std::string &path) const {
  auto i = data_.find(path);
  CHECK(i != data_.end()) << "no file " << path;
  return i->second;
}

std::vector<FileEntry> MemoryFileStore::List() {
  std::vector<FileEntry> result;
  result.reserve(entries_.size());
  for (const auto &[path, entry] : entries_) {
    result.push_back(entry);
  }
  return result;
}

std::unique_ptr<Reader> MemoryFileStore::OpenForRead(const std::string &path) {
  auto i = data_.find(path);
  if (i == data_.end()) {
    return nullptr;
  }
  return std::make_unique<MemoryReader>(i->second);
}

std::unique_ptr<StagedFile> MemoryFileStore::CreateStaged(
    const FileEntry &entry) {
  return std::make_unique<MemoryStagedFile>(*this, entry);
}

}  // namespace rdsync
