#ifndef RDSYNC_SRC_SESSION_INCLUDE_RDSYNC_SESSION_FILE_STORE_H
#define RDSYNC_SRC_SESSION_INCLUDE_RDSYNC_SESSION_FILE_STORE_H

#include <rdsync/readers/reader.h>
#include <rdsync/session/file_entry.h>

#include <filesystem>
#include <fstream>
#include <map>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

namespace rdsync {

/**
 * Output of one file, invisible under its final name until Commit().
 * Destroying an uncommitted file discards everything written to it.
 */
class StagedFile {
public:
  virtual ~StagedFile() = default;

  virtual std::ostream &Stream() = 0;

  // @throws IoError if the file cannot be put in place
  virtual void Commit() = 0;
};

/**
 * Where the session reads source and basis files and writes results.
 */
class FileStore {
public:
  virtual ~FileStore() = default;

  // regular files, sorted by path
  virtual std::vector<FileEntry> List() = 0;

  /**
   * @return nullptr when `path` does not exist
   * @throws IoError when it exists but cannot be opened
   */
  virtual std::unique_ptr<Reader> OpenForRead(const std::string &path) = 0;

  // @throws IoError
  virtual std::unique_ptr<StagedFile> CreateStaged(const FileEntry &entry) = 0;

  // relative, '/' separated, no "." or ".." components
  static bool IsSafePath(const std::string &path);
};

/**
 * Files under a local directory. Staged files are written next to their
 * destination and renamed over it on commit.
 */
class LocalFileStore final : public FileStore {
  std::filesystem::path root_;
  bool compute_checksums_;

public:
  /**
   * @param compute_checksums fill FileEntry::checksum when listing
   */
  explicit LocalFileStore(
      std::filesystem::path root,
      bool compute_checksums = false);

  std::vector<FileEntry> List() override;

  std::unique_ptr<Reader> OpenForRead(const std::string &path) override;

  std::unique_ptr<StagedFile> CreateStaged(const FileEntry &entry) override;
};

/**
 * Files held in memory, keyed by path.
 */
class MemoryFileStore : public FileStore {
  std::map<std::string, FileEntry> entries_;
  std::map<std::string, std::string> data_;

public:
  void Put(const std::string &path, std::string data);

  void Put(const FileEntry &entry, std::string data);

  [[nodiscard]] bool Contains(const std::string &path) const;

  [[nodiscard]] const std::string &Get(const std::string &path) const;

  std::vector<FileEntry> List() override;

  std::unique_ptr<Reader> OpenForRead(const std::string &path) override;

  std::unique_ptr<StagedFile> CreateStaged(const FileEntry &entry) override;
};

}  // namespace rdsync

#endif  // RDSYNC_SRC_SESSION_INCLUDE_RDSYNC_SESSION_FILE_STORE_H
