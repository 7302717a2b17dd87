#ifndef RDSYNC_SRC_COMMON_INCLUDE_RDSYNC_COMMON_ERRORS_H
#define RDSYNC_SRC_COMMON_INCLUDE_RDSYNC_COMMON_ERRORS_H

#include <ios>
#include <stdexcept>
#include <string>

namespace rdsync {

/**
 * Base of every error raised by rdsync.
 *
 * Session-fatal errors: ProtocolError (and FrameTooLarge), TransportError,
 * RemoteError.
 * File-fatal errors: ReconstructionError, IntegrityError, IoError.
 */
class Error : public std::runtime_error {
public:
  explicit Error(const std::string &what);
};

class ProtocolError : public Error {
public:
  explicit ProtocolError(const std::string &what);
};

class FrameTooLarge final : public ProtocolError {
public:
  FrameTooLarge(std::streamsize size, std::streamsize limit);
};

class TransportError final : public Error {
public:
  explicit TransportError(const std::string &what);
};

// the peer sent an Error frame and gave up on the session
class RemoteError final : public Error {
public:
  explicit RemoteError(const std::string &what);
};

class ReconstructionError final : public Error {
public:
  explicit ReconstructionError(const std::string &what);
};

class IntegrityError final : public Error {
public:
  explicit IntegrityError(const std::string &what);
};

class IoError final : public Error {
public:
  explicit IoError(const std::string &what);
};

enum class FileErrorKind {
  kReconstruction,
  kIntegrity,
  kSender,
  kIo,
};

const char *ToString(FileErrorKind kind);

}  // namespace rdsync

#endif  // RDSYNC_SRC_COMMON_INCLUDE_RDSYNC_COMMON_ERRORS_H
