#include <rdsync/common/errors.h>

namespace rdsync {

Error::Error(const std::string &what) : std::runtime_error(what) {}

ProtocolError::ProtocolError(const std::string &what) : Error(what) {}

FrameTooLarge::FrameTooLarge(std::streamsize size, std::streamsize limit)
    : ProtocolError(
          "frame of " + std::to_string(size) + " bytes exceeds limit of " +
          std::to_string(limit)) {}

TransportError::TransportError(const std::string &what) : Error(what) {}

RemoteError::RemoteError(const std::string &what) : Error(what) {}

ReconstructionError::ReconstructionError(const std::string &what)
    : Error(what) {}

IntegrityError::IntegrityError(const std::string &what) : Error(what) {}

IoError::IoError(const std::string &what) : Error(what) {}

const char *ToString(FileErrorKind kind) {
  switch (kind) {
    case FileErrorKind::kReconstruction:
      return "reconstruction";
    case FileErrorKind::kIntegrity:
      return "integrity";
    case FileErrorKind::kSender:
      return "sender";
    case FileErrorKind::kIo:
      return "io";
  }
  return "unknown";
}

}  // namespace rdsync
