#include <rdsync/common/errors.h>
#include <rdsync/transport/transport.h>

#include <string>

namespace rdsync {

void Transport::ReadExact(void *buffer, std::streamsize size) {
  auto *current = static_cast<char *>(buffer);
  std::streamsize done = 0;
  while (done < size) {
    auto count = ReadSome(current + done, size - done);
    if (count == 0) {
      throw TransportError(
          "connection closed after " + std::to_string(done) + " of " +
          std::to_string(size) + " bytes");
    }
    done += count;
  }
}

}  // namespace rdsync
