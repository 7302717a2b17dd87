#ifndef RDSYNC_SRC_TRANSPORT_INCLUDE_RDSYNC_TRANSPORT_TRANSPORT_H
#define RDSYNC_SRC_TRANSPORT_INCLUDE_RDSYNC_TRANSPORT_TRANSPORT_H

#include <ios>

namespace rdsync {

/**
 * Blocking, reliable, ordered byte stream between the two session sides.
 */
class Transport {
public:
  virtual ~Transport() = default;

  /**
   * blocks until at least one byte is available
   * @return bytes read, 0 once the peer has shut down its sending side
   * @throws TransportError when the connection fails
   */
  virtual std::streamsize ReadSome(void *buffer, std::streamsize size) = 0;

  // @throws TransportError when the connection fails
  virtual void WriteAll(const void *buffer, std::streamsize size) = 0;

  // no more writes; the peer reads end of stream
  virtual void ShutdownSend() = 0;

  virtual void Close() = 0;

  // @throws TransportError on end of stream before `size` bytes
  void ReadExact(void *buffer, std::streamsize size);
};

}  // namespace rdsync

#endif  // RDSYNC_SRC_TRANSPORT_INCLUDE_RDSYNC_TRANSPORT_TRANSPORT_H
