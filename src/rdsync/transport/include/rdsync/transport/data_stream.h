#ifndef RDSYNC_SRC_TRANSPORT_INCLUDE_RDSYNC_TRANSPORT_DATA_STREAM_H
#define RDSYNC_SRC_TRANSPORT_INCLUDE_RDSYNC_TRANSPORT_DATA_STREAM_H

#include <rdsync/transport/frame_multiplexer.h>
#include <rdsync/wire/byte_io.h>

#include <string>
#include <vector>

namespace rdsync {

/**
 * Byte stream view of the Data channel.
 *
 * Writes are buffered into frames of at most the payload limit and go out on
 * Flush() or when a frame fills up. Reads pull frames as needed and handle
 * the other channels on the way: info and warning messages are logged,
 * ErrorXfer messages are kept for TakeTransferErrors(), keepalives are
 * dropped, an Error frame raises RemoteError.
 */
class DataStream final : public ByteSink, public ByteSource {
  FrameMultiplexer &mux_;

  std::string output_;
  std::string input_;
  std::size_t input_position_{};

  std::vector<std::string> transfer_errors_;

  void FillInput();

public:
  explicit DataStream(FrameMultiplexer &mux);

  void Write(const void *buffer, std::streamsize size) override;

  void Flush();

  /**
   * @throws RemoteError if the peer aborted the session
   * @throws TransportError, ProtocolError
   */
  void ReadExact(void *buffer, std::streamsize size) override;

  // flushes pending data first so the message keeps its place in the stream,
  // a message longer than one frame is cut to the payload limit
  void SendMessage(Channel channel, const std::string &message);

  void SendKeepalive();

  std::vector<std::string> TakeTransferErrors();
};

}  // namespace rdsync

#endif  // RDSYNC_SRC_TRANSPORT_INCLUDE_RDSYNC_TRANSPORT_DATA_STREAM_H
