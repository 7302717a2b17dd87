#ifndef RDSYNC_SRC_TRANSPORT_INCLUDE_RDSYNC_TRANSPORT_FRAME_MULTIPLEXER_H
#define RDSYNC_SRC_TRANSPORT_INCLUDE_RDSYNC_TRANSPORT_FRAME_MULTIPLEXER_H

#include <rdsync/common/metrics.h>
#include <rdsync/transport/transport.h>
#include <rdsync/wire/frame.h>

#include <mutex>
#include <vector>

namespace rdsync {

/**
 * Carries tagged frames over one Transport.
 *
 * Send() may be called from any thread, whole frames are never interleaved.
 * Recv() belongs to the thread driving the session.
 */
class FrameMultiplexer final : public metrics::MetricContainer {
  static constexpr std::streamsize kReadChunk = 64 * 1024;

  Transport &transport_;
  std::streamsize max_payload_;

  std::mutex send_mutex_;

  FrameDecoder decoder_;
  std::vector<char> read_buffer_;

  metrics::Metric frames_sent_{};
  metrics::Metric frames_received_{};
  metrics::Metric bytes_sent_{};
  metrics::Metric bytes_received_{};

public:
  FrameMultiplexer(Transport &transport, std::streamsize max_payload);

  /**
   * @throws FrameTooLarge if `size` is above the payload limit
   * @throws TransportError
   */
  void Send(Channel channel, const void *payload, std::streamsize size);

  void Send(const Frame &frame);

  /**
   * blocks until a complete frame is in
   * @throws TransportError on end of stream
   * @throws ProtocolError on a malformed frame
   */
  Frame Recv();

  [[nodiscard]] std::streamsize GetMaxPayload() const;

  // raw bytes read from and written to the transport
  [[nodiscard]] metrics::MetricValueType GetBytesReceived() const;
  [[nodiscard]] metrics::MetricValueType GetBytesSent() const;

  void Accept(metrics::MetricVisitor &visitor) override;
};

}  // namespace rdsync

#endif  // RDSYNC_SRC_TRANSPORT_INCLUDE_RDSYNC_TRANSPORT_FRAME_MULTIPLEXER_H
