#include <glog/logging.h>
#include <rdsync/common/errors.h>
#include <rdsync/transport/frame_multiplexer.h>

namespace rdsync {

FrameMultiplexer::FrameMultiplexer(
    Transport &transport,
    std::streamsize max_payload)
    : transport_(transport),
      max_payload_(max_payload),
      decoder_(max_payload),
      read_buffer_(kReadChunk) {}

void FrameMultiplexer::Send(
    Channel channel,
    const void *payload,
    std::streamsize size) {
  if (size > max_payload_) {
    throw FrameTooLarge(size, max_payload_);
  }

  auto header = EncodeFrameHeader(channel, size);

  std::lock_guard lock(send_mutex_);
  transport_.WriteAll(header.data(), kFrameHeaderSize);
  if (size > 0) {
    transport_.WriteAll(payload, size);
  }

  frames_sent_++;
  bytes_sent_ += kFrameHeaderSize + size;
  VLOG(3) << "sent " << channel << " frame of " << size << " bytes";
}

void FrameMultiplexer::Send(const Frame &frame) {
  Send(
      frame.channel,
      frame.payload.data(),
      static_cast<std::streamsize>(frame.payload.size()));
}

Frame FrameMultiplexer::Recv() {
  while (true) {
    auto frame = decoder_.Next();
    if (frame) {
      frames_received_++;
      VLOG(3) << "received " << frame->channel << " frame of "
              << frame->payload.size() << " bytes";
      return std::move(*frame);
    }

    auto count = transport_.ReadSome(
        read_buffer_.data(),
        static_cast<std::streamsize>(read_buffer_.size()));
    if (count == 0) {
      throw TransportError(
          "connection closed with " +
          std::to_string(decoder_.GetPendingSize()) +
          " bytes of a partial frame");
    }
    bytes_received_ += count;
    decoder_.Feed(read_buffer_.data(), count);
  }
}

std::streamsize FrameMultiplexer::GetMaxPayload() const { return max_payload_; }

metrics::MetricValueType FrameMultiplexer::GetBytesReceived() const {
  return bytes_received_;
}

metrics::MetricValueType FrameMultiplexer::GetBytesSent() const {
  return bytes_sent_;
}

void FrameMultiplexer::Accept(metrics::MetricVisitor &visitor) {
  RDSYNC_VISIT_METRIC(frames_sent_);
  RDSYNC_VISIT_METRIC(frames_received_);
  RDSYNC_VISIT_METRIC(bytes_sent_);
  RDSYNC_VISIT_METRIC(bytes_received_);
}

}  // namespace rdsync
