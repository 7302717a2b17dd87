#include <glog/logging.h>
#include <rdsync/common/errors.h>
#include <rdsync/wire/frame.h>

namespace rdsync {

const char *ToString(Channel channel) {
  switch (channel) {
    case Channel::kData:
      return "data";
    case Channel::kInfo:
      return "info";
    case Channel::kWarning:
      return "warning";
    case Channel::kError:
      return "error";
    case Channel::kErrorXfer:
      return "error_xfer";
    case Channel::kKeepalive:
      return "keepalive";
  }
  return "unknown";
}

std::ostream &operator<<(std::ostream &os, Channel channel) {
  return os << ToString(channel);
}

FrameHeader EncodeFrameHeader(Channel channel, std::streamsize length) {
  CHECK(length >= 0 && length <= kMaxFramePayload)
      << "frame payload of " << length << " bytes";
  return {
      static_cast<uint8_t>(channel),
      static_cast<uint8_t>(length >> 16),
      static_cast<uint8_t>(length >> 8),
      static_cast<uint8_t>(length)};
}

std::string EncodeFrame(const Frame &frame) {
  auto header = EncodeFrameHeader(
      frame.channel,
      static_cast<std::streamsize>(frame.payload.size()));
  std::string result(header.begin(), header.end());
  result += frame.payload;
  return result;
}

FrameDecoder::FrameDecoder(std::streamsize max_payload)
    : max_payload_(max_payload) {
  CHECK(max_payload_ > 0 && max_payload_ <= kMaxFramePayload)
      << "invalid frame payload limit " << max_payload_;
}

std::size_t FrameDecoder::Available() const {
  return buffer_.size() - position_;
}

void FrameDecoder::Feed(const void *data, std::streamsize size) {
  // compact once everything before position_ is consumed
  if (position_ > 0 && position_ * 2 >= buffer_.size()) {
    buffer_.erase(0, position_);
    position_ = 0;
  }
  buffer_.append(static_cast<const char *>(data), size);
}

void FrameDecoder::ParseHeader() {
  const auto *header =
      reinterpret_cast<const uint8_t *>(buffer_.data() + position_);
  auto tag = header[0];
  auto length = (static_cast<std::streamsize>(header[1]) << 16) |
                (static_cast<std::streamsize>(header[2]) << 8) |
                static_cast<std::streamsize>(header[3]);

  if (tag > static_cast<uint8_t>(Channel::kKeepalive)) {
    throw ProtocolError("unknown frame tag " + std::to_string(tag));
  }
  channel_ = static_cast<Channel>(tag);

  if (channel_ == Channel::kKeepalive && length != 0) {
    throw ProtocolError(
        "keepalive frame with " + std::to_string(length) + " bytes payload");
  }
  if (length > max_payload_) {
    throw FrameTooLarge(length, max_payload_);
  }

  length_ = length;
  position_ += kFrameHeaderSize;
  state_ = State::kPayload;
}

std::optional<Frame> FrameDecoder::Next() {
  if (state_ == State::kHeader) {
    if (Available() < static_cast<std::size_t>(kFrameHeaderSize)) {
      return std::nullopt;
    }
    ParseHeader();
  }

  if (Available() < static_cast<std::size_t>(length_)) {
    return std::nullopt;
  }

  Frame frame;
  frame.channel = channel_;
  frame.payload = buffer_.substr(position_, length_);
  position_ += length_;
  state_ = State::kHeader;

  if (position_ == buffer_.size()) {
    buffer_.clear();
    position_ = 0;
  }

  return frame;
}

std::streamsize FrameDecoder::GetPendingSize() const {
  return static_cast<std::streamsize>(Available());
}

}  // namespace rdsync
