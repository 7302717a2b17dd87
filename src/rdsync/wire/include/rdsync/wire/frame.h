#ifndef RDSYNC_SRC_WIRE_INCLUDE_RDSYNC_WIRE_FRAME_H
#define RDSYNC_SRC_WIRE_INCLUDE_RDSYNC_WIRE_FRAME_H

#include <array>
#include <cstdint>
#include <ios>
#include <optional>
#include <ostream>
#include <string>

namespace rdsync {

enum class Channel : uint8_t {
  kData = 0,
  kInfo = 1,
  kWarning = 2,
  kError = 3,
  kErrorXfer = 4,
  kKeepalive = 5,
};

const char *ToString(Channel channel);

std::ostream &operator<<(std::ostream &os, Channel channel);

struct Frame {
  Channel channel{Channel::kData};
  std::string payload;

  bool operator==(const Frame &other) const = default;
};

constexpr std::streamsize kFrameHeaderSize = 4;

// the length field is 3 bytes wide
constexpr std::streamsize kMaxFramePayload = 0xFFFFFF;

using FrameHeader = std::array<uint8_t, kFrameHeaderSize>;

// 1 byte channel tag followed by the payload length, 3 bytes big endian
FrameHeader EncodeFrameHeader(Channel channel, std::streamsize length);

std::string EncodeFrame(const Frame &frame);

/**
 * Incremental frame parser.
 *
 * Feed() accepts bytes as they arrive, in chunks of any size; Next() returns
 * each complete frame exactly once, in order. Header errors surface from
 * Next() as soon as the 4 header bytes are available.
 */
class FrameDecoder final {
  enum class State {
    kHeader,
    kPayload,
  };

  std::streamsize max_payload_;

  std::string buffer_;
  std::size_t position_{};

  State state_{State::kHeader};
  Channel channel_{};
  std::streamsize length_{};

  [[nodiscard]] std::size_t Available() const;

  void ParseHeader();

public:
  /**
   * @param max_payload frames announcing a longer payload are rejected
   */
  explicit FrameDecoder(std::streamsize max_payload);

  void Feed(const void *data, std::streamsize size);

  /**
   * @throws ProtocolError on an unknown channel or a non empty keepalive
   * @throws FrameTooLarge when a frame exceeds the limit
   */
  std::optional<Frame> Next();

  // bytes fed but not returned yet
  [[nodiscard]] std::streamsize GetPendingSize() const;
};

}  // namespace rdsync

#endif  // RDSYNC_SRC_WIRE_INCLUDE_RDSYNC_WIRE_FRAME_H
