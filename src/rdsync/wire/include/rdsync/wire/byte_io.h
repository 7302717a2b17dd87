#ifndef RDSYNC_SRC_WIRE_INCLUDE_RDSYNC_WIRE_BYTE_IO_H
#define RDSYNC_SRC_WIRE_INCLUDE_RDSYNC_WIRE_BYTE_IO_H

#include <cstdint>
#include <ios>
#include <string>

namespace rdsync {

class ByteSink {
public:
  virtual ~ByteSink() = default;

  virtual void Write(const void *buffer, std::streamsize size) = 0;
};

class ByteSource {
public:
  virtual ~ByteSource() = default;

  /**
   * fills `buffer` completely
   * @throws ProtocolError or TransportError when the data runs out
   */
  virtual void ReadExact(void *buffer, std::streamsize size) = 0;
};

class StringSink final : public ByteSink {
  std::string data_;

public:
  void Write(const void *buffer, std::streamsize size) override;

  [[nodiscard]] const std::string &GetData() const;
};

class StringSource final : public ByteSource {
  std::string data_;
  std::size_t position_{};

public:
  explicit StringSource(std::string data);

  void ReadExact(void *buffer, std::streamsize size) override;

  [[nodiscard]] bool IsExhausted() const;
};

/**
 * Primitive encodings shared by every codec.
 * Fixed width integers are little endian, varints are unsigned LEB128.
 */
namespace wire {

constexpr int kMaxVarintSize = 10;

void WriteU8(ByteSink &sink, uint8_t value);
void WriteU32(ByteSink &sink, uint32_t value);
void WriteI32(ByteSink &sink, int32_t value);
void WriteVarint(ByteSink &sink, uint64_t value);
void WriteBytes(ByteSink &sink, const void *buffer, std::streamsize size);

uint8_t ReadU8(ByteSource &source);
uint32_t ReadU32(ByteSource &source);
int32_t ReadI32(ByteSource &source);

// @throws ProtocolError on an overlong or overflowing encoding
uint64_t ReadVarint(ByteSource &source);

// @throws ProtocolError if the value does not fit 32 bits
uint32_t ReadVarint32(ByteSource &source);

std::string ReadBytes(ByteSource &source, std::streamsize size);

}  // namespace wire

}  // namespace rdsync

#endif  // RDSYNC_SRC_WIRE_INCLUDE_RDSYNC_WIRE_BYTE_IO_H
