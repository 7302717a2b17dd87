#include <rdsync/common/errors.h>
#include <rdsync/wire/byte_io.h>

#include <cstring>
#include <limits>

namespace rdsync {

void StringSink::Write(const void *buffer, std::streamsize size) {
  data_.append(static_cast<const char *>(buffer), size);
}

const std::string &StringSink::GetData() const { return data_; }

StringSource::StringSource(std::string data) : data_(std::move(data)) {}

void StringSource::ReadExact(void *buffer, std::streamsize size) {
  if (size > static_cast<std::streamsize>(data_.size() - position_)) {
    throw ProtocolError(
        "truncated input: wanted " + std::to_string(size) + " bytes, " +
        std::to_string(data_.size() - position_) + " left");
  }
  memcpy(buffer, data_.data() + position_, size);
  position_ += size;
}

bool StringSource::IsExhausted() const { return position_ == data_.size(); }

namespace wire {

void WriteU8(ByteSink &sink, uint8_t value) { sink.Write(&value, 1); }

void WriteU32(ByteSink &sink, uint32_t value) {
  uint8_t bytes[4];
  for (int i = 0; i < 4; i++) {
    bytes[i] = static_cast<uint8_t>(value >> (8 * i));
  }
  sink.Write(bytes, sizeof(bytes));
}

void WriteI32(ByteSink &sink, int32_t value) {
  WriteU32(sink, static_cast<uint32_t>(value));
}

void WriteVarint(ByteSink &sink, uint64_t value) {
  uint8_t bytes[kMaxVarintSize];
  int count = 0;
  do {
    auto byte = static_cast<uint8_t>(value & 0x7f);
    value >>= 7;
    if (value != 0) {
      byte |= 0x80;
    }
    bytes[count++] = byte;
  } while (value != 0);
  sink.Write(bytes, count);
}

void WriteBytes(ByteSink &sink, const void *buffer, std::streamsize size) {
  if (size > 0) {
    sink.Write(buffer, size);
  }
}

uint8_t ReadU8(ByteSource &source) {
  uint8_t value;
  source.ReadExact(&value, 1);
  return value;
}

uint32_t ReadU32(ByteSource &source) {
  uint8_t bytes[4];
  source.ReadExact(bytes, sizeof(bytes));
  uint32_t value = 0;
  for (int i = 0; i < 4; i++) {
    value |= static_cast<uint32_t>(bytes[i]) << (8 * i);
  }
  return value;
}

int32_t ReadI32(ByteSource &source) {
  return static_cast<int32_t>(ReadU32(source));
}

uint64_t ReadVarint(ByteSource &source) {
  uint64_t value = 0;
  for (int i = 0; i < kMaxVarintSize; i++) {
    auto byte = ReadU8(source);
    auto bits = static_cast<uint64_t>(byte & 0x7f);
    // the 10th byte may only carry the top bit of a 64 bit value
    if (i == kMaxVarintSize - 1 && bits > 1) {
      throw ProtocolError("varint overflows 64 bits");
    }
    value |= bits << (7 * i);
    if ((byte & 0x80) == 0) {
      return value;
    }
  }
  throw ProtocolError("varint longer than 10 bytes");
}

uint32_t ReadVarint32(ByteSource &source) {
  auto value = ReadVarint(source);
  if (value > std::numeric_limits<uint32_t>::max()) {
    throw ProtocolError("varint " + std::to_string(value) + " exceeds 32 bits");
  }
  return static_cast<uint32_t>(value);
}

std::string ReadBytes(ByteSource &source, std::streamsize size) {
  std::string result(size, '\0');
  if (size > 0) {
    source.ReadExact(result.data(), size);
  }
  return result;
}

}  // namespace wire

}  // namespace rdsync
