#include <glog/logging.h>
#include <rdsync/common/errors.h>
#include <rdsync/transport/data_stream.h>

#include <algorithm>
#include <cstring>
#include <utility>

namespace rdsync {

DataStream::DataStream(FrameMultiplexer &mux) : mux_(mux) {}

void DataStream::Write(const void *buffer, std::streamsize size) {
  const auto *current = static_cast<const char *>(buffer);
  auto max_payload = mux_.GetMaxPayload();

  while (size > 0) {
    auto room = max_payload - static_cast<std::streamsize>(output_.size());
    auto count = std::min(room, size);
    output_.append(current, count);
    current += count;
    size -= count;

    if (static_cast<std::streamsize>(output_.size()) == max_payload) {
      Flush();
    }
  }
}

void DataStream::Flush() {
  if (output_.empty()) {
    return;
  }
  mux_.Send(
      Channel::kData,
      output_.data(),
      static_cast<std::streamsize>(output_.size()));
  output_.clear();
}

void DataStream::FillInput() {
  while (input_position_ == input_.size()) {
    auto frame = mux_.Recv();
    switch (frame.channel) {
      case Channel::kData:
        input_ = std::move(frame.payload);
        input_position_ = 0;
        break;
      case Channel::kInfo:
        LOG(INFO) << "peer: " << frame.payload;
        break;
      case Channel::kWarning:
        LOG(WARNING) << "peer: " << frame.payload;
        break;
      case Channel::kErrorXfer:
        LOG(WARNING) << "peer transfer error: " << frame.payload;
        transfer_errors_.push_back(std::move(frame.payload));
        break;
      case Channel::kError:
        throw RemoteError(frame.payload);
      case Channel::kKeepalive:
        VLOG(2) << "keepalive";
        break;
    }
  }
}

void DataStream::ReadExact(void *buffer, std::streamsize size) {
  auto *current = static_cast<char *>(buffer);
  while (size > 0) {
    FillInput();
    auto count = std::min(
        size,
        static_cast<std::streamsize>(input_.size() - input_position_));
    memcpy(current, input_.data() + input_position_, count);
    input_position_ += count;
    current += count;
    size -= count;
  }
}

void DataStream::SendMessage(Channel channel, const std::string &message) {
  CHECK(channel != Channel::kData && channel != Channel::kKeepalive)
      << "not a message channel: " << channel;
  Flush();
  auto size = std::min(
      static_cast<std::streamsize>(message.size()),
      mux_.GetMaxPayload());
  LOG_IF(WARNING, size < static_cast<std::streamsize>(message.size()))
      << "truncating " << channel << " message of " << message.size()
      << " bytes to " << size;
  mux_.Send(channel, message.data(), size);
}

void DataStream::SendKeepalive() { mux_.Send(Channel::kKeepalive, nullptr, 0); }

std::vector<std::string> DataStream::TakeTransferErrors() {
  return std::exchange(transfer_errors_, {});
}

}  // namespace rdsync
