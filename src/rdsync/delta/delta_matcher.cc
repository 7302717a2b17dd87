#include <glog/logging.h>
#include <rdsync/common/errors.h>
#include <rdsync/delta/delta_matcher.h>
#include <rdsync/readers/memory_reader.h>

#include <algorithm>
#include <cstring>

namespace rdsync {

DeltaMatcher::DeltaMatcher(
    const SignatureTable &table,
    std::streamsize max_literal)
    : table_(table),
      max_literal_(max_literal),
      digest_(table.GetSeed()) {
  CHECK_GT(max_literal_, 0);
}

void DeltaMatcher::Ensure(std::streamoff end) {
  CHECK_LE(end, size_);
  if (end <= buffer_end_) {
    return;
  }

  // drop what is no longer needed
  auto keep = buffer_end_ - literal_;
  if (literal_ > buffer_offset_) {
    memmove(buffer_.data(), At(literal_), keep);
    buffer_offset_ = literal_;
  }

  auto target = std::min<std::streamoff>(
      size_,
      std::max<std::streamoff>(end, buffer_end_ + kReadChunk));
  auto needed = static_cast<std::size_t>(target - buffer_offset_);
  if (buffer_.size() < needed) {
    buffer_.resize(needed);
  }

  while (buffer_end_ < target) {
    auto *destination = buffer_.data() + (buffer_end_ - buffer_offset_);
    auto count = input_->Read(destination, buffer_end_, target - buffer_end_);
    if (count <= 0) {
      throw IoError(
          "input truncated at " + std::to_string(buffer_end_) + " of " +
          std::to_string(size_));
    }
    digest_.Update(destination, count);
    buffer_end_ += count;
  }
}

const char *DeltaMatcher::At(std::streamoff offset) const {
  return buffer_.data() + (offset - buffer_offset_);
}

void DeltaMatcher::FlushLiteral(const Sink &sink) {
  if (window_ == literal_) {
    return;
  }
  auto count = window_ - literal_;
  sink(Instruction::Data(std::string(At(literal_), count)));
  literal_bytes_ += count;
  literal_ = window_;
}

std::optional<uint32_t> DeltaMatcher::FindMatch(
    uint32_t weak,
    std::streamsize window_len) {
  const auto *candidates = table_.FindCandidates(weak);
  if (candidates == nullptr) {
    return std::nullopt;
  }

  weak_checksum_matches_++;

  std::optional<StrongChecksum::Bytes> strong;
  for (auto index : *candidates) {
    if (table_.GetBlockLength(index) != window_len) {
      continue;
    }
    if (!strong) {
      strong = table_.Truncate(StrongChecksum::Compute(
          table_.GetSeed(),
          At(window_),
          window_len));
    }
    if (table_.StrongEquals(index, *strong)) {
      strong_checksum_matches_++;
      return index;
    }
  }

  weak_checksum_false_positives_++;
  return std::nullopt;
}

void DeltaMatcher::RunLiteralOnly(const Sink &sink) {
  while (window_ < size_) {
    auto count = std::min<std::streamsize>(max_literal_, size_ - window_);
    Ensure(window_ + count);
    window_ += count;
    FlushLiteral(sink);
  }
}

void DeltaMatcher::Run(Reader &input, const Sink &sink) {
  CHECK(!done_) << "matcher already ran";
  done_ = true;

  input_ = &input;
  size_ = input.GetSize();

  VLOG(1) << "matching size=" << size_
          << " against blocks=" << table_.GetBlockCount();

  if (table_.GetBlockCount() == 0) {
    RunLiteralOnly(sink);
    sink(Instruction::End());
    return;
  }

  std::streamsize block_len = table_.GetBlockLength();

  RollingChecksum rolling;
  bool rolling_valid = false;

  while (window_ < size_) {
    auto window_len = std::min<std::streamsize>(block_len, size_ - window_);
    Ensure(window_ + window_len);

    if (!rolling_valid) {
      rolling.Reset(At(window_), window_len);
      rolling_valid = true;
    }

    auto match = FindMatch(rolling.Value(), window_len);
    if (match) {
      FlushLiteral(sink);
      sink(Instruction::Copy(*match, static_cast<uint32_t>(window_len)));
      matched_bytes_ += window_len;
      window_ += window_len;
      literal_ = window_;
      rolling_valid = false;
      continue;
    }

    auto leaving = static_cast<uint8_t>(*At(window_));
    if (window_ + window_len < size_) {
      Ensure(window_ + window_len + 1);
      rolling.Roll(leaving, static_cast<uint8_t>(*At(window_ + window_len)));
    } else {
      // tail of the input, the window shrinks towards the remainder length
      rolling.RollOut(leaving);
    }
    window_++;

    if (window_ - literal_ >= max_literal_) {
      FlushLiteral(sink);
    }
  }

  FlushLiteral(sink);
  sink(Instruction::End());
}

StrongChecksum DeltaMatcher::GetDigest() const { return digest_.Digest(); }

void DeltaMatcher::Accept(metrics::MetricVisitor &visitor) {
  RDSYNC_VISIT_METRIC(weak_checksum_matches_);
  RDSYNC_VISIT_METRIC(weak_checksum_false_positives_);
  RDSYNC_VISIT_METRIC(strong_checksum_matches_);
  RDSYNC_VISIT_METRIC(literal_bytes_);
  RDSYNC_VISIT_METRIC(matched_bytes_);
}

std::vector<Instruction> DeltaMatcher::Encode(
    const std::string &data,
    const SignatureTable &table,
    std::streamsize max_literal) {
  MemoryReader reader(data.data(), static_cast<std::streamsize>(data.size()));
  std::vector<Instruction> result;

  DeltaMatcher matcher(table, max_literal);
  matcher.Run(reader, [&result](const Instruction &instruction) {
    result.push_back(instruction);
  });

  return result;
}

}  // namespace rdsync
