#include <glog/logging.h>
#include <rdsync/common/errors.h>
#include <rdsync/delta/reconstructor.h>
#include <rdsync/readers/memory_reader.h>

#include <sstream>

namespace rdsync {

Reconstructor::Reconstructor(
    const SignatureTable &table,
    Reader *basis,
    std::ostream &output)
    : table_(table),
      basis_(basis),
      output_(output),
      digest_(table.GetSeed()) {
  CHECK(basis_ != nullptr || table_.GetBlockCount() == 0)
      << "basis required for a non empty signature";
}

void Reconstructor::Write(const char *data, std::streamsize size) {
  output_.write(data, size);
  if (!output_) {
    throw IoError("cannot write reconstructed data");
  }
  digest_.Update(data, size);
  if (unseeded_digest_) {
    unseeded_digest_->Update(data, size);
  }
  written_ += size;
}

void Reconstructor::ApplyCopy(const Instruction &instruction) {
  auto index = instruction.block_index;
  if (index >= table_.GetBlockCount()) {
    throw ReconstructionError(
        "copy of block " + std::to_string(index) + " out of " +
        std::to_string(table_.GetBlockCount()));
  }

  auto block_len = table_.GetBlockLength(index);
  if (instruction.byte_len != block_len) {
    throw ReconstructionError(
        "copy of block " + std::to_string(index) + " with length " +
        std::to_string(instruction.byte_len) + " instead of " +
        std::to_string(block_len));
  }

  if (buffer_.size() < block_len) {
    buffer_.resize(block_len);
  }

  auto count = basis_->Read(
      buffer_.data(),
      table_.GetBlockOffset(index),
      block_len);
  if (count != static_cast<std::streamsize>(block_len)) {
    throw IoError(
        "basis block " + std::to_string(index) + " read " +
        std::to_string(count) + " of " + std::to_string(block_len) + " bytes");
  }

  Write(buffer_.data(), count);
  copied_bytes_ += count;
}

void Reconstructor::Apply(const Instruction &instruction) {
  if (finished_) {
    throw ReconstructionError("instruction after end of stream");
  }

  switch (instruction.kind) {
    case Instruction::Kind::kEnd:
      finished_ = true;
      output_.flush();
      if (!output_) {
        throw IoError("cannot flush reconstructed data");
      }
      VLOG(2) << "reconstructed " << written_ << " bytes";
      break;
    case Instruction::Kind::kData:
      Write(
          instruction.data.data(),
          static_cast<std::streamsize>(instruction.data.size()));
      literal_bytes_ += static_cast<metrics::MetricValueType>(
          instruction.data.size());
      break;
    case Instruction::Kind::kCopy:
      ApplyCopy(instruction);
      break;
  }
}

bool Reconstructor::IsFinished() const { return finished_; }

std::streamsize Reconstructor::GetWrittenSize() const { return written_; }

StrongChecksum Reconstructor::GetDigest() const { return digest_.Digest(); }

void Reconstructor::TrackUnseededDigest() {
  CHECK_EQ(written_, 0) << "output already started";
  unseeded_digest_.emplace(0);
}

StrongChecksum Reconstructor::GetUnseededDigest() const {
  CHECK(unseeded_digest_) << "unseeded digest not tracked";
  return unseeded_digest_->Digest();
}

void Reconstructor::Verify(const StrongChecksum &expected) const {
  auto actual = GetDigest();
  if (actual != expected) {
    throw IntegrityError(
        "digest mismatch: expected " + expected.ToString() + " got " +
        actual.ToString());
  }
}

void Reconstructor::Accept(metrics::MetricVisitor &visitor) {
  RDSYNC_VISIT_METRIC(copied_bytes_);
  RDSYNC_VISIT_METRIC(literal_bytes_);
}

std::string Reconstructor::Apply(
    const std::string &old_data,
    const SignatureTable &table,
    const std::vector<Instruction> &instructions) {
  MemoryReader basis(
      old_data.data(),
      static_cast<std::streamsize>(old_data.size()));
  std::ostringstream output;

  Reconstructor reconstructor(table, &basis, output);
  for (const auto &instruction : instructions) {
    reconstructor.Apply(instruction);
  }
  if (!reconstructor.IsFinished()) {
    throw ReconstructionError("instruction stream without end marker");
  }

  return output.str();
}

}  // namespace rdsync
