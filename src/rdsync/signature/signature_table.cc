#include <glog/logging.h>
#include <rdsync/checksums/rolling_checksum.h>
#include <rdsync/common/errors.h>
#include <rdsync/readers/memory_reader.h>
#include <rdsync/signature/signature_table.h>

#include <algorithm>

namespace rdsync {

SignatureTable::SignatureTable(
    uint32_t seed,
    uint32_t block_len,
    uint32_t remainder_len,
    uint8_t strong_len,
    std::vector<Block> blocks)
    : seed_(seed),
      block_len_(block_len),
      remainder_len_(remainder_len),
      strong_len_(strong_len),
      blocks_(std::move(blocks)) {
  Validate();

  for (const auto &block : blocks_) {
    weak_to_candidates_[block.weak].push_back(block.index);
  }
}

void SignatureTable::Validate() const {
  if (strong_len_ == 0 || strong_len_ > kMaxStrongLen) {
    throw ProtocolError(
        "invalid strong checksum length " + std::to_string(strong_len_));
  }
  if (blocks_.empty()) {
    if (remainder_len_ != 0) {
      throw ProtocolError("remainder without blocks");
    }
    return;
  }
  if (block_len_ == 0) {
    throw ProtocolError("zero block length");
  }
  if (remainder_len_ >= block_len_) {
    throw ProtocolError(
        "remainder " + std::to_string(remainder_len_) +
        " not shorter than block " + std::to_string(block_len_));
  }
  for (std::size_t i = 0; i < blocks_.size(); i++) {
    if (blocks_[i].index != i) {
      throw ProtocolError(
          "block " + std::to_string(i) + " has index " +
          std::to_string(blocks_[i].index));
    }
  }
}

SignatureTable SignatureTable::Build(
    Reader &reader,
    uint32_t block_len,
    uint32_t seed,
    uint8_t strong_len) {
  auto size = reader.GetSize();
  CHECK(size == 0 || block_len > 0) << "block length required";
  CHECK(strong_len > 0 && strong_len <= kMaxStrongLen);

  std::vector<Block> blocks;
  if (size > 0) {
    blocks.reserve((size + block_len - 1) / block_len);
  }

  std::vector<char> buffer(block_len);
  std::streamoff offset = 0;

  while (offset < size) {
    auto count = reader.Read(buffer.data(), offset, block_len);
    if (count <= 0) {
      throw IoError(
          "basis truncated at " + std::to_string(offset) + " of " +
          std::to_string(size));
    }

    Block block;
    block.index = static_cast<uint32_t>(blocks.size());
    block.weak = RollingChecksum::Compute(buffer.data(), count);
    block.strong = StrongChecksum::Compute(seed, buffer.data(), count).ToBytes();
    std::fill(block.strong.begin() + strong_len, block.strong.end(), 0);
    blocks.push_back(block);

    offset += count;
    if (count < block_len && offset < size) {
      throw IoError("short read in the middle of the basis");
    }
  }

  auto remainder_len = static_cast<uint32_t>(size > 0 ? size % block_len : 0);

  VLOG(1) << "signature size=" << size << " block_len=" << block_len
          << " blocks=" << blocks.size() << " remainder=" << remainder_len;

  return {seed, block_len, remainder_len, strong_len, std::move(blocks)};
}

SignatureTable SignatureTable::Build(
    const std::string &data,
    uint32_t block_len,
    uint32_t seed,
    uint8_t strong_len) {
  MemoryReader reader(data.data(), static_cast<std::streamsize>(data.size()));
  return Build(reader, block_len, seed, strong_len);
}

uint32_t SignatureTable::GetSeed() const { return seed_; }

uint32_t SignatureTable::GetBlockLength() const { return block_len_; }

uint32_t SignatureTable::GetRemainderLength() const { return remainder_len_; }

uint8_t SignatureTable::GetStrongLength() const { return strong_len_; }

uint32_t SignatureTable::GetBlockCount() const {
  return static_cast<uint32_t>(blocks_.size());
}

const std::vector<Block> &SignatureTable::GetBlocks() const { return blocks_; }

std::streamsize SignatureTable::GetFileSize() const {
  if (blocks_.empty()) {
    return 0;
  }
  auto full = static_cast<std::streamsize>(blocks_.size() - 1) * block_len_;
  return full + GetBlockLength(GetBlockCount() - 1);
}

uint32_t SignatureTable::GetBlockLength(uint32_t index) const {
  CHECK_LT(index, blocks_.size());
  if (index + 1 == blocks_.size() && remainder_len_ != 0) {
    return remainder_len_;
  }
  return block_len_;
}

std::streamoff SignatureTable::GetBlockOffset(uint32_t index) const {
  return static_cast<std::streamoff>(index) * block_len_;
}

const std::vector<uint32_t> *SignatureTable::FindCandidates(
    uint32_t weak) const {
  auto i = weak_to_candidates_.find(weak);
  return i == weak_to_candidates_.end() ? nullptr : &i->second;
}

bool SignatureTable::StrongEquals(
    uint32_t index,
    const StrongChecksum::Bytes &strong) const {
  const auto &expected = blocks_[index].strong;
  return std::equal(
      expected.begin(),
      expected.begin() + strong_len_,
      strong.begin());
}

StrongChecksum::Bytes SignatureTable::Truncate(
    const StrongChecksum &checksum) const {
  auto bytes = checksum.ToBytes();
  std::fill(bytes.begin() + strong_len_, bytes.end(), 0);
  return bytes;
}

}  // namespace rdsync
