#include <rdsync/common/errors.h>
#include <rdsync/wire/signature_codec.h>

namespace rdsync::wire {

void WriteSignature(ByteSink &sink, const SignatureTable &table) {
  WriteU32(sink, table.GetBlockCount());
  WriteU32(sink, table.GetBlockLength());
  WriteU32(sink, table.GetRemainderLength());
  WriteU8(sink, table.GetStrongLength());
  for (const auto &block : table.GetBlocks()) {
    WriteU32(sink, block.weak);
    WriteBytes(sink, block.strong.data(), table.GetStrongLength());
  }
}

SignatureTable
ReadSignature(ByteSource &source, uint32_t seed, uint32_t max_block_count) {
  auto block_count = ReadU32(source);
  auto block_len = ReadU32(source);
  auto remainder_len = ReadU32(source);
  auto strong_len = ReadU8(source);

  if (block_count > max_block_count) {
    throw ProtocolError(
        "signature with " + std::to_string(block_count) +
        " blocks exceeds limit of " + std::to_string(max_block_count));
  }
  if (strong_len == 0 || strong_len > SignatureTable::kMaxStrongLen) {
    throw ProtocolError(
        "invalid strong checksum length " + std::to_string(strong_len));
  }

  std::vector<Block> blocks(block_count);
  for (uint32_t i = 0; i < block_count; i++) {
    blocks[i].index = i;
    blocks[i].weak = ReadU32(source);
    source.ReadExact(blocks[i].strong.data(), strong_len);
  }

  return {seed, block_len, remainder_len, strong_len, std::move(blocks)};
}

}  // namespace rdsync::wire
