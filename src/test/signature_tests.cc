#include <gtest/gtest.h>
#include <rdsync/checksums/rolling_checksum.h>
#include <rdsync/common/errors.h>
#include <rdsync/signature/block_size.h>
#include <rdsync/signature/signature_table.h>
#include <rdsync/test_common/test_fixture.h>

namespace rdsync {

class SignatureTests : public Fixture {};

TEST_F(SignatureTests, EmptyFileHasNoBlocks) {  // NOLINT
  auto table = SignatureTable::Build("", 700, 0);
  EXPECT_EQ(table.GetBlockCount(), 0);
  EXPECT_EQ(table.GetRemainderLength(), 0);
  EXPECT_EQ(table.GetFileSize(), 0);
}

TEST_F(SignatureTests, ShortFileHasOneRemainderBlock) {  // NOLINT
  auto table = SignatureTable::Build("hello", 700, 0);
  ASSERT_EQ(table.GetBlockCount(), 1);
  EXPECT_EQ(table.GetRemainderLength(), 5);
  EXPECT_EQ(table.GetBlockLength(0), 5);
  EXPECT_EQ(table.GetFileSize(), 5);
}

TEST_F(SignatureTests, BlocksCoverTheFile) {  // NOLINT
  auto data = GenerateData(10'000, 2);
  for (uint32_t block_len : {1U, 7U, 100U, 1000U, 10'000U, 20'000U}) {
    auto table = SignatureTable::Build(data, block_len, 5);

    std::streamsize total = 0;
    for (uint32_t i = 0; i < table.GetBlockCount(); i++) {
      const auto &block = table.GetBlocks()[i];
      EXPECT_EQ(block.index, i);
      EXPECT_EQ(table.GetBlockOffset(i), total);

      auto length = table.GetBlockLength(i);
      EXPECT_EQ(block.weak, RollingChecksum::Compute(data.data() + total, length));
      EXPECT_EQ(
          block.strong,
          StrongChecksum::Compute(5, data.data() + total, length).ToBytes());
      total += length;
    }
    EXPECT_EQ(total, 10'000) << "block_len=" << block_len;
    EXPECT_EQ(table.GetFileSize(), 10'000);
    EXPECT_EQ(table.GetRemainderLength(), 10'000 % block_len);
  }
}

TEST_F(SignatureTests, CandidatesInAscendingOrder) {  // NOLINT
  auto table = SignatureTable::Build("abcXabcYabc", 4, 0);
  // "abcX", "abcY", "abc"
  ASSERT_EQ(table.GetBlockCount(), 3);

  const auto *candidates =
      table.FindCandidates(RollingChecksum::Compute("abcX", 4));
  ASSERT_NE(candidates, nullptr);
  EXPECT_EQ(*candidates, std::vector<uint32_t>{0});

  table = SignatureTable::Build("abcabcabc", 3, 0);
  candidates = table.FindCandidates(RollingChecksum::Compute("abc", 3));
  ASSERT_NE(candidates, nullptr);
  EXPECT_EQ(*candidates, (std::vector<uint32_t>{0, 1, 2}));

  EXPECT_EQ(table.FindCandidates(RollingChecksum::Compute("xyz", 3)), nullptr);
}

TEST_F(SignatureTests, StrongChecksumTruncation) {  // NOLINT
  auto table = SignatureTable::Build("0123456789", 4, 3, 2);
  EXPECT_EQ(table.GetStrongLength(), 2);

  auto full = StrongChecksum::Compute(3, "0123", 4);
  const auto &strong = table.GetBlocks()[0].strong;
  EXPECT_EQ(strong[0], full.ToBytes()[0]);
  EXPECT_EQ(strong[1], full.ToBytes()[1]);
  for (int i = 2; i < StrongChecksum::kSize; i++) {
    EXPECT_EQ(strong[i], 0);
  }

  EXPECT_TRUE(table.StrongEquals(0, table.Truncate(full)));
  EXPECT_FALSE(table.StrongEquals(
      0,
      table.Truncate(StrongChecksum::Compute(3, "4567", 4))));
}

TEST_F(SignatureTests, InvalidDescriptionsAreRejected) {  // NOLINT
  std::vector<Block> blocks(2);
  blocks[0].index = 0;
  blocks[1].index = 5;
  EXPECT_THROW(  // NOLINT{cppcoreguidelines-avoid-goto}
      SignatureTable(0, 4, 0, 16, blocks),
      ProtocolError);

  blocks[1].index = 1;
  EXPECT_NO_THROW(SignatureTable(0, 4, 0, 16, blocks));  // NOLINT

  // remainder must be shorter than a block
  EXPECT_THROW(  // NOLINT{cppcoreguidelines-avoid-goto}
      SignatureTable(0, 4, 4, 16, blocks),
      ProtocolError);

  EXPECT_THROW(  // NOLINT{cppcoreguidelines-avoid-goto}
      SignatureTable(0, 0, 0, 16, blocks),
      ProtocolError);

  EXPECT_THROW(  // NOLINT{cppcoreguidelines-avoid-goto}
      SignatureTable(0, 4, 0, 0, blocks),
      ProtocolError);

  EXPECT_THROW(  // NOLINT{cppcoreguidelines-avoid-goto}
      SignatureTable(0, 4, 0, 17, blocks),
      ProtocolError);

  EXPECT_THROW(  // NOLINT{cppcoreguidelines-avoid-goto}
      SignatureTable(0, 4, 1, 16, {}),
      ProtocolError);
}

TEST_F(SignatureTests, BlockLengthPolicy) {  // NOLINT
  BlockSizePolicy policy;

  EXPECT_EQ(ChooseBlockLength(0, policy), 700);
  EXPECT_EQ(ChooseBlockLength(1'000, policy), 700);
  EXPECT_EQ(ChooseBlockLength(700 * 700, policy), 700);
  EXPECT_EQ(ChooseBlockLength(1'000'000, policy), 1000);
  // sqrt(2'000'000) = 1414.2 -> 1408
  EXPECT_EQ(ChooseBlockLength(2'000'000, policy), 1408);
  EXPECT_EQ(ChooseBlockLength(1'000'000'000'000, policy), 128 * 1024);

  policy.fixed_block_len = 2048;
  EXPECT_EQ(ChooseBlockLength(0, policy), 2048);
  EXPECT_EQ(ChooseBlockLength(1'000'000'000'000, policy), 2048);

  policy = {.fixed_block_len = 0, .min_block_len = 16, .max_block_len = 64};
  EXPECT_EQ(ChooseBlockLength(100, policy), 16);
  EXPECT_EQ(ChooseBlockLength(1'000, policy), 24);
  EXPECT_EQ(ChooseBlockLength(1'000'000, policy), 64);
}

}  // namespace rdsync
