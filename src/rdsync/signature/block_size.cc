#include <glog/logging.h>
#include <rdsync/signature/block_size.h>

#include <algorithm>
#include <cmath>

namespace rdsync {

namespace {

uint64_t IntegerSquareRoot(uint64_t value) {
  auto root = static_cast<uint64_t>(std::sqrt(static_cast<long double>(value)));
  while (root > 0 && root * root > value) {
    root--;
  }
  while ((root + 1) * (root + 1) <= value) {
    root++;
  }
  return root;
}

}  // namespace

uint32_t ChooseBlockLength(
    std::streamsize file_size,
    const BlockSizePolicy &policy) {
  if (policy.fixed_block_len != 0) {
    return policy.fixed_block_len;
  }

  CHECK_GT(policy.min_block_len, 0U);
  CHECK_LE(policy.min_block_len, policy.max_block_len);
  CHECK_GE(file_size, 0);

  auto size = static_cast<uint64_t>(file_size);
  uint64_t min_len = policy.min_block_len;

  if (size <= min_len * min_len) {
    return policy.min_block_len;
  }

  auto len = IntegerSquareRoot(size) & ~static_cast<uint64_t>(7);
  len = std::clamp<uint64_t>(len, min_len, policy.max_block_len);

  return static_cast<uint32_t>(len);
}

}  // namespace rdsync
