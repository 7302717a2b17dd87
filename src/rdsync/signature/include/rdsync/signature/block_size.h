#ifndef RDSYNC_SRC_SIGNATURE_INCLUDE_RDSYNC_SIGNATURE_BLOCK_SIZE_H
#define RDSYNC_SRC_SIGNATURE_INCLUDE_RDSYNC_SIGNATURE_BLOCK_SIZE_H

#include <cstdint>
#include <ios>

namespace rdsync {

/**
 * How the receiver picks the block length of a signature.
 *
 * Defaults follow the protocol 27 conventions of rsync: 700 bytes up to
 * 700*700 bytes of basis, then the square root of the size rounded down to a
 * multiple of 8, capped at 128K. A peer computing signatures with a
 * different formula stays compatible since the length travels in the
 * signature header, only the efficiency changes.
 */
struct BlockSizePolicy {
  // when non zero, used regardless of the file size
  uint32_t fixed_block_len = 0;

  uint32_t min_block_len = 700;
  uint32_t max_block_len = 128 * 1024;
};

uint32_t ChooseBlockLength(
    std::streamsize file_size,
    const BlockSizePolicy &policy);

}  // namespace rdsync

#endif  // RDSYNC_SRC_SIGNATURE_INCLUDE_RDSYNC_SIGNATURE_BLOCK_SIZE_H
