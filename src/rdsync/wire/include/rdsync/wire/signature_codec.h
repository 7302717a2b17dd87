#ifndef RDSYNC_SRC_WIRE_INCLUDE_RDSYNC_WIRE_SIGNATURE_CODEC_H
#define RDSYNC_SRC_WIRE_INCLUDE_RDSYNC_WIRE_SIGNATURE_CODEC_H

#include <rdsync/signature/signature_table.h>
#include <rdsync/wire/byte_io.h>

namespace rdsync::wire {

/**
 * {block_count u32, block_len u32, remainder_len u32, strong_len u8}
 * then block_count x {weak u32, strong[strong_len]}
 */
void WriteSignature(ByteSink &sink, const SignatureTable &table);

/**
 * the seed is not part of the encoding, the session supplies it
 * @throws ProtocolError on a malformed header or too many blocks
 */
SignatureTable
ReadSignature(ByteSource &source, uint32_t seed, uint32_t max_block_count);

}  // namespace rdsync::wire

#endif  // RDSYNC_SRC_WIRE_INCLUDE_RDSYNC_WIRE_SIGNATURE_CODEC_H
