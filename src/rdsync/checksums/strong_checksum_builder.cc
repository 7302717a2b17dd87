#include <glog/logging.h>
#include <rdsync/checksums/strong_checksum_builder.h>
#include <xxhash.h>

namespace rdsync {

void StrongChecksumBuilder::StateDeleter::operator()(
    XXH3_state_s *state) const {
  XXH3_freeState(state);
}

StrongChecksumBuilder::StrongChecksumBuilder(uint32_t seed)
    : state_(XXH3_createState()) {
  CHECK(state_ != nullptr) << "cannot allocate hash state";
  CHECK_EQ(XXH3_128bits_reset_withSeed(state_.get(), seed), XXH_OK);
}

void StrongChecksumBuilder::Update(const void *buffer, std::streamsize size) {
  CHECK_GE(size, 0);
  CHECK_EQ(XXH3_128bits_update(state_.get(), buffer, size), XXH_OK);
}

StrongChecksum StrongChecksumBuilder::Digest() const {
  auto digest = XXH3_128bits_digest(state_.get());

  return {digest.high64, digest.low64};
}

}  // namespace rdsync
