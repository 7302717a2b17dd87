#ifndef RDSYNC_SRC_COMMON_INCLUDE_RDSYNC_COMMON_TIMER_H
#define RDSYNC_SRC_COMMON_INCLUDE_RDSYNC_COMMON_TIMER_H

#include <chrono>
#include <cstdint>

namespace rdsync::timer {

using Clock = std::chrono::steady_clock;
using Timestamp = Clock::time_point;
using Milliseconds = std::chrono::milliseconds;

Timestamp Now();

intmax_t DeltaMs(Timestamp beg, Timestamp end);

class Stopwatch final {
  Timestamp begin_;

public:
  Stopwatch();

  [[nodiscard]] intmax_t ElapsedMs() const;
};

}  // namespace rdsync::timer

#endif  // RDSYNC_SRC_COMMON_INCLUDE_RDSYNC_COMMON_TIMER_H
