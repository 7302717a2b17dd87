#include <rdsync/common/timer.h>

namespace rdsync::timer {

Timestamp Now() { return Clock::now(); }

intmax_t DeltaMs(Timestamp beg, Timestamp end) {
  return std::chrono::duration_cast<Milliseconds>(end - beg).count();
}

Stopwatch::Stopwatch() : begin_(Now()) {}

intmax_t Stopwatch::ElapsedMs() const { return DeltaMs(begin_, Now()); }

}  // namespace rdsync::timer
