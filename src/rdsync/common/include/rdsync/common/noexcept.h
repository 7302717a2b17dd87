#ifndef RDSYNC_SRC_COMMON_INCLUDE_RDSYNC_COMMON_NOEXCEPT_H
#define RDSYNC_SRC_COMMON_INCLUDE_RDSYNC_COMMON_NOEXCEPT_H

#include <functional>

namespace rdsync {

// runs `function`, an escaping exception is logged and turns into exit code 1
int NoExcept(const std::function<int()> &function);

}  // namespace rdsync

#endif  // RDSYNC_SRC_COMMON_INCLUDE_RDSYNC_COMMON_NOEXCEPT_H
