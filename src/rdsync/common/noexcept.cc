#include <glog/logging.h>
#include <rdsync/common/noexcept.h>

#include <exception>

namespace rdsync {

int NoExcept(const std::function<int()> &function) {
  try {
    return function();
  } catch (std::exception &e) {
    LOG(ERROR) << e.what();
    return 1;
  }
}

}  // namespace rdsync
