#ifndef RDSYNC_SRC_COMMON_INCLUDE_RDSYNC_COMMON_METRIC_CALLBACK_VISITOR_H
#define RDSYNC_SRC_COMMON_INCLUDE_RDSYNC_COMMON_METRIC_CALLBACK_VISITOR_H

#include <rdsync/common/metrics.h>

#include <functional>
#include <string>
#include <vector>

namespace rdsync::metrics {

/***
 * Flattens a container tree into "//root/child/metric" keys.
 */
class MetricCallbackVisitor final : private MetricVisitor {
public:
  using Callback =
      std::function<void(const std::string &key, MetricValueType value)>;

  void Snapshot(
      const std::string &root,
      MetricContainer &container,
      Callback callback);

private:
  Callback callback_;
  std::vector<std::string> context_;

  void Visit(const std::string &name, MetricContainer &container) override;
  void Visit(const std::string &name, Metric &value) override;
};

// logs every metric of `container` at INFO level
void LogMetrics(const std::string &root, MetricContainer &container);

}  // namespace rdsync::metrics

#endif  // RDSYNC_SRC_COMMON_INCLUDE_RDSYNC_COMMON_METRIC_CALLBACK_VISITOR_H
