#ifndef RDSYNC_SRC_COMMON_INCLUDE_RDSYNC_COMMON_METRICS_H
#define RDSYNC_SRC_COMMON_INCLUDE_RDSYNC_COMMON_METRICS_H

#include <atomic>
#include <cstdint>
#include <string>

// NOTE: using #host -- impossible without macro
// NOLINTNEXTLINE(cppcoreguidelines-macro-usage)
#define RDSYNC_VISIT_METRIC(host) visitor.Visit(std::string(#host), host)

namespace rdsync::metrics {

using MetricValueType = intmax_t;

using Metric = std::atomic<MetricValueType>;

class MetricVisitor;

/***
 * Anything that exposes counters to a MetricVisitor.
 * Nested containers show up as path segments, e.g. //session/mux/frames_sent_
 */
class MetricContainer {
public:
  virtual ~MetricContainer() = default;

  virtual void Accept(MetricVisitor &visitor) = 0;
};

class MetricVisitor {
public:
  virtual ~MetricVisitor() = default;

  virtual void Visit(const std::string &name, Metric &value) = 0;

  virtual void Visit(const std::string &name, MetricContainer &container) = 0;
};

}  // namespace rdsync::metrics

#endif  // RDSYNC_SRC_COMMON_INCLUDE_RDSYNC_COMMON_METRICS_H
