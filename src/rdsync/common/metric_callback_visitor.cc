#include <glog/logging.h>
#include <rdsync/common/metric_callback_visitor.h>

#include <sstream>

namespace rdsync::metrics {

void MetricCallbackVisitor::Visit(
    const std::string &name,
    MetricContainer &container) {
  context_.push_back(name);
  container.Accept(*this);
  context_.pop_back();
}

void MetricCallbackVisitor::Visit(const std::string &name, Metric &value) {
  std::stringstream s;
  s << "//";
  for (const auto &term : context_) {
    s << term << "/";
  }
  s << name;
  callback_(s.str(), value.load());
}

void MetricCallbackVisitor::Snapshot(
    const std::string &root,
    MetricContainer &container,
    Callback callback) {
  callback_ = std::move(callback);
  context_.clear();
  if (!root.empty()) {
    context_.push_back(root);
  }
  container.Accept(*this);
}

void LogMetrics(const std::string &root, MetricContainer &container) {
  MetricCallbackVisitor().Snapshot(root, container, [](auto key, auto value) {
    LOG(INFO) << key << "=" << value;
  });
}

}  // namespace rdsync::metrics
