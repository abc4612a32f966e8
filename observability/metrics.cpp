#include "observability/metrics.hpp"

#include <limits>
#include <set>
#include <sstream>

namespace wallet {
namespace observability {

MetricsCollector::MetricsCollector() = default;

void MetricsCollector::incrementCounter(const std::string& name, double value) {
  std::lock_guard<std::mutex> lock(mutex_);
  counters_[name] += value;
}

void MetricsCollector::setGauge(const std::string& name, double value) {
  std::lock_guard<std::mutex> lock(mutex_);
  gauges_[name] = value;
}

void MetricsCollector::incrementGauge(const std::string& name, double value) {
  std::lock_guard<std::mutex> lock(mutex_);
  gauges_[name] += value;
}

void MetricsCollector::decrementGauge(const std::string& name, double value) {
  incrementGauge(name, -value);
}

void MetricsCollector::observeHistogram(const std::string& name, double value) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto& hist = histograms_[name];

  if (hist.buckets.empty()) {
    for (double bound : defaultBuckets()) {
      hist.buckets.push_back({bound, 0});
    }
    hist.buckets.push_back({std::numeric_limits<double>::infinity(), 0});
  }

  hist.count += 1;
  hist.sum += value;

  // Buckets are non-cumulative here; export accumulates them
  for (auto& bucket : hist.buckets) {
    if (value <= bucket.upper_bound) {
      bucket.count += 1;
      break;
    }
  }
}

double MetricsCollector::counterValue(const std::string& name) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = counters_.find(name);
  return it == counters_.end() ? 0.0 : it->second;
}

double MetricsCollector::gaugeValue(const std::string& name) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = gauges_.find(name);
  return it == gauges_.end() ? 0.0 : it->second;
}

std::size_t MetricsCollector::histogramCount(const std::string& name) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = histograms_.find(name);
  return it == histograms_.end() ? 0 : it->second.count;
}

MetricsCollector::Timer::Timer(MetricsCollector& collector, const std::string& name)
    : collector_(collector), name_(name), start_(std::chrono::steady_clock::now()) {
}

MetricsCollector::Timer::~Timer() {
  auto end = std::chrono::steady_clock::now();
  auto duration = std::chrono::duration_cast<std::chrono::microseconds>(end - start_);
  double seconds = duration.count() / 1000000.0;
  collector_.observeHistogram(name_, seconds);
}

std::string MetricsCollector::familyName(const std::string& name) {
  return name.substr(0, name.find('{'));
}

std::string MetricsCollector::exportMetrics() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::stringstream ss;
  std::set<std::string> described;

  for (const auto& [name, value] : counters_) {
    const std::string family = familyName(name);
    if (described.insert(family).second) {
      ss << "# HELP " << family << " Counter metric\n";
      ss << "# TYPE " << family << " counter\n";
    }
    ss << name << " " << value << "\n";
  }

  for (const auto& [name, value] : gauges_) {
    const std::string family = familyName(name);
    if (described.insert(family).second) {
      ss << "# HELP " << family << " Gauge metric\n";
      ss << "# TYPE " << family << " gauge\n";
    }
    ss << name << " " << value << "\n";
  }

  for (const auto& [name, hist] : histograms_) {
    const std::string family = familyName(name);
    if (described.insert(family).second) {
      ss << "# HELP " << family << " Histogram metric\n";
      ss << "# TYPE " << family << " histogram\n";
    }

    // Labels of `name{...}` are carried onto every series, `le` last
    const std::string labels =
        name.size() > family.size() ? name.substr(family.size() + 1,
                                                  name.size() - family.size() - 2)
                                    : "";
    const std::string bucket_prefix = labels.empty() ? "" : labels + ",";
    const std::string series_labels = labels.empty() ? "" : "{" + labels + "}";

    std::size_t cumulative_count = 0;
    for (const auto& bucket : hist.buckets) {
      cumulative_count += bucket.count;

      if (bucket.upper_bound == std::numeric_limits<double>::infinity()) {
        ss << family << "_bucket{" << bucket_prefix << "le=\"+Inf\"} " << cumulative_count
           << "\n";
      } else {
        ss << family << "_bucket{" << bucket_prefix << "le=\"" << bucket.upper_bound << "\"} "
           << cumulative_count << "\n";
      }
    }

    ss << family << "_count" << series_labels << " " << hist.count << "\n";
    ss << family << "_sum" << series_labels << " " << hist.sum << "\n";
  }

  return ss.str();
}

void MetricsCollector::reset() {
  std::lock_guard<std::mutex> lock(mutex_);

  counters_.clear();
  gauges_.clear();
  histograms_.clear();
}

std::vector<double> MetricsCollector::defaultBuckets() {
  return {0.0005, 0.001, 0.0025, 0.005, 0.01, 0.025, 0.05, 0.1, 0.25, 0.5, 1.0, 2.5, 5.0};
}

}  // namespace observability
}  // namespace wallet
