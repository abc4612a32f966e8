#ifndef WALLET_METRICS_HPP_
#define WALLET_METRICS_HPP_

#include <chrono>
#include <cstddef>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace wallet {
namespace observability {

/**
 * Metrics collection for the ledger: counters, gauges and histograms with
 * Prometheus text output. Names may carry a label set, e.g.
 * `wallet_operation_failures_total{kind="INSUFFICIENT_FUNDS"}`.
 */
class MetricsCollector {
 public:
  MetricsCollector();
  ~MetricsCollector() = default;

  MetricsCollector(const MetricsCollector&) = delete;
  MetricsCollector& operator=(const MetricsCollector&) = delete;

  // Counter: monotonically increasing value
  void incrementCounter(const std::string& name, double value = 1.0);

  // Gauge: value that can go up and down
  void setGauge(const std::string& name, double value);
  void incrementGauge(const std::string& name, double value = 1.0);
  void decrementGauge(const std::string& name, double value = 1.0);

  // Histogram: distribution of values
  void observeHistogram(const std::string& name, double value);

  double counterValue(const std::string& name) const;
  double gaugeValue(const std::string& name) const;
  std::size_t histogramCount(const std::string& name) const;

  // Records elapsed seconds into a histogram when destroyed
  class Timer {
   public:
    Timer(MetricsCollector& collector, const std::string& name);
    ~Timer();

    Timer(const Timer&) = delete;
    Timer& operator=(const Timer&) = delete;

   private:
    MetricsCollector& collector_;
    std::string name_;
    std::chrono::steady_clock::time_point start_;
  };

  // Export metrics in Prometheus format
  std::string exportMetrics() const;

  // Reset all metrics
  void reset();

 private:
  struct HistogramBucket {
    double upper_bound;
    std::size_t count{0};
  };

  struct Histogram {
    std::vector<HistogramBucket> buckets;
    std::size_t count{0};
    double sum{0.0};
  };

  // Splits `name{labels}` into the family name used for HELP/TYPE lines
  static std::string familyName(const std::string& name);

  mutable std::mutex mutex_;
  std::map<std::string, double> counters_;
  std::map<std::string, double> gauges_;
  std::map<std::string, Histogram> histograms_;

  // Default histogram buckets (in seconds)
  static std::vector<double> defaultBuckets();
};

}  // namespace observability
}  // namespace wallet

#endif  // WALLET_METRICS_HPP_
