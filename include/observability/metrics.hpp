#ifndef METRICS_HPP_
#define METRICS_HPP_

#include <chrono>
#include <map>
#include <mutex>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace settlement {
namespace observability {

using Labels = std::map<std::string, std::string>;

/**
 * Metrics for the settlement pipeline.
 * Counters, gauges and histograms are grouped into families by name; each
 * family holds one series per distinct label set. Export is Prometheus text
 * or a JSON snapshot.
 */
class MetricsCollector {
 public:
  MetricsCollector() = default;

  // Non-copyable
  MetricsCollector(const MetricsCollector&) = delete;
  MetricsCollector& operator=(const MetricsCollector&) = delete;

  // HELP text for a family; shown on export
  void describe(const std::string& name, const std::string& help);

  void incrementCounter(const std::string& name, double value = 1.0);
  void incrementCounter(const std::string& name, const Labels& labels, double value = 1.0);
  double getCounter(const std::string& name, const Labels& labels = {}) const;

  /**
   * Sum over every series of a counter family.
   */
  double getCounterTotal(const std::string& name) const;

  void setGauge(const std::string& name, double value, const Labels& labels = {});
  void addGauge(const std::string& name, double delta, const Labels& labels = {});
  double getGauge(const std::string& name, const Labels& labels = {}) const;

  void observeHistogram(const std::string& name, double value, const Labels& labels = {});
  size_t getHistogramCount(const std::string& name, const Labels& labels = {}) const;

  // Records elapsed seconds into a histogram when destroyed
  class Timer {
   public:
    Timer(MetricsCollector& collector, const std::string& name, Labels labels = {});
    ~Timer();

    double elapsedSeconds() const;

   private:
    MetricsCollector& collector_;
    std::string name_;
    Labels labels_;
    std::chrono::steady_clock::time_point start_;
  };

  std::string exportPrometheus() const;
  nlohmann::json snapshot() const;

  void reset();

 private:
  struct Histogram {
    std::vector<size_t> bucket_counts;  // non-cumulative, one per bound plus +Inf
    size_t count = 0;
    double sum = 0.0;
  };

  static std::string formatLabels(const Labels& labels, const std::string& extra = "");

  mutable std::mutex mutex_;
  std::map<std::string, std::string> help_;
  std::map<std::string, std::map<Labels, double>> counters_;
  std::map<std::string, std::map<Labels, double>> gauges_;
  std::map<std::string, std::map<Labels, Histogram>> histograms_;

  // Bucket bounds in seconds; mirror queries time out at 7s
  static const std::vector<double>& bucketBounds();
};

MetricsCollector& getGlobalMetrics();

}  // namespace observability
}  // namespace settlement

#endif  // METRICS_HPP_
