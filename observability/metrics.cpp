#include "metrics.hpp"

#include <sstream>
#include <utility>

namespace settlement {
namespace observability {

namespace {

template <typename Map>
const typename Map::mapped_type::mapped_type* findSeries(const Map& families, const std::string& name,
                                            const Labels& labels) {
  auto family = families.find(name);
  if (family == families.end()) return nullptr;
  auto series = family->second.find(labels);
  return series == family->second.end() ? nullptr : &series->second;
}

}  // namespace

void MetricsCollector::describe(const std::string& name, const std::string& help) {
  std::lock_guard<std::mutex> lock(mutex_);
  help_[name] = help;
}

void MetricsCollector::incrementCounter(const std::string& name, double value) {
  incrementCounter(name, Labels{}, value);
}

void MetricsCollector::incrementCounter(const std::string& name, const Labels& labels,
                                        double value) {
  if (value < 0) return;  // counters never go down
  std::lock_guard<std::mutex> lock(mutex_);
  counters_[name][labels] += value;
}

double MetricsCollector::getCounter(const std::string& name, const Labels& labels) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const double* value = findSeries(counters_, name, labels);
  return value ? *value : 0.0;
}

double MetricsCollector::getCounterTotal(const std::string& name) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto family = counters_.find(name);
  if (family == counters_.end()) return 0.0;

  double total = 0.0;
  for (const auto& [labels, value] : family->second) {
    total += value;
  }
  return total;
}

void MetricsCollector::setGauge(const std::string& name, double value, const Labels& labels) {
  std::lock_guard<std::mutex> lock(mutex_);
  gauges_[name][labels] = value;
}

void MetricsCollector::addGauge(const std::string& name, double delta, const Labels& labels) {
  std::lock_guard<std::mutex> lock(mutex_);
  gauges_[name][labels] += delta;
}

double MetricsCollector::getGauge(const std::string& name, const Labels& labels) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const double* value = findSeries(gauges_, name, labels);
  return value ? *value : 0.0;
}

void MetricsCollector::observeHistogram(const std::string& name, double value,
                                        const Labels& labels) {
  const auto& bounds = bucketBounds();
  std::lock_guard<std::mutex> lock(mutex_);
  Histogram& hist = histograms_[name][labels];
  if (hist.bucket_counts.empty()) {
    hist.bucket_counts.assign(bounds.size() + 1, 0);
  }

  size_t index = 0;
  while (index < bounds.size() && value > bounds[index]) {
    ++index;
  }
  hist.bucket_counts[index] += 1;
  hist.count += 1;
  hist.sum += value;
}

size_t MetricsCollector::getHistogramCount(const std::string& name, const Labels& labels) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const Histogram* hist = findSeries(histograms_, name, labels);
  return hist ? hist->count : 0;
}

MetricsCollector::Timer::Timer(MetricsCollector& collector, const std::string& name,
                               Labels labels)
    : collector_(collector), name_(name), labels_(std::move(labels)),
      start_(std::chrono::steady_clock::now()) {
}

MetricsCollector::Timer::~Timer() {
  collector_.observeHistogram(name_, elapsedSeconds(), labels_);
}

double MetricsCollector::Timer::elapsedSeconds() const {
  auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
      std::chrono::steady_clock::now() - start_);
  return elapsed.count() / 1000000.0;
}

std::string MetricsCollector::formatLabels(const Labels& labels, const std::string& extra) {
  if (labels.empty() && extra.empty()) return "";

  std::string out = "{";
  bool first = true;
  for (const auto& [key, value] : labels) {
    if (!first) out += ",";
    first = false;
    out += key + "=" + nlohmann::json(value).dump();
  }
  if (!extra.empty()) {
    if (!first) out += ",";
    out += extra;
  }
  out += "}";
  return out;
}

std::string MetricsCollector::exportPrometheus() const {
  const auto& bounds = bucketBounds();
  std::lock_guard<std::mutex> lock(mutex_);
  std::ostringstream ss;

  auto header = [&](const std::string& name, const char* type) {
    auto help = help_.find(name);
    if (help != help_.end()) {
      ss << "# HELP " << name << " " << help->second << "\n";
    }
    ss << "# TYPE " << name << " " << type << "\n";
  };

  for (const auto& [name, family] : counters_) {
    header(name, "counter");
    for (const auto& [labels, value] : family) {
      ss << name << formatLabels(labels) << " " << value << "\n";
    }
  }

  for (const auto& [name, family] : gauges_) {
    header(name, "gauge");
    for (const auto& [labels, value] : family) {
      ss << name << formatLabels(labels) << " " << value << "\n";
    }
  }

  for (const auto& [name, family] : histograms_) {
    header(name, "histogram");
    for (const auto& [labels, hist] : family) {
      size_t cumulative = 0;
      for (size_t i = 0; i < hist.bucket_counts.size(); ++i) {
        cumulative += hist.bucket_counts[i];
        std::ostringstream le;
        if (i < bounds.size()) {
          le << "le=\"" << bounds[i] << "\"";
        } else {
          le << "le=\"+Inf\"";
        }
        ss << name << "_bucket" << formatLabels(labels, le.str()) << " " << cumulative << "\n";
      }
      ss << name << "_count" << formatLabels(labels) << " " << hist.count << "\n";
      ss << name << "_sum" << formatLabels(labels) << " " << hist.sum << "\n";
    }
  }

  return ss.str();
}

nlohmann::json MetricsCollector::snapshot() const {
  std::lock_guard<std::mutex> lock(mutex_);
  nlohmann::json out = {{"counters", nlohmann::json::array()},
                        {"gauges", nlohmann::json::array()},
                        {"histograms", nlohmann::json::array()}};

  for (const auto& [name, family] : counters_) {
    for (const auto& [labels, value] : family) {
      out["counters"].push_back({{"name", name}, {"labels", labels}, {"value", value}});
    }
  }
  for (const auto& [name, family] : gauges_) {
    for (const auto& [labels, value] : family) {
      out["gauges"].push_back({{"name", name}, {"labels", labels}, {"value", value}});
    }
  }
  for (const auto& [name, family] : histograms_) {
    for (const auto& [labels, hist] : family) {
      out["histograms"].push_back(
          {{"name", name}, {"labels", labels}, {"count", hist.count}, {"sum", hist.sum}});
    }
  }
  return out;
}

void MetricsCollector::reset() {
  std::lock_guard<std::mutex> lock(mutex_);
  counters_.clear();
  gauges_.clear();
  histograms_.clear();
}

const std::vector<double>& MetricsCollector::bucketBounds() {
  static const std::vector<double> bounds = {0.05, 0.1, 0.25, 0.5, 1.0, 2.0,
                                             3.0, 5.0, 7.0, 15.0, 30.0, 60.0};
  return bounds;
}

MetricsCollector& getGlobalMetrics() {
  static MetricsCollector instance;
  return instance;
}

}  // namespace observability
}  // namespace settlement
