#pragma once

/// @file metrics.h
/// @brief rulemux internal metrics collection for self-monitoring

#include <atomic>
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace rulemux {

/// @brief Constant label set attached to a metric series
using MetricLabels = std::map<std::string, std::string>;

/// @brief A simple counter metric
class Counter {
public:
    explicit Counter(std::string name, std::string description = "",
                     MetricLabels labels = {});

    /// @brief Increment the counter by 1
    void Increment();

    /// @brief Increment the counter by a specific amount
    /// @param delta Amount to add (must be non-negative)
    void Add(int64_t delta);

    /// @brief Get the current value
    int64_t Value() const;

    const std::string& Name() const { return name_; }
    const std::string& Description() const { return description_; }
    const MetricLabels& Labels() const { return labels_; }

private:
    std::string name_;
    std::string description_;
    MetricLabels labels_;
    std::atomic<int64_t> value_{0};
};

/// @brief A gauge metric that can go up and down
class Gauge {
public:
    explicit Gauge(std::string name, std::string description = "",
                   MetricLabels labels = {});

    void Set(double value);
    void Increment(double delta = 1.0);
    void Decrement(double delta = 1.0);
    double Value() const;

    const std::string& Name() const { return name_; }
    const std::string& Description() const { return description_; }
    const MetricLabels& Labels() const { return labels_; }

private:
    std::string name_;
    std::string description_;
    MetricLabels labels_;
    std::atomic<double> value_{0.0};
};

/// @brief A histogram for measuring value distributions
class Histogram {
public:
    /// @brief Create a histogram with default (latency) buckets
    explicit Histogram(std::string name, std::string description = "",
                       MetricLabels labels = {});

    /// @brief Create a histogram with custom buckets
    Histogram(std::string name, std::vector<double> buckets,
              std::string description, MetricLabels labels);

    /// @brief Record a value
    void Observe(double value);

    int64_t Count() const;
    double Sum() const;

    /// @brief Get cumulative bucket counts, last bucket is +Inf
    std::vector<std::pair<double, int64_t>> Buckets() const;

    const std::string& Name() const { return name_; }
    const std::string& Description() const { return description_; }
    const MetricLabels& Labels() const { return labels_; }

private:
    std::string name_;
    std::string description_;
    MetricLabels labels_;
    std::vector<double> bucket_bounds_;
    std::vector<std::atomic<int64_t>> bucket_counts_;
    std::atomic<int64_t> count_{0};
    std::atomic<double> sum_{0.0};
};

/// @brief RAII timer for measuring duration
class ScopedTimer {
public:
    explicit ScopedTimer(Histogram& histogram);
    ~ScopedTimer();

    // Non-copyable
    ScopedTimer(const ScopedTimer&) = delete;
    ScopedTimer& operator=(const ScopedTimer&) = delete;

private:
    Histogram& histogram_;
    std::chrono::steady_clock::time_point start_;
};

/// @brief Metrics registry for managing all metrics
///
/// A series is identified by its name plus its label set, so the same metric
/// name may be registered once per distinct label set.
class MetricsRegistry {
public:
    MetricsRegistry() = default;

    /// @brief Get the process-wide registry instance
    static MetricsRegistry& Instance();

    /// @brief Register or get an existing counter
    Counter& GetCounter(const std::string& name, const std::string& description = "",
                        const MetricLabels& labels = {});

    /// @brief Register or get an existing gauge
    Gauge& GetGauge(const std::string& name, const std::string& description = "",
                    const MetricLabels& labels = {});

    /// @brief Register or get an existing histogram
    Histogram& GetHistogram(const std::string& name, const std::string& description = "",
                            const MetricLabels& labels = {});

    /// @brief Export all metrics in the Prometheus text exposition format
    std::string ExportText() const;

    /// @brief Reset all metrics (primarily for testing)
    void Reset();

private:
    MetricsRegistry(const MetricsRegistry&) = delete;
    MetricsRegistry& operator=(const MetricsRegistry&) = delete;

    mutable std::mutex mutex_;
    std::map<std::string, std::unique_ptr<Counter>> counters_;
    std::map<std::string, std::unique_ptr<Gauge>> gauges_;
    std::map<std::string, std::unique_ptr<Histogram>> histograms_;
};

/// @brief A view of a registry that adds constant labels to every series
///
/// Lets several instances of one component register identically named
/// metrics without colliding, e.g. one rule engine per strategy.
class MetricsScope {
public:
    explicit MetricsScope(MetricsRegistry& registry, MetricLabels labels = {});

    /// @brief Derive a scope carrying additional labels
    MetricsScope With(const MetricLabels& labels) const;

    Counter& GetCounter(const std::string& name, const std::string& description = "") const;
    Gauge& GetGauge(const std::string& name, const std::string& description = "") const;
    Histogram& GetHistogram(const std::string& name, const std::string& description = "") const;

    const MetricLabels& Labels() const { return labels_; }
    MetricsRegistry& Registry() const { return *registry_; }

private:
    MetricsRegistry* registry_;
    MetricLabels labels_;
};

/// @brief Render a label set as {k="v",...}, empty for no labels
std::string FormatMetricLabels(const MetricLabels& labels);

}  // namespace rulemux
