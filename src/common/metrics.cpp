#include "metrics.h"

#include <algorithm>
#include <limits>
#include <sstream>

namespace rulemux {

namespace {

// Default histogram buckets (latency in seconds)
const std::vector<double> kDefaultBuckets = {
    0.001, 0.005, 0.01, 0.025, 0.05, 0.1, 0.25, 0.5, 1.0, 2.5, 5.0, 10.0
};

std::vector<double> SortedBuckets(std::vector<double> buckets) {
    std::sort(buckets.begin(), buckets.end());
    return buckets;
}

std::string SeriesKey(const std::string& name, const MetricLabels& labels) {
    return name + FormatMetricLabels(labels);
}

std::string EscapeLabelValue(const std::string& value) {
    std::string escaped;
    escaped.reserve(value.size());
    for (char c : value) {
        switch (c) {
            case '\\': escaped += "\\\\"; break;
            case '"': escaped += "\\\""; break;
            case '\n': escaped += "\\n"; break;
            default: escaped += c;
        }
    }
    return escaped;
}

void AddDouble(std::atomic<double>& target, double delta) {
    double current = target.load(std::memory_order_relaxed);
    while (!target.compare_exchange_weak(current, current + delta,
                                         std::memory_order_relaxed)) {
        // Retry on failure
    }
}

// Writes HELP/TYPE once per metric family; series of one family are adjacent
// because the registry maps are ordered by series key.
void WriteHeader(std::ostringstream& oss, std::string& last_family,
                 const std::string& name, const std::string& description,
                 const char* type) {
    if (name == last_family) {
        return;
    }
    last_family = name;
    oss << "# HELP " << name << " " << description << "\n";
    oss << "# TYPE " << name << " " << type << "\n";
}

}  // namespace

std::string FormatMetricLabels(const MetricLabels& labels) {
    if (labels.empty()) {
        return "";
    }
    std::string out = "{";
    bool first = true;
    for (const auto& [key, value] : labels) {
        if (!first) {
            out += ",";
        }
        first = false;
        out += key + "=\"" + EscapeLabelValue(value) + "\"";
    }
    out += "}";
    return out;
}

// Counter implementation
Counter::Counter(std::string name, std::string description, MetricLabels labels)
    : name_(std::move(name)),
      description_(std::move(description)),
      labels_(std::move(labels)) {}

void Counter::Increment() {
    value_.fetch_add(1, std::memory_order_relaxed);
}

void Counter::Add(int64_t delta) {
    if (delta >= 0) {
        value_.fetch_add(delta, std::memory_order_relaxed);
    }
}

int64_t Counter::Value() const {
    return value_.load(std::memory_order_relaxed);
}

// Gauge implementation
Gauge::Gauge(std::string name, std::string description, MetricLabels labels)
    : name_(std::move(name)),
      description_(std::move(description)),
      labels_(std::move(labels)) {}

void Gauge::Set(double value) {
    value_.store(value, std::memory_order_relaxed);
}

void Gauge::Increment(double delta) {
    AddDouble(value_, delta);
}

void Gauge::Decrement(double delta) {
    Increment(-delta);
}

double Gauge::Value() const {
    return value_.load(std::memory_order_relaxed);
}

// Histogram implementation
Histogram::Histogram(std::string name, std::string description, MetricLabels labels)
    : Histogram(std::move(name), kDefaultBuckets, std::move(description), std::move(labels)) {}

Histogram::Histogram(std::string name, std::vector<double> buckets,
                     std::string description, MetricLabels labels)
    : name_(std::move(name)),
      description_(std::move(description)),
      labels_(std::move(labels)),
      bucket_bounds_(SortedBuckets(std::move(buckets))),
      bucket_counts_(bucket_bounds_.size() + 1) {  // +1 for +Inf bucket
    for (auto& count : bucket_counts_) {
        count.store(0, std::memory_order_relaxed);
    }
}

void Histogram::Observe(double value) {
    count_.fetch_add(1, std::memory_order_relaxed);
    AddDouble(sum_, value);

    auto it = std::lower_bound(bucket_bounds_.begin(), bucket_bounds_.end(), value);
    size_t bucket_idx = std::distance(bucket_bounds_.begin(), it);
    bucket_counts_[bucket_idx].fetch_add(1, std::memory_order_relaxed);
}

int64_t Histogram::Count() const {
    return count_.load(std::memory_order_relaxed);
}

double Histogram::Sum() const {
    return sum_.load(std::memory_order_relaxed);
}

std::vector<std::pair<double, int64_t>> Histogram::Buckets() const {
    std::vector<std::pair<double, int64_t>> result;
    result.reserve(bucket_bounds_.size() + 1);

    int64_t cumulative = 0;
    for (size_t i = 0; i < bucket_bounds_.size(); ++i) {
        cumulative += bucket_counts_[i].load(std::memory_order_relaxed);
        result.emplace_back(bucket_bounds_[i], cumulative);
    }
    cumulative += bucket_counts_.back().load(std::memory_order_relaxed);
    result.emplace_back(std::numeric_limits<double>::infinity(), cumulative);

    return result;
}

// ScopedTimer implementation
ScopedTimer::ScopedTimer(Histogram& histogram)
    : histogram_(histogram), start_(std::chrono::steady_clock::now()) {}

ScopedTimer::~ScopedTimer() {
    std::chrono::duration<double> duration = std::chrono::steady_clock::now() - start_;
    histogram_.Observe(duration.count());
}

// MetricsRegistry implementation
MetricsRegistry& MetricsRegistry::Instance() {
    static MetricsRegistry instance;
    return instance;
}

Counter& MetricsRegistry::GetCounter(const std::string& name, const std::string& description,
                                     const MetricLabels& labels) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& slot = counters_[SeriesKey(name, labels)];
    if (!slot) {
        slot = std::make_unique<Counter>(name, description, labels);
    }
    return *slot;
}

Gauge& MetricsRegistry::GetGauge(const std::string& name, const std::string& description,
                                 const MetricLabels& labels) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& slot = gauges_[SeriesKey(name, labels)];
    if (!slot) {
        slot = std::make_unique<Gauge>(name, description, labels);
    }
    return *slot;
}

Histogram& MetricsRegistry::GetHistogram(const std::string& name, const std::string& description,
                                         const MetricLabels& labels) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& slot = histograms_[SeriesKey(name, labels)];
    if (!slot) {
        slot = std::make_unique<Histogram>(name, description, labels);
    }
    return *slot;
}

std::string MetricsRegistry::ExportText() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::ostringstream oss;
    std::string family;

    for (const auto& [key, counter] : counters_) {
        WriteHeader(oss, family, counter->Name(), counter->Description(), "counter");
        oss << key << " " << counter->Value() << "\n";
    }

    for (const auto& [key, gauge] : gauges_) {
        WriteHeader(oss, family, gauge->Name(), gauge->Description(), "gauge");
        oss << key << " " << gauge->Value() << "\n";
    }

    for (const auto& [key, histogram] : histograms_) {
        WriteHeader(oss, family, histogram->Name(), histogram->Description(), "histogram");
        const std::string& name = histogram->Name();
        for (const auto& [bound, count] : histogram->Buckets()) {
            MetricLabels labels = histogram->Labels();
            std::ostringstream le;
            if (bound == std::numeric_limits<double>::infinity()) {
                le << "+Inf";
            } else {
                le << bound;
            }
            labels["le"] = le.str();
            oss << name << "_bucket" << FormatMetricLabels(labels) << " " << count << "\n";
        }
        const std::string labels = FormatMetricLabels(histogram->Labels());
        oss << name << "_sum" << labels << " " << histogram->Sum() << "\n";
        oss << name << "_count" << labels << " " << histogram->Count() << "\n";
    }

    return oss.str();
}

void MetricsRegistry::Reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    counters_.clear();
    gauges_.clear();
    histograms_.clear();
}

// MetricsScope implementation
MetricsScope::MetricsScope(MetricsRegistry& registry, MetricLabels labels)
    : registry_(&registry), labels_(std::move(labels)) {}

MetricsScope MetricsScope::With(const MetricLabels& labels) const {
    MetricLabels merged = labels_;
    for (const auto& [key, value] : labels) {
        merged[key] = value;
    }
    return MetricsScope(*registry_, std::move(merged));
}

Counter& MetricsScope::GetCounter(const std::string& name, const std::string& description) const {
    return registry_->GetCounter(name, description, labels_);
}

Gauge& MetricsScope::GetGauge(const std::string& name, const std::string& description) const {
    return registry_->GetGauge(name, description, labels_);
}

Histogram& MetricsScope::GetHistogram(const std::string& name, const std::string& description) const {
    return registry_->GetHistogram(name, description, labels_);
}

}  // namespace rulemux
