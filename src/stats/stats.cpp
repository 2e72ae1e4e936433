// ==============================================================================
// stats.cpp - Статистика потребления ресурсов
// ==============================================================================

#include <fleethunt/stats.hpp>

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace fleethunt::stats {

// ============================================================================
// Histogram
// ============================================================================

Histogram Histogram::with_bounds(std::vector<double> bounds) {
    for (std::size_t i = 1; i < bounds.size(); ++i) {
        if (!(bounds[i - 1] < bounds[i])) {
            throw std::invalid_argument("histogram bounds must be strictly increasing");
        }
    }
    Histogram h;
    h.counts.assign(bounds.size() + 1, 0);
    h.bounds = std::move(bounds);
    return h;
}

Histogram Histogram::fixed_width(double start, double width, std::size_t count) {
    if (!(width > 0.0)) {
        throw std::invalid_argument("histogram bin width must be positive");
    }
    std::vector<double> bounds;
    bounds.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        bounds.push_back(start + width * static_cast<double>(i));
    }
    return with_bounds(std::move(bounds));
}

void Histogram::add(double value) {
    auto it = std::upper_bound(bounds.begin(), bounds.end(), value);
    counts[static_cast<std::size_t>(it - bounds.begin())] += 1;
}

std::uint64_t Histogram::total() const {
    std::uint64_t sum = 0;
    for (auto c : counts) {
        sum += c;
    }
    return sum;
}

const std::vector<double>& cpu_bins() {
    static const std::vector<double> bins = {0.1, 0.2, 0.3, 0.4, 0.5, 0.75, 1,  1.5, 2,  2.5,
                                             3,   4,   5,   6,   7,   8,    9,  10,  15, 20};
    return bins;
}

const std::vector<double>& network_bins() {
    static const std::vector<double> bins = [] {
        std::vector<double> b;
        for (double v = 16; v <= 2097152; v *= 2) {
            b.push_back(v);
        }
        return b;
    }();
    return bins;
}

// ============================================================================
// RunningStats
// ============================================================================

RunningStats::RunningStats(Histogram histogram) : histogram_(std::move(histogram)) {}

void RunningStats::add(double value) {
    ++count_;
    const double delta = value - mean_;
    mean_ += delta / static_cast<double>(count_);
    const double delta2 = value - mean_;
    m2_ += delta * delta2;

    histogram_.add(value);
}

void RunningStats::merge(const RunningStats& other) {
    if (other.count_ == 0) {
        return;
    }
    if (count_ == 0) {
        count_ = other.count_;
        mean_ = other.mean_;
        m2_ = other.m2_;
    } else {
        const double n_a = static_cast<double>(count_);
        const double n_b = static_cast<double>(other.count_);
        const double n = n_a + n_b;
        const double delta = other.mean_ - mean_;
        mean_ += delta * n_b / n;
        m2_ += other.m2_ + delta * delta * n_a * n_b / n;
        count_ += other.count_;
    }

    if (histogram_.bounds == other.histogram_.bounds) {
        for (std::size_t i = 0; i < histogram_.counts.size(); ++i) {
            histogram_.counts[i] += other.histogram_.counts[i];
        }
    }
}

double RunningStats::variance() const {
    return count_ > 0 ? m2_ / static_cast<double>(count_) : 0.0;
}

double RunningStats::stdev() const {
    return std::sqrt(variance());
}

MetricSummary summarize(const RunningStats& stats) {
    MetricSummary s;
    s.num = stats.count();
    s.mean = stats.mean();
    s.stdev = stats.stdev();
    s.histogram = stats.histogram();
    return s;
}

// ============================================================================
// WorstPerformers
// ============================================================================

void WorstPerformers::add(const ResourceSample& sample) {
    if (capacity_ == 0) {
        return;
    }
    if (items_.size() == capacity_ && sample.total_cpu() <= items_.back().total_cpu()) {
        return;
    }

    auto pos = std::upper_bound(items_.begin(), items_.end(), sample.total_cpu(),
                                [](double total, const ResourceSample& item) {
                                    return total > item.total_cpu();
                                });
    items_.insert(pos, sample);
    if (items_.size() > capacity_) {
        items_.pop_back();
    }
}

// ============================================================================
// ResourceUsageStats
// ============================================================================

ResourceUsageStats::ResourceUsageStats()
    : user_cpu_(Histogram::with_bounds(cpu_bins())),
      system_cpu_(Histogram::with_bounds(cpu_bins())),
      network_bytes_sent_(Histogram::with_bounds(network_bins())),
      worst_(NUM_WORST_PERFORMERS) {}

void ResourceUsageStats::add(const ResourceSample& sample) {
    std::lock_guard<std::mutex> lock(mutex_);
    user_cpu_.add(sample.user_cpu_time);
    system_cpu_.add(sample.system_cpu_time);
    network_bytes_sent_.add(static_cast<double>(sample.network_bytes_sent));
    worst_.add(sample);
    samples_.push_back(sample);
}

UsageStatsSnapshot ResourceUsageStats::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    UsageStatsSnapshot snap;
    snap.user_cpu = summarize(user_cpu_);
    snap.system_cpu = summarize(system_cpu_);
    snap.network_bytes_sent = summarize(network_bytes_sent_);
    snap.worst_performers = worst_.items();
    return snap;
}

std::vector<ResourceSample> ResourceUsageStats::samples() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return samples_;
}

// ============================================================================
// get_resource_usage
// ============================================================================

ResourceUsage get_resource_usage(const std::vector<ResourceSample>& samples,
                                 const std::optional<std::string>& client_id,
                                 bool group_by_client) {
    if (group_by_client) {
        PerClientUsage result;
        for (const auto& s : samples) {
            if (client_id && s.client_id != *client_id) {
                continue;
            }
            auto& usage = result[s.client_id];
            usage.user += s.user_cpu_time;
            usage.system += s.system_cpu_time;
        }
        return result;
    }

    PerTaskUsage result;
    for (const auto& s : samples) {
        if (client_id && s.client_id != *client_id) {
            continue;
        }
        auto& usage = result[s.client_id][s.task_id];
        usage.user += s.user_cpu_time;
        usage.system += s.system_cpu_time;
    }
    return result;
}

}  // namespace fleethunt::stats
