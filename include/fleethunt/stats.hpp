// ==============================================================================
// fleethunt/stats.hpp - Статистика потребления ресурсов
// ==============================================================================
//
// Назначение:
// - Histogram: счётчики по границам бинов
// - RunningStats: онлайн mean/variance (алгоритм Welford) + гистограмма
// - ResourceUsageStats: три метрики (user CPU, system CPU, network bytes)
//   и top-K худших исполнителей по user+system CPU
// - get_resource_usage: выборка потребления по клиентам/задачам
//
// Stdev - популяционное отклонение (деление на N).
//
// ==============================================================================

#ifndef FLEETHUNT_STATS_HPP
#define FLEETHUNT_STATS_HPP

#include <cstddef>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace fleethunt::stats {

// ============================================================================
// Histogram
// ============================================================================

/// Гистограмма с заданными нижними границами бинов
///
/// Значение попадает в последний бин, чья нижняя граница <= значения.
/// counts[0] - underflow (значения меньше bounds[0]), counts[i + 1]
/// соответствует bounds[i]; counts.size() == bounds.size() + 1.
struct Histogram {
    std::vector<double> bounds;
    std::vector<std::uint64_t> counts;

    Histogram() : counts(1, 0) {}

    /// Гистограмма с явными границами (должны возрастать)
    /// @throw std::invalid_argument если границы не возрастают
    static Histogram with_bounds(std::vector<double> bounds);

    /// count бинов ширины width: нижние границы start, start+width, ..
    /// @throw std::invalid_argument при width <= 0
    static Histogram fixed_width(double start, double width, std::size_t count);

    void add(double value);

    /// Сумма всех счётчиков
    std::uint64_t total() const;
};

/// Границы для CPU (секунды)
const std::vector<double>& cpu_bins();

/// Границы для сетевого трафика (байты)
const std::vector<double>& network_bins();

// ============================================================================
// RunningStats
// ============================================================================

/// Онлайн-аккумулятор: count, mean, M2 (сумма квадратов отклонений), гистограмма
class RunningStats {
public:
    explicit RunningStats(Histogram histogram = Histogram());

    /// Добавить значение (Welford)
    void add(double value);

    /// Слить с другим аккумулятором (параллельная формула Chan et al.)
    void merge(const RunningStats& other);

    std::uint64_t count() const { return count_; }
    double mean() const { return mean_; }

    /// Популяционная дисперсия (M2 / N)
    double variance() const;

    /// Популяционное стандартное отклонение
    double stdev() const;

    const Histogram& histogram() const { return histogram_; }

private:
    std::uint64_t count_ = 0;
    double mean_ = 0.0;
    double m2_ = 0.0;
    Histogram histogram_;
};

// ============================================================================
// ResourceSample
// ============================================================================

/// Потребление ресурсов одной завершённой задачей
struct ResourceSample {
    std::string client_id;
    std::string task_id;
    double user_cpu_time = 0.0;
    double system_cpu_time = 0.0;
    std::uint64_t network_bytes_sent = 0;

    /// Ключ ранжирования худших исполнителей
    double total_cpu() const { return user_cpu_time + system_cpu_time; }
};

/// Сводка одной метрики
struct MetricSummary {
    std::uint64_t num = 0;
    double mean = 0.0;
    double stdev = 0.0;
    Histogram histogram;
};

MetricSummary summarize(const RunningStats& stats);

// ============================================================================
// WorstPerformers
// ============================================================================

/// Ограниченный список (K) образцов с наибольшим total_cpu, по убыванию
class WorstPerformers {
public:
    explicit WorstPerformers(std::size_t capacity) : capacity_(capacity) {}

    /// Вставка за O(K); при равенстве новый образец идёт после существующих
    void add(const ResourceSample& sample);

    const std::vector<ResourceSample>& items() const { return items_; }

    std::size_t capacity() const { return capacity_; }

private:
    std::size_t capacity_;
    std::vector<ResourceSample> items_;
};

// ============================================================================
// ResourceUsageStats
// ============================================================================

/// Снимок статистики hunt
struct UsageStatsSnapshot {
    MetricSummary user_cpu;
    MetricSummary system_cpu;
    MetricSummary network_bytes_sent;
    std::vector<ResourceSample> worst_performers;
};

/// Потокобезопасный аккумулятор потребления ресурсов hunt
class ResourceUsageStats {
public:
    static constexpr std::size_t NUM_WORST_PERFORMERS = 10;

    ResourceUsageStats();

    ResourceUsageStats(const ResourceUsageStats&) = delete;
    ResourceUsageStats& operator=(const ResourceUsageStats&) = delete;

    /// Учесть образец; безопасно из нескольких потоков
    void add(const ResourceSample& sample);

    UsageStatsSnapshot snapshot() const;

    /// Все образцы в порядке поступления
    std::vector<ResourceSample> samples() const;

private:
    mutable std::mutex mutex_;
    RunningStats user_cpu_;
    RunningStats system_cpu_;
    RunningStats network_bytes_sent_;
    WorstPerformers worst_;
    std::vector<ResourceSample> samples_;
};

// ============================================================================
// get_resource_usage
// ============================================================================

/// Суммарное CPU время
struct CpuUsage {
    double user = 0.0;
    double system = 0.0;
};

/// client_id -> task_id -> usage
using PerTaskUsage = std::map<std::string, std::map<std::string, CpuUsage>>;

/// client_id -> суммарный usage клиента
using PerClientUsage = std::map<std::string, CpuUsage>;

using ResourceUsage = std::variant<PerTaskUsage, PerClientUsage>;

/// Выборка потребления.
/// @param client_id если задан - только этот клиент
/// @param group_by_client true - суммы по клиенту (PerClientUsage),
///                        false - по задачам (PerTaskUsage)
/// Повторные образцы одной задачи суммируются.
ResourceUsage get_resource_usage(const std::vector<ResourceSample>& samples,
                                 const std::optional<std::string>& client_id,
                                 bool group_by_client);

}  // namespace fleethunt::stats

#endif  // FLEETHUNT_STATS_HPP
