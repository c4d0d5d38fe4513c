#pragma once

#include <chrono>
#include <concepts>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <tuple>
#include <utility>
#include <vector>

namespace blockwise {

// A metric is configured (name, dimensions), fed values, then emitted
template<typename M>
concept metrics = requires(
    M metric,
    std::string_view name,
    std::string_view dimension_name,
    std::string_view dimension_value,
    std::int64_t count,
    std::chrono::nanoseconds duration,
    double value
) {
    { metric.set_metric_name(name) } -> std::same_as<void>;
    { metric.add_dimension(dimension_name, dimension_value) } -> std::same_as<void>;

    { metric.add_one() } -> std::same_as<void>;
    { metric.add_count(count) } -> std::same_as<void>;
    { metric.add_duration(duration) } -> std::same_as<void>;
    { metric.add_value(value) } -> std::same_as<void>;

    { metric.emit() } -> std::same_as<void>;
};

// Discards everything
class noop_metrics {
public:
    auto set_metric_name([[maybe_unused]] std::string_view name) -> void {}

    auto add_dimension(
        [[maybe_unused]] std::string_view dimension_name,
        [[maybe_unused]] std::string_view dimension_value
    ) -> void {}

    auto add_one() -> void {}

    auto add_count([[maybe_unused]] std::int64_t count) -> void {}

    auto add_duration([[maybe_unused]] std::chrono::nanoseconds duration) -> void {}

    auto add_value([[maybe_unused]] double value) -> void {}

    auto emit() -> void {}
};

static_assert(metrics<noop_metrics>, "noop_metrics must satisfy metrics concept");

// In-memory tally of emitted counts, keyed by metric name and by
// (metric name, dimension name, dimension value). Copies share the same tally
// so a codec holding a copy reports into the caller's instance.
//
// Each call is thread-safe. A set_metric_name ... emit sequence on one
// instance must not interleave with another thread's sequence on the same
// instance.
class counting_metrics {
public:
    counting_metrics()
        : _tally(std::make_shared<tally>()) {}

    counting_metrics(const counting_metrics& other)
        : _tally(other._tally) {
        std::lock_guard<std::mutex> lock(other._mutex);
        _name = other._name;
        _dimensions = other._dimensions;
        _pending = other._pending;
    }

    counting_metrics& operator=(const counting_metrics& other) {
        if (this != &other) {
            std::scoped_lock lock(_mutex, other._mutex);
            _tally = other._tally;
            _name = other._name;
            _dimensions = other._dimensions;
            _pending = other._pending;
        }
        return *this;
    }

    auto set_metric_name(std::string_view name) -> void {
        std::lock_guard<std::mutex> lock(_mutex);
        _name = std::string(name);
    }

    auto add_dimension(std::string_view dimension_name, std::string_view dimension_value) -> void {
        std::lock_guard<std::mutex> lock(_mutex);
        _dimensions.emplace_back(std::string(dimension_name), std::string(dimension_value));
    }

    auto add_one() -> void {
        add_count(1);
    }

    auto add_count(std::int64_t count) -> void {
        std::lock_guard<std::mutex> lock(_mutex);
        _pending += count;
    }

    auto add_duration([[maybe_unused]] std::chrono::nanoseconds duration) -> void {}

    auto add_value([[maybe_unused]] double value) -> void {}

    // Adds the pending count under the name and each dimension, then clears
    // the dimensions and the pending count
    auto emit() -> void {
        std::lock_guard<std::mutex> lock(_mutex);
        {
            std::lock_guard<std::mutex> tally_lock(_tally->mutex);
            _tally->counts[_name] += _pending;
            for (const auto& [dimension_name, dimension_value] : _dimensions) {
                _tally->dimension_counts[{_name, dimension_name, dimension_value}] += _pending;
            }
        }
        _dimensions.clear();
        _pending = 0;
    }

    [[nodiscard]] auto count(std::string_view name) const -> std::int64_t {
        std::lock_guard<std::mutex> lock(_tally->mutex);
        auto it = _tally->counts.find(std::string(name));
        return it == _tally->counts.end() ? 0 : it->second;
    }

    [[nodiscard]] auto count(
        std::string_view name,
        std::string_view dimension_name,
        std::string_view dimension_value
    ) const -> std::int64_t {
        std::lock_guard<std::mutex> lock(_tally->mutex);
        auto it = _tally->dimension_counts.find(
            {std::string(name), std::string(dimension_name), std::string(dimension_value)});
        return it == _tally->dimension_counts.end() ? 0 : it->second;
    }

private:
    using dimension_key = std::tuple<std::string, std::string, std::string>;

    struct tally {
        std::mutex mutex;
        std::map<std::string, std::int64_t> counts;
        std::map<dimension_key, std::int64_t> dimension_counts;
    };

    std::shared_ptr<tally> _tally;
    std::string _name;
    std::vector<std::pair<std::string, std::string>> _dimensions;
    std::int64_t _pending{0};
    mutable std::mutex _mutex;
};

static_assert(metrics<counting_metrics>, "counting_metrics must satisfy metrics concept");

} // namespace blockwise
