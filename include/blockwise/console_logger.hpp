#pragma once

#include <blockwise/logger.hpp>

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <ostream>
#include <sstream>
#include <string>
#include <string_view>

namespace blockwise {

// Thread-safe logger writing timestamped lines to a pair of streams.
// Lines below error go to the info stream, error and critical to the error
// stream. Defaults are stdout and stderr.
class console_logger {
public:
    explicit console_logger(log_level min_level = log_level::trace)
        : console_logger(std::cout, std::cerr, min_level) {}

    console_logger(std::ostream& info_stream, std::ostream& error_stream, log_level min_level = log_level::trace)
        : _info_stream(&info_stream)
        , _error_stream(&error_stream)
        , _min_level(min_level) {}

    console_logger(console_logger&& other) noexcept
        : _info_stream(other._info_stream)
        , _error_stream(other._error_stream)
        , _min_level(other._min_level)
        , _component(std::move(other._component)) {}

    console_logger& operator=(console_logger&& other) noexcept {
        if (this != &other) {
            _info_stream = other._info_stream;
            _error_stream = other._error_stream;
            _min_level = other._min_level;
            _component = std::move(other._component);
        }
        return *this;
    }

    console_logger(const console_logger&) = delete;
    console_logger& operator=(const console_logger&) = delete;

    auto log(log_level level, std::string_view message) -> void {
        log(level, message, {});
    }

    auto log(log_level level, std::string_view message, const log_fields& fields) -> void {
        if (level < _min_level) {
            return;
        }

        std::ostringstream line;
        line << format_timestamp() << " " << log_level_to_string(level) << ": ";
        if (!_component.empty()) {
            line << "[" << _component << "] ";
        }
        line << message;
        for (const auto& [key, value] : fields) {
            line << " [" << key << "=" << value << "]";
        }
        line << "\n";

        std::lock_guard<std::mutex> lock(_mutex);
        // warning and below go to the info stream
        auto& stream = level >= log_level::error ? *_error_stream : *_info_stream;
        stream << line.str();
        stream.flush();
    }

    auto trace(std::string_view message, const log_fields& fields = {}) -> void {
        log(log_level::trace, message, fields);
    }

    auto debug(std::string_view message, const log_fields& fields = {}) -> void {
        log(log_level::debug, message, fields);
    }

    auto info(std::string_view message, const log_fields& fields = {}) -> void {
        log(log_level::info, message, fields);
    }

    auto warning(std::string_view message, const log_fields& fields = {}) -> void {
        log(log_level::warning, message, fields);
    }

    auto error(std::string_view message, const log_fields& fields = {}) -> void {
        log(log_level::error, message, fields);
    }

    auto critical(std::string_view message, const log_fields& fields = {}) -> void {
        log(log_level::critical, message, fields);
    }

    auto set_min_level(log_level level) -> void {
        std::lock_guard<std::mutex> lock(_mutex);
        _min_level = level;
    }

    [[nodiscard]] auto get_min_level() const -> log_level {
        return _min_level;
    }

    // Tag prefixed to every line, e.g. "Block2"
    auto set_component(std::string component) -> void {
        std::lock_guard<std::mutex> lock(_mutex);
        _component = std::move(component);
    }

private:
    std::ostream* _info_stream;
    std::ostream* _error_stream;
    log_level _min_level;
    std::string _component;
    mutable std::mutex _mutex;

    [[nodiscard]] static auto format_timestamp() -> std::string {
        auto now = std::chrono::system_clock::now();
        auto time_t_now = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()
        ) % 1000;

        std::tm local_tm{};
        localtime_r(&time_t_now, &local_tm);

        std::ostringstream oss;
        oss << std::put_time(&local_tm, "%Y-%m-%d %H:%M:%S")
            << '.' << std::setfill('0') << std::setw(3) << ms.count();
        return oss.str();
    }
};

static_assert(diagnostic_logger<console_logger>,
    "console_logger must satisfy diagnostic_logger concept");

} // namespace blockwise
