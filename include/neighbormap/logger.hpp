#ifndef NEIGHBORMAP_LOGGER_HPP
#define NEIGHBORMAP_LOGGER_HPP

#include <string>    // For std::string, std::to_string
#include <iostream>  // For std::cout, std::cerr, std::endl, std::ostream
#include <fstream>   // For std::ofstream (optional file sink)
#include <memory>    // For std::unique_ptr
#include <ctime>     // For std::time_t, std::time, std::localtime, std::strftime, struct std::tm
#include <cstdio>    // For std::snprintf
#include <cstddef>   // For std::size_t

namespace neighbormap {

enum class LogLevel {
    DEBUG,
    INFO,
    WARNING,
    ERROR,
    CRITICAL
};

class MapperLogger {
public:
    explicit MapperLogger(LogLevel min_level = LogLevel::INFO) : min_log_level_(min_level) {}

    void set_min_log_level(LogLevel level) {
        min_log_level_ = level;
    }

    LogLevel get_min_log_level() const {
        return min_log_level_;
    }

    // Redirects all output (every level) to the given stream. Pass nullptr to
    // go back to stdout/stderr. The stream must outlive the logger.
    void set_output_stream(std::ostream* stream) {
        output_override_ = stream;
    }

    // Mirrors every emitted line into a file, in addition to the console.
    bool open_log_file(const std::string& path) {
        auto file = std::make_unique<std::ofstream>(path, std::ios::app);
        if (!file->is_open()) {
            error("LOGGER", "Failed to open log file: " + path);
            return false;
        }
        log_file_ = std::move(file);
        return true;
    }

    void log(LogLevel level, const std::string& component, const std::string& message) const {
        if (level < min_log_level_) {
            return;
        }

        std::time_t t = std::time(nullptr);
        char time_buf[100];
        struct std::tm* local_tm = std::localtime(&t);

        if (!local_tm || !std::strftime(time_buf, sizeof(time_buf), "%Y-%m-%d %H:%M:%S", local_tm)) {
            std::snprintf(time_buf, sizeof(time_buf), "YYYY-MM-DD HH:MM:SS");
        }

        std::string line = std::string("[") + time_buf + "] " +
                           "[" + level_to_string(level) + "] " +
                           "[" + component + "] " + message;

        std::ostream& output_stream = output_override_ ? *output_override_
                                    : (level >= LogLevel::ERROR) ? std::cerr : std::cout;
        output_stream << line << std::endl;

        if (log_file_) {
            *log_file_ << line << std::endl;
        }
    }

    void debug(const std::string& component, const std::string& message) const {
        log(LogLevel::DEBUG, component, message);
    }
    void info(const std::string& component, const std::string& message) const {
        log(LogLevel::INFO, component, message);
    }
    void warning(const std::string& component, const std::string& message) const {
        log(LogLevel::WARNING, component, message);
    }
    void error(const std::string& component, const std::string& message) const {
        log(LogLevel::ERROR, component, message);
    }

public:
    void log_node_failure(const std::string& address, const std::string& reason) const {
        if (min_log_level_ > LogLevel::ERROR) return;
        log(LogLevel::ERROR, "DISCOVERY", "Discovery error for " + address + ": " + reason);
    }

    void log_neighbor_queued(const std::string& name, const std::string& address,
                             const std::string& device_type, int depth) const {
        if (min_log_level_ > LogLevel::INFO) return;
        log(LogLevel::INFO, "DISCOVERY", "Queued " + name + " (" + address + ") as " +
                                         device_type + " at depth " + std::to_string(depth));
    }

    void log_neighbor_skipped(const std::string& name, const std::string& reason) const {
        if (min_log_level_ > LogLevel::DEBUG) return;
        log(LogLevel::DEBUG, "DISCOVERY", "Skipping " + name + ": " + reason);
    }

    void log_crawl_stats(std::size_t devices, std::size_t visited, std::size_t failures) const {
        if (min_log_level_ > LogLevel::INFO) return;
        log(LogLevel::INFO, "STATS", "Discovery complete: Devices=" + std::to_string(devices) +
                                     ", Visited=" + std::to_string(visited) +
                                     ", Failures=" + std::to_string(failures));
    }

private:
    LogLevel min_log_level_;
    std::ostream* output_override_ = nullptr;
    std::unique_ptr<std::ofstream> log_file_;

    std::string level_to_string(LogLevel level) const {
        switch (level) {
            case LogLevel::DEBUG:    return "DEBUG   ";
            case LogLevel::INFO:     return "INFO    ";
            case LogLevel::WARNING:  return "WARNING ";
            case LogLevel::ERROR:    return "ERROR   ";
            case LogLevel::CRITICAL: return "CRITICAL";
            default:                 return "UNKNOWN ";
        }
    }
};

} // namespace neighbormap

#endif // NEIGHBORMAP_LOGGER_HPP
