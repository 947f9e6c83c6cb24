#pragma once

#include <cstdint>
#include <fstream>
#include <memory>
#include <mutex>
#include <ostream>
#include <string>
#include <type_traits>
#include <vector>

enum class log_level {
    debug,
    info,
    warn,
    error,
};

const char* to_string(log_level level);
bool parse_log_level(const std::string& text, log_level& out);

struct log_field {
    std::string key;
    std::string value;

    log_field(std::string k, std::string v) : key(std::move(k)), value(std::move(v)) {}
    log_field(std::string k, const char* v) : key(std::move(k)), value(v ? v : "") {}
    log_field(std::string k, bool v) : key(std::move(k)), value(v ? "true" : "false") {}

    template <typename NumberT,
              typename = std::enable_if_t<std::is_arithmetic<NumberT>::value>>
    log_field(std::string k, NumberT v) : key(std::move(k)), value(std::to_string(v)) {}
};

using log_fields = std::vector<log_field>;

// Receives structured events from the components it is handed to.
class logger {
public:
    virtual ~logger() = default;

    virtual void log(log_level level, const std::string& component, const std::string& message,
                     const log_fields& fields) = 0;

    void debug(const std::string& component, const std::string& message,
               const log_fields& fields = {}) {
        log(log_level::debug, component, message, fields);
    }
    void info(const std::string& component, const std::string& message,
              const log_fields& fields = {}) {
        log(log_level::info, component, message, fields);
    }
    void warn(const std::string& component, const std::string& message,
              const log_fields& fields = {}) {
        log(log_level::warn, component, message, fields);
    }
    void error(const std::string& component, const std::string& message,
               const log_fields& fields = {}) {
        log(log_level::error, component, message, fields);
    }
};

class null_logger : public logger {
public:
    void log(log_level, const std::string&, const std::string&, const log_fields&) override {}
};

// Size-based rotation for file loggers: `path` moves to `path.1`, older
// backups shift up and anything past `max_backups` is deleted.
struct log_rotation {
    std::uint64_t max_bytes = 100ull * 1024 * 1024; // 0 disables rotation
    int max_backups = 7;
};

// One line per event:
//   2024-05-01 12:00:00.123 INFO [downloader] Starting resume download chunks=4 concurrent=2
class stream_logger : public logger {
public:
    stream_logger(std::ostream& out, log_level min_level);
    stream_logger(std::unique_ptr<std::ostream> owned, log_level min_level);

    // Appends to `path`; returns nullptr when the file cannot be opened.
    static std::unique_ptr<stream_logger> open_file(const std::string& path, log_level min_level,
                                                    log_rotation rotation = {});

    void log(log_level level, const std::string& component, const std::string& message,
             const log_fields& fields) override;

    log_level min_level() const {
        return m_min_level;
    }

private:
    void rotate();

    std::unique_ptr<std::ostream> m_owned;
    std::ostream& m_out;
    log_level m_min_level;
    std::mutex m_mutex;

    // Set only for loggers made by open_file()
    std::ofstream* m_file = nullptr;
    std::string m_path;
    log_rotation m_rotation;
    std::uint64_t m_written = 0;
};

std::string format_log_line(log_level level, const std::string& component,
                            const std::string& message, const log_fields& fields);
