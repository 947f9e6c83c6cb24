#include "util/logger.hpp"

#include <algorithm>
#include <chrono>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>

namespace {
std::string to_lower(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(), ::tolower);
    return result;
}

std::string timestamp_now() {
    using clock = std::chrono::system_clock;
    auto now = clock::now();
    std::time_t now_c = clock::to_time_t(now);
    auto millis =
        std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() %
        1000;

    std::tm local{};
    localtime_r(&now_c, &local);

    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &local);

    std::ostringstream oss;
    oss << buf << '.' << std::setw(3) << std::setfill('0') << millis;
    return oss.str();
}

std::string backup_path(const std::string& path, int n) {
    return path + "." + std::to_string(n);
}

bool needs_quotes(const std::string& value) {
    return value.empty() || value.find_first_of(" \t\"=") != std::string::npos;
}
} // namespace

const char* to_string(log_level level) {
    switch (level) {
    case log_level::debug:
        return "DEBUG";
    case log_level::info:
        return "INFO";
    case log_level::warn:
        return "WARN";
    case log_level::error:
        return "ERROR";
    }
    return "UNKNOWN";
}

bool parse_log_level(const std::string& text, log_level& out) {
    std::string v = to_lower(text);
    if (v == "debug") {
        out = log_level::debug;
    } else if (v == "info") {
        out = log_level::info;
    } else if (v == "warn" || v == "warning") {
        out = log_level::warn;
    } else if (v == "error") {
        out = log_level::error;
    } else {
        return false;
    }
    return true;
}

std::string format_log_line(log_level level, const std::string& component,
                            const std::string& message, const log_fields& fields) {
    std::ostringstream oss;
    oss << timestamp_now() << ' ' << to_string(level) << " [" << component << ']';
    if (!message.empty()) {
        oss << ' ' << message;
    }
    for (const auto& field : fields) {
        oss << ' ' << field.key << '=';
        if (needs_quotes(field.value)) {
            oss << std::quoted(field.value);
        } else {
            oss << field.value;
        }
    }
    return oss.str();
}

stream_logger::stream_logger(std::ostream& out, log_level min_level)
    : m_out(out), m_min_level(min_level) {}

stream_logger::stream_logger(std::unique_ptr<std::ostream> owned, log_level min_level)
    : m_owned(std::move(owned)), m_out(*m_owned), m_min_level(min_level) {}

std::unique_ptr<stream_logger> stream_logger::open_file(const std::string& path,
                                                        log_level min_level,
                                                        log_rotation rotation) {
    auto file = std::make_unique<std::ofstream>(path, std::ios::out | std::ios::app);
    if (!file->is_open()) {
        return nullptr;
    }
    std::ofstream* raw = file.get();
    auto log = std::make_unique<stream_logger>(std::move(file), min_level);
    log->m_file = raw;
    log->m_path = path;
    log->m_rotation = rotation;

    std::error_code ec;
    std::uintmax_t existing = std::filesystem::file_size(path, ec);
    log->m_written = ec ? 0 : existing;
    return log;
}

void stream_logger::log(log_level level, const std::string& component, const std::string& message,
                        const log_fields& fields) {
    if (level < m_min_level) {
        return;
    }
    std::string line = format_log_line(level, component, message, fields);
    std::lock_guard<std::mutex> lock(m_mutex);
    m_out << line << std::endl;

    if (m_file && m_rotation.max_bytes > 0) {
        m_written += line.size() + 1;
        if (m_written >= m_rotation.max_bytes) {
            rotate();
        }
    }
}

void stream_logger::rotate() {
    m_file->close();

    // Missing backups are expected, so rename and remove errors are ignored
    std::error_code ec;
    if (m_rotation.max_backups > 0) {
        std::filesystem::remove(backup_path(m_path, m_rotation.max_backups), ec);
        for (int n = m_rotation.max_backups - 1; n >= 1; --n) {
            std::filesystem::rename(backup_path(m_path, n), backup_path(m_path, n + 1), ec);
        }
        std::filesystem::rename(m_path, backup_path(m_path, 1), ec);
    }

    m_file->clear();
    m_file->open(m_path, std::ios::out | std::ios::trunc);
    m_written = 0;
}
