#include "sheetlens/utils/Logger.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <sstream>
#include <thread>
#include <fmt/chrono.h>

namespace sheetlens {

Logger& Logger::getInstance() {
    static Logger instance;
    return instance;
}

void Logger::initialize(const std::string& log_file_path,
                        Level level,
                        bool enable_console,
                        size_t max_file_size,
                        size_t max_files,
                        WriteMode write_mode) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (initialized_.load() || shutting_down_.load()) {
        return;
    }

    current_level_.store(level);
    enable_console_.store(enable_console);
    log_file_path_ = log_file_path;
    max_file_size_ = max_file_size;
    max_files_ = std::max<size_t>(max_files, 1);

    if (!log_file_path_.empty()) {
        std::error_code ec;
        std::filesystem::path log_dir = std::filesystem::path(log_file_path_).parent_path();
        if (!log_dir.empty()) {
            std::filesystem::create_directories(log_dir, ec);
        }
        if (ec) {
            std::cerr << "Logger: cannot create log directory " << log_dir.string()
                      << ": " << ec.message() << std::endl;
        } else {
            auto mode = (write_mode == WriteMode::APPEND) ? (std::ios::out | std::ios::app)
                                                          : (std::ios::out | std::ios::trunc);
            file_stream_.open(log_file_path_, mode);
            current_file_size_ = 0;
            if (file_stream_.is_open() && write_mode == WriteMode::APPEND) {
                file_stream_.seekp(0, std::ios::end);
                current_file_size_ = static_cast<size_t>(file_stream_.tellp());
            }
        }
    }

    initialized_.store(true);

    if (static_cast<int>(Level::DEBUG) >= static_cast<int>(level)) {
        std::string line = formatLine(Level::DEBUG,
            fmt::format("Logger initialized. file: {}, mode: {}",
                        log_file_path_.empty() ? "<none>" : log_file_path_,
                        write_mode == WriteMode::APPEND ? "APPEND" : "TRUNCATE"));
        if (enable_console_.load()) {
            writeConsole(Level::DEBUG, line);
        }
        writeFile(line);
    }
}

void Logger::setLevel(Level level) {
    current_level_.store(level);
}

Logger::Level Logger::getLevel() const {
    return current_level_.load();
}

void Logger::setConsoleEnabled(bool enabled) {
    enable_console_.store(enabled);
}

bool Logger::parseLevel(const std::string& name, Level& level) {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "trace") { level = Level::TRACE; return true; }
    if (lower == "debug") { level = Level::DEBUG; return true; }
    if (lower == "info") { level = Level::INFO; return true; }
    if (lower == "warn" || lower == "warning") { level = Level::WARN; return true; }
    if (lower == "error") { level = Level::ERROR; return true; }
    if (lower == "critical") { level = Level::CRITICAL; return true; }
    if (lower == "off") { level = Level::OFF; return true; }
    return false;
}

bool Logger::shouldLog(Level level) const {
    return level != Level::OFF &&
           static_cast<int>(level) >= static_cast<int>(current_level_.load()) &&
           !shutting_down_.load();
}

void Logger::log(Level level, const std::string& message) {
    if (!shouldLog(level)) return;

    if (!initialized_.load()) {
        initialize();
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (shutting_down_.load()) return;

    std::string line = formatLine(level, message);
    if (enable_console_.load()) {
        writeConsole(level, line);
    }
    writeFile(line);

    // 警告及以上立即落盘
    if (level >= Level::WARN && file_stream_.is_open()) {
        file_stream_.flush();
    }
}

void Logger::writeConsole(Level level, const std::string& line) {
    const char* color = "\033[0m";
    switch (level) {
        case Level::TRACE:    color = "\033[37m"; break;
        case Level::DEBUG:    color = "\033[36m"; break;
        case Level::INFO:     color = "\033[32m"; break;
        case Level::WARN:     color = "\033[33m"; break;
        case Level::ERROR:    color = "\033[31m"; break;
        case Level::CRITICAL: color = "\033[35m"; break;
        default: break;
    }
    std::clog << color << line << "\033[0m" << '\n';
}

void Logger::writeFile(const std::string& line) {
    if (!file_stream_.is_open()) {
        return;
    }
    rotateIfNeeded();
    file_stream_ << line << '\n';
    current_file_size_ += line.size() + 1;
}

void Logger::rotateIfNeeded() {
    if (current_file_size_ < max_file_size_) {
        return;
    }

    file_stream_.close();

    std::error_code ec;
    for (size_t i = max_files_ - 1; i > 0; --i) {
        const std::string from = rotatedName(i - 1);
        if (std::filesystem::exists(from, ec)) {
            std::filesystem::rename(from, rotatedName(i), ec);
        }
    }

    file_stream_.open(log_file_path_, std::ios::out | std::ios::trunc);
    current_file_size_ = 0;
}

std::string Logger::rotatedName(size_t index) const {
    if (index == 0) {
        return log_file_path_;
    }
    return fmt::format("{}.{}", log_file_path_, index);
}

std::string Logger::formatLine(Level level, const std::string& message) const {
    std::ostringstream tid;
    tid << std::this_thread::get_id();
    auto now = std::chrono::system_clock::now();
    return fmt::format("[{:%Y-%m-%d %H:%M:%S}] [{}] [{}] {}",
                       now, levelName(level), tid.str(), message);
}

const char* Logger::levelName(Level level) {
    switch (level) {
        case Level::TRACE:    return "TRACE";
        case Level::DEBUG:    return "DEBUG";
        case Level::INFO:     return "INFO ";
        case Level::WARN:     return "WARN ";
        case Level::ERROR:    return "ERROR";
        case Level::CRITICAL: return "CRIT ";
        default:              return "UNKN ";
    }
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (file_stream_.is_open()) {
        file_stream_.flush();
    }
    std::clog.flush();
}

void Logger::shutdown() {
    shutting_down_.store(true);

    std::unique_lock<std::mutex> lock(mutex_, std::try_to_lock);
    if (!lock.owns_lock()) {
        return;
    }
    if (file_stream_.is_open()) {
        file_stream_.flush();
        file_stream_.close();
    }
    initialized_.store(false);
}

Logger::~Logger() {
    shutdown();
}

} // namespace sheetlens
