#pragma once

#include <atomic>
#include <cstring>
#include <fstream>
#include <mutex>
#include <string>
#include <fmt/format.h>

#ifdef ERROR
#undef ERROR
#endif

namespace sheetlens {

/**
 * @brief 进程级日志器
 *
 * 日志同时写入控制台(stderr)与滚动文件。控制台走 stderr，
 * 保证命令行工具把 JSON 输出到 stdout 时不被日志污染。
 */
class Logger {
public:
    enum class Level {
        TRACE = 0,
        DEBUG = 1,
        INFO = 2,
        WARN = 3,
        ERROR = 4,
        CRITICAL = 5,
        OFF = 6
    };

    enum class WriteMode {
        TRUNCATE = 0,  // 覆盖
        APPEND = 1     // 追加
    };

    static Logger& getInstance();

    /**
     * @brief 初始化日志器，重复调用无效
     * @param log_file_path 日志文件路径，空字符串表示只输出到控制台
     * @param level 最低输出级别
     * @param enable_console 是否输出到控制台
     * @param max_file_size 单个文件上限，超过后滚动
     * @param max_files 保留的滚动文件数量
     * @param write_mode 覆盖或追加
     */
    void initialize(const std::string& log_file_path = "logs/sheetlens.log",
                    Level level = Level::INFO,
                    bool enable_console = true,
                    size_t max_file_size = 10 * 1024 * 1024,
                    size_t max_files = 5,
                    WriteMode write_mode = WriteMode::TRUNCATE);

    void setLevel(Level level);
    Level getLevel() const;
    void setConsoleEnabled(bool enabled);

    /**
     * @brief 解析级别名称 (trace/debug/info/warn/error/critical/off)
     * @return 解析失败返回 false，level 不变
     */
    static bool parseLevel(const std::string& name, Level& level);

    void log(Level level, const std::string& message);

    template<typename... Args>
    void logf(Level level, const std::string& fmt_str, Args&&... args) {
        if (!shouldLog(level)) return;
        std::string message;
        try {
            message = fmt::vformat(fmt_str, fmt::make_format_args(args...));
        } catch (const fmt::format_error&) {
            // 格式串与参数不匹配时原样输出
            message = fmt_str;
        }
        log(level, message);
    }

    // 带源码位置的接口，供宏使用
    template<typename... Args>
    void logCtx(Level level, const char* file, int line, const char* func,
                const std::string& fmt_str, Args&&... args) {
        if (!shouldLog(level)) return;
        const std::string fmt_with_ctx =
            fmt::format("[{}:{}:{}] {}", baseFilename(file), line, func ? func : "", fmt_str);
        logf(level, fmt_with_ctx, std::forward<Args>(args)...);
    }

    bool shouldLog(Level level) const;
    void flush();
    void shutdown();

private:
    Logger() = default;
    ~Logger();
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void writeConsole(Level level, const std::string& line);
    void writeFile(const std::string& line);
    void rotateIfNeeded();
    std::string rotatedName(size_t index) const;
    std::string formatLine(Level level, const std::string& message) const;
    static const char* levelName(Level level);

    static const char* baseFilename(const char* path) {
        if (!path) return "";
        const char* slash1 = std::strrchr(path, '/');
        const char* slash2 = std::strrchr(path, '\\');
        const char* p = (slash1 && slash2) ? (slash1 > slash2 ? slash1 : slash2)
                                           : (slash1 ? slash1 : slash2);
        return p ? (p + 1) : path;
    }

    mutable std::mutex mutex_;
    std::atomic<Level> current_level_{Level::INFO};
    std::atomic<bool> initialized_{false};
    std::atomic<bool> enable_console_{true};
    std::atomic<bool> shutting_down_{false};

    std::string log_file_path_;
    std::ofstream file_stream_;
    size_t current_file_size_ = 0;
    size_t max_file_size_ = 10 * 1024 * 1024;
    size_t max_files_ = 5;
};

#if defined(_MSC_VER) || defined(__GNUC__) || defined(__clang__)
#  define SHEETLENS_FUNC __FUNCTION__
#else
#  define SHEETLENS_FUNC __func__
#endif

#define SHEETLENS_LOG_AT(lvl, fmt, ...) \
    sheetlens::Logger::getInstance().logCtx(lvl, __FILE__, __LINE__, SHEETLENS_FUNC, fmt, ##__VA_ARGS__)

#define SHEETLENS_LOG_TRACE(fmt, ...)    SHEETLENS_LOG_AT(sheetlens::Logger::Level::TRACE, fmt, ##__VA_ARGS__)
#define SHEETLENS_LOG_DEBUG(fmt, ...)    SHEETLENS_LOG_AT(sheetlens::Logger::Level::DEBUG, fmt, ##__VA_ARGS__)
#define SHEETLENS_LOG_INFO(fmt, ...)     SHEETLENS_LOG_AT(sheetlens::Logger::Level::INFO, fmt, ##__VA_ARGS__)
#define SHEETLENS_LOG_WARN(fmt, ...)     SHEETLENS_LOG_AT(sheetlens::Logger::Level::WARN, fmt, ##__VA_ARGS__)
#define SHEETLENS_LOG_ERROR(fmt, ...)    SHEETLENS_LOG_AT(sheetlens::Logger::Level::ERROR, fmt, ##__VA_ARGS__)
#define SHEETLENS_LOG_CRITICAL(fmt, ...) SHEETLENS_LOG_AT(sheetlens::Logger::Level::CRITICAL, fmt, ##__VA_ARGS__)

} // namespace sheetlens
