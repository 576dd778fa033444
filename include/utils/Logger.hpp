#ifndef LOGGER_H
#define LOGGER_H

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>

namespace episweep {

/**
 * @enum LogLevel
 * @brief Severity of a log record, lowest first.
 */
enum class LogLevel {
    DEBUG,    ///< Per-beta progress, solver details.
    INFO,     ///< Pipeline stages and their timings.
    WARNING,  ///< Recoverable oddities, e.g. unknown configuration keys.
    ERROR,    ///< A stage failed; the error is rethrown after logging.
    FATAL     ///< Unexpected failure caught in main.
};

/**
 * @brief Maps "debug", "info", "warning", "error" or "fatal" (any case) to a LogLevel.
 * @param text [in] Level name.
 * @param level [out] Parsed level; untouched when the name is unknown.
 * @return bool True if the name was recognised.
 */
inline bool parseLogLevel(const std::string& text, LogLevel& level) {
    std::string lower = text;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "debug") level = LogLevel::DEBUG;
    else if (lower == "info") level = LogLevel::INFO;
    else if (lower == "warning") level = LogLevel::WARNING;
    else if (lower == "error") level = LogLevel::ERROR;
    else if (lower == "fatal") level = LogLevel::FATAL;
    else return false;
    return true;
}

/**
 * @class Logger
 * @brief Process-wide logger shared by the sweep pipelines.
 *
 * Records look like `2024-05-01 12:00:00.123 [INFO]    [SweepPipeline::run(SEIR)] message`.
 * DEBUG and INFO go to stdout, WARNING and above to stderr. A copy of every record can
 * additionally be appended to a file.
 */
class Logger {
public:
    static Logger& getInstance() {
        static Logger instance;
        return instance;
    }

    void setLogLevel(LogLevel level) {
        std::lock_guard<std::mutex> lock(mutex_);
        logLevel_ = level;
    }

    LogLevel getLogLevel() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return logLevel_;
    }

    /**
     * @brief Starts or stops appending records to a file.
     * @param enable   [in] True to start, false to stop.
     * @param filename [in] Log file, opened in append mode.
     * @return bool False if the file could not be opened.
     */
    bool enableFileLogging(bool enable, const std::string& filename = "episweep.log") {
        std::lock_guard<std::mutex> lock(mutex_);
        if (logFile_.is_open()) {
            write(LogLevel::INFO, "Logger", "Closing log file.");
            logFile_.close();
        }
        if (!enable) {
            return true;
        }
        logFile_.open(filename, std::ios::app);
        if (!logFile_.is_open()) {
            write(LogLevel::ERROR, "Logger", "Failed to open log file: " + filename);
            return false;
        }
        write(LogLevel::INFO, "Logger", "Appending log records to: " + filename);
        return true;
    }

    /**
     * @brief Emits a record if @p level is at or above the current threshold.
     * @param source  [in] Function or class producing the record.
     * @param message [in] Record text.
     */
    void log(LogLevel level, const std::string& source, const std::string& message) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (level < logLevel_) return;
        write(level, source, message);
    }

    void debug(const std::string& source, const std::string& message)   { log(LogLevel::DEBUG, source, message); }
    void info(const std::string& source, const std::string& message)    { log(LogLevel::INFO, source, message); }
    void warning(const std::string& source, const std::string& message) { log(LogLevel::WARNING, source, message); }
    void error(const std::string& source, const std::string& message)   { log(LogLevel::ERROR, source, message); }
    void fatal(const std::string& source, const std::string& message)   { log(LogLevel::FATAL, source, message); }

    static const char* levelName(LogLevel level) {
        switch (level) {
            case LogLevel::DEBUG:   return "DEBUG";
            case LogLevel::INFO:    return "INFO";
            case LogLevel::WARNING: return "WARNING";
            case LogLevel::ERROR:   return "ERROR";
            case LogLevel::FATAL:   return "FATAL";
        }
        return "UNKNOWN";
    }

private:
    Logger() : logLevel_(LogLevel::INFO) {}
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    // Caller holds mutex_.
    void write(LogLevel level, const std::string& source, const std::string& message) {
        const std::string record = format(level, source, message);
        std::ostream& console = level >= LogLevel::WARNING ? std::cerr : std::cout;
        console << record << '\n';
        console.flush();
        if (logFile_.is_open()) {
            logFile_ << record << '\n';
        }
    }

    static std::string format(LogLevel level, const std::string& source, const std::string& message) {
        using namespace std::chrono;
        const auto now = system_clock::now();
        const std::time_t seconds = system_clock::to_time_t(now);
        const auto millis = duration_cast<milliseconds>(now.time_since_epoch()).count() % 1000;

        std::tm local{};
        localtime_r(&seconds, &local);

        std::ostringstream oss;
        oss << std::put_time(&local, "%Y-%m-%d %H:%M:%S") << '.'
            << std::setw(3) << std::setfill('0') << millis << ' '
            << std::left << std::setw(10) << std::setfill(' ')
            << (std::string("[") + levelName(level) + "]")
            << '[' << source << "] " << message;
        return oss.str();
    }

    LogLevel logLevel_;
    std::ofstream logFile_;
    mutable std::mutex mutex_;
};

} // namespace episweep

#endif // LOGGER_H
