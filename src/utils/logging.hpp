#pragma once

#include <filesystem>
#include <fstream>
#include <memory>
#include <mutex>
#include <ostream>
#include <string>
#include <vector>

namespace evalbox::utils {

enum class LogLevel {
    kDebug,
    kInfo,
    kWarn,
    kError
};

inline const char* ToString(LogLevel level) {
    switch (level) {
        case LogLevel::kDebug: return "DEBUG";
        case LogLevel::kInfo: return "INFO";
        case LogLevel::kWarn: return "WARN";
        case LogLevel::kError: return "ERROR";
    }
    return "UNKNOWN";
}

LogLevel ParseLogLevel(const std::string& value, LogLevel fallback = LogLevel::kInfo);

struct LogConfig {
    LogLevel min_level = LogLevel::kInfo;
};

// Formats "YYYY-MM-DD HH:MM:SS - LEVEL - message" and writes the line to every sink.
// One instance is created per entry point and handed down explicitly.
class Logger {
public:
    explicit Logger(LogConfig config = {});

    // Owns the file; mode is truncate unless append is set.
    bool AddFileSink(const std::filesystem::path& path, bool append = false);
    // The stream must outlive the logger.
    void AddStreamSink(std::ostream& stream);

    void SetLevel(LogLevel level);
    LogLevel Level() const;

    void Log(LogLevel level, const std::string& message);
    void Debug(const std::string& message) { Log(LogLevel::kDebug, message); }
    void Info(const std::string& message) { Log(LogLevel::kInfo, message); }
    void Warn(const std::string& message) { Log(LogLevel::kWarn, message); }
    void Error(const std::string& message) { Log(LogLevel::kError, message); }

private:
    static std::string Timestamp();

    LogConfig config_;
    mutable std::mutex mutex_;
    std::vector<std::unique_ptr<std::ofstream>> files_;
    std::vector<std::ostream*> streams_;
};

// Logger that only writes to std::cerr, for components constructed without one.
std::shared_ptr<Logger> MakeStderrLogger(LogLevel level = LogLevel::kInfo);

}  // namespace evalbox::utils
