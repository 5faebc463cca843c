#include "utils/logging.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace evalbox::utils {

LogLevel ParseLogLevel(const std::string& value, LogLevel fallback) {
    std::string upper = value;
    std::transform(upper.begin(), upper.end(), upper.begin(), [](unsigned char c) {
        return static_cast<char>(std::toupper(c));
    });
    if (upper == "DEBUG") {
        return LogLevel::kDebug;
    }
    if (upper == "INFO") {
        return LogLevel::kInfo;
    }
    if (upper == "WARN" || upper == "WARNING") {
        return LogLevel::kWarn;
    }
    if (upper == "ERROR") {
        return LogLevel::kError;
    }
    return fallback;
}

Logger::Logger(LogConfig config)
    : config_(config) {}

bool Logger::AddFileSink(const std::filesystem::path& path, bool append) {
    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
    }
    auto file = std::make_unique<std::ofstream>(
        path, append ? std::ios::app : std::ios::trunc);
    if (!file->is_open()) {
        return false;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    files_.push_back(std::move(file));
    return true;
}

void Logger::AddStreamSink(std::ostream& stream) {
    std::lock_guard<std::mutex> lock(mutex_);
    streams_.push_back(&stream);
}

void Logger::SetLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_.min_level = level;
}

LogLevel Logger::Level() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return config_.min_level;
}

void Logger::Log(LogLevel level, const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (static_cast<int>(level) < static_cast<int>(config_.min_level)) {
        return;
    }
    const auto line = Timestamp() + " - " + ToString(level) + " - " + message;
    for (auto& file : files_) {
        *file << line << '\n';
        file->flush();
    }
    for (auto* stream : streams_) {
        *stream << line << std::endl;
    }
}

std::string Logger::Timestamp() {
    const auto now = std::chrono::system_clock::now();
    const auto time = std::chrono::system_clock::to_time_t(now);
    std::tm local_time{};
#if defined(_WIN32)
    localtime_s(&local_time, &time);
#else
    localtime_r(&time, &local_time);
#endif
    std::ostringstream oss;
    oss << std::put_time(&local_time, "%Y-%m-%d %H:%M:%S");
    return oss.str();
}

std::shared_ptr<Logger> MakeStderrLogger(LogLevel level) {
    LogConfig config{};
    config.min_level = level;
    auto logger = std::make_shared<Logger>(config);
    logger->AddStreamSink(std::cerr);
    return logger;
}

}  // namespace evalbox::utils
