#include "common/logger.hpp"
#include <iostream>
#include <chrono>
#include <iomanip>
#include <sstream>
#include <mutex>
#include <filesystem>
#include <algorithm>
#include <cctype>
#include <cstdio>
#include <cstring>  // for strerror
#include <cerrno>   // for errno
#include <ctime>

std::mutex Logger::mutex_;
LogLevel Logger::currentLevel_ = LogLevel::INFO;
bool Logger::initialized_ = false;
bool Logger::consoleOutput_ = true;
std::string Logger::logPath_ = "/tmp/liveshift.log";

LogLevel parseLogLevel(const std::string& level) {
    std::string lower = level;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "debug") return LogLevel::DEBUG;
    if (lower == "info") return LogLevel::INFO;
    if (lower == "warning" || lower == "warn") return LogLevel::WARNING;
    if (lower == "error") return LogLevel::ERROR;
    if (lower == "fatal") return LogLevel::FATAL;
    return LogLevel::INFO;
}

bool Logger::initialize(const std::string& logPath, LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (initialized_) {
        return false;
    }

    try {
        std::filesystem::path logDir = std::filesystem::path(logPath).parent_path();
        if (!logDir.empty() && !std::filesystem::exists(logDir)) {
            std::filesystem::create_directories(logDir);
        }

        // Make sure the file is writable before accepting it
        FILE* testFile = fopen(logPath.c_str(), "a");
        if (!testFile) {
            std::cerr << "Failed to open log file " << logPath << ": " << strerror(errno) << std::endl;
            return false;
        }
        fclose(testFile);

        logPath_ = logPath;
        currentLevel_ = level;
        initialized_ = true;
        return true;
    } catch (const std::exception& e) {
        std::cerr << "Logger initialization failed: " << e.what() << std::endl;
        return false;
    }
}

void Logger::shutdown() {
    std::lock_guard<std::mutex> lock(mutex_);
    initialized_ = false;
}

void Logger::setLogLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    currentLevel_ = level;
}

void Logger::setConsoleOutput(bool enabled) {
    std::lock_guard<std::mutex> lock(mutex_);
    consoleOutput_ = enabled;
}

void Logger::log(LogLevel level, const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!initialized_ || level < currentLevel_) {
        return;
    }

    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    std::tm localTime{};
    localtime_r(&time, &localTime);

    std::stringstream ss;
    ss << std::put_time(&localTime, "%Y-%m-%d %H:%M:%S");

    std::string logMessage = ss.str() + " [" + levelToString(level) + "] " + message + "\n";

    if (consoleOutput_) {
        if (level >= LogLevel::ERROR) {
            std::cerr << logMessage;
            std::cerr.flush();
        } else {
            std::cout << logMessage;
            std::cout.flush();
        }
    }

    FILE* logFile = fopen(logPath_.c_str(), "a");
    if (logFile) {
        fprintf(logFile, "%s", logMessage.c_str());
        fflush(logFile);
        fclose(logFile);
    } else {
        std::cerr << "Failed to open log file: " << strerror(errno) << std::endl;
    }
}

void Logger::debug(const std::string& message) {
    log(LogLevel::DEBUG, message);
}

void Logger::info(const std::string& message) {
    log(LogLevel::INFO, message);
}

void Logger::warning(const std::string& message) {
    log(LogLevel::WARNING, message);
}

void Logger::error(const std::string& message) {
    log(LogLevel::ERROR, message);
}

void Logger::fatal(const std::string& message) {
    log(LogLevel::FATAL, message);
}

std::string Logger::levelToString(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG:   return "DEBUG";
        case LogLevel::INFO:    return "INFO";
        case LogLevel::WARNING: return "WARNING";
        case LogLevel::ERROR:   return "ERROR";
        case LogLevel::FATAL:   return "FATAL";
        default:                return "UNKNOWN";
    }
}
