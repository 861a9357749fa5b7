#include "logger.h"
#include "errors.h"
#include <cctype>
#include <chrono>
#include <iomanip>
#include <mutex>
#include <sstream>
#include <iostream>
#include <ctime>

LogLevel parse_log_level(const std::string& name) {
    std::string up;
    for (char c : name) up.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
    if (up == "TRACE") return LogLevel::TRACE;
    if (up == "DEBUG") return LogLevel::DEBUG;
    if (up == "INFO")  return LogLevel::INFO;
    if (up == "WARN" || up == "WARNING") return LogLevel::WARN;
    if (up == "ERROR") return LogLevel::ERROR;
    throw InvalidParameter("Logger: unknown log level '" + name + "'");
}

const char* log_level_name(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::TRACE: return "TRACE";
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO";
        case LogLevel::WARN:  return "WARN";
        case LogLevel::ERROR: return "ERROR";
    }
    return "?";
}

Logger::Logger(std::string name, std::ostream& out)
  : name_(std::move(name)),
    level_(LogLevel::INFO),
    out_(&out),
    mutex_(std::make_unique<std::mutex>())
{}

Logger::Logger(Logger&& other) noexcept
  : name_(std::move(other.name_)),
    level_(other.level_.load()),
    out_(other.out_),
    mutex_(std::move(other.mutex_))
{}

Logger& Logger::operator=(Logger&& other) noexcept {
    if (this == &other) return *this;
    if (!mutex_ || !other.mutex_) {
        name_ = std::move(other.name_);
        level_ = other.level_.load();
        out_ = other.out_;
        mutex_ = std::move(other.mutex_);
        return *this;
    }
    std::lock_guard<std::mutex> l1(*mutex_);
    std::lock_guard<std::mutex> l2(*other.mutex_);
    name_ = std::move(other.name_);
    level_ = other.level_.load();
    out_ = other.out_;
    mutex_.swap(other.mutex_);
    return *this;
}

void Logger::set_level(LogLevel level) noexcept {
    level_ = level;
}

LogLevel Logger::level() const noexcept {
    return level_;
}

bool Logger::enabled(LogLevel lvl) const noexcept {
    return static_cast<int>(lvl) >= static_cast<int>(level_.load());
}

void Logger::emit(LogLevel lvl, const std::string& payload) {
    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

    std::tm tm{};
    localtime_r(&t, &tm);
    std::ostringstream header;
    header << std::put_time(&tm, "%Y-%m-%d %H:%M:%S")
           << '.' << std::setw(3) << std::setfill('0') << ms.count()
           << " [" << log_level_name(lvl) << "] " << name_ << ": ";

    std::lock_guard<std::mutex> lk(*mutex_);
    (*out_) << header.str() << payload << '\n';
    out_->flush();
}

void Logger::log(LogLevel lvl, const std::string& msg) {
    if (!enabled(lvl)) return;
    emit(lvl, msg);
}

void Logger::trace(const std::string& msg) { log(LogLevel::TRACE, msg); }
void Logger::debug(const std::string& msg) { log(LogLevel::DEBUG, msg); }
void Logger::info(const std::string& msg)  { log(LogLevel::INFO,  msg); }
void Logger::warn(const std::string& msg)  { log(LogLevel::WARN,  msg); }
void Logger::error(const std::string& msg) { log(LogLevel::ERROR, msg); }
