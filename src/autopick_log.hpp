// =============================================================================
// AutoPick - Structured Logging
// =============================================================================
// Thread-safe, level-filtered logging sinks. Components receive a Sink&
// instead of writing to process-wide state.
// Usage: APLOG_INFO(sink, "tag", "message %s", arg);
// =============================================================================
#pragma once
#include <atomic>
#include <chrono>
#include <cstdarg>
#include <cstdio>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include <ctime>

namespace autopick::log {

enum class Level { Trace = 0, Debug, Info, Warn, Error, Fatal };

inline const char* levelStr(Level l) {
    switch (l) {
        case Level::Trace: return "TRACE";
        case Level::Debug: return "DEBUG";
        case Level::Info:  return "INFO ";
        case Level::Warn:  return "WARN ";
        case Level::Error: return "ERROR";
        case Level::Fatal: return "FATAL";
    }
    return "?????";
}

// "trace" / "debug" / "info" / "warn" / "error" / "fatal"; unknown -> Info
inline Level levelFromString(const std::string& s) {
    if (s == "trace") return Level::Trace;
    if (s == "debug") return Level::Debug;
    if (s == "warn" || s == "warning") return Level::Warn;
    if (s == "error") return Level::Error;
    if (s == "fatal") return Level::Fatal;
    return Level::Info;
}

struct Record {
    Level level = Level::Info;
    std::string tag;
    std::string message;
    std::string line;   // fully formatted line
};

// -----------------------------------------------------------------------------
// Sink - base for every log destination
// -----------------------------------------------------------------------------
class Sink {
public:
    virtual ~Sink() = default;

    void setLevel(Level l) { min_level_ = l; }
    Level level() const { return min_level_.load(std::memory_order_relaxed); }
    bool enabled(Level l) const { return l >= level(); }

    void write(Level level, const char* tag, const char* fmt, ...) {
        if (!enabled(level)) return;
        char msg[2048];
        va_list args;
        va_start(args, fmt);
        vsnprintf(msg, sizeof(msg), fmt, args);
        va_end(args);

        Record rec;
        rec.level = level;
        rec.tag = tag ? tag : "";
        rec.message = msg;
        rec.line = formatLine(level, rec.tag.c_str(), msg);
        emit(rec);
    }

protected:
    virtual void emit(const Record& rec) = 0;

    static std::string formatLine(Level level, const char* tag, const char* msg) {
        auto now = std::chrono::system_clock::now();
        auto time_t_now = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;
        struct tm tm_buf {};
#ifdef _WIN32
        localtime_s(&tm_buf, &time_t_now);
#else
        localtime_r(&time_t_now, &tm_buf);
#endif
        char time_str[32];
        snprintf(time_str, sizeof(time_str), "%02d:%02d:%02d.%03d",
                 tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec, (int)ms.count());
        auto tid = std::hash<std::thread::id>{}(std::this_thread::get_id()) % 100000;

        char line[2304];
        snprintf(line, sizeof(line), "%s [%s] [%s] (T%05zu) %s",
                 time_str, levelStr(level), tag, (size_t)tid, msg);
        return line;
    }

private:
    std::atomic<Level> min_level_{Level::Info};
};

// -----------------------------------------------------------------------------
// ConsoleSink - stderr + optional log file
// -----------------------------------------------------------------------------
class ConsoleSink : public Sink {
public:
    ConsoleSink() = default;
    ~ConsoleSink() override { closeLogFile(); }

    ConsoleSink(const ConsoleSink&) = delete;
    ConsoleSink& operator=(const ConsoleSink&) = delete;

    bool openLogFile(const std::string& path) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (file_) fclose(file_);
        file_ = fopen(path.c_str(), "w");  // overwrite: one file per run
        return file_ != nullptr;
    }

    void closeLogFile() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (file_) { fclose(file_); file_ = nullptr; }
    }

    void setEchoStderr(bool echo) { echo_stderr_ = echo; }

protected:
    void emit(const Record& rec) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (echo_stderr_) fprintf(stderr, "%s\n", rec.line.c_str());
        if (file_) {
            fprintf(file_, "%s\n", rec.line.c_str());
            fflush(file_);
        }
    }

private:
    std::mutex mutex_;
    FILE* file_ = nullptr;
    std::atomic<bool> echo_stderr_{true};
};

// -----------------------------------------------------------------------------
// MemorySink - bounded ring of recent records (log viewer / tests)
// -----------------------------------------------------------------------------
class MemorySink : public Sink {
public:
    explicit MemorySink(size_t capacity = 1000) : capacity_(capacity ? capacity : 1) {
        setLevel(Level::Trace);
    }

    std::vector<Record> records() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return std::vector<Record>(records_.begin(), records_.end());
    }

    size_t count(Level level) const {
        std::lock_guard<std::mutex> lock(mutex_);
        size_t n = 0;
        for (const auto& r : records_) if (r.level == level) ++n;
        return n;
    }

    bool contains(const std::string& needle) const {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& r : records_) {
            if (r.message.find(needle) != std::string::npos) return true;
        }
        return false;
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        records_.clear();
    }

protected:
    void emit(const Record& rec) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (records_.size() >= capacity_) records_.pop_front();
        records_.push_back(rec);
    }

private:
    mutable std::mutex mutex_;
    std::deque<Record> records_;
    size_t capacity_;
};

class NullSink : public Sink {
protected:
    void emit(const Record&) override {}
};

} // namespace autopick::log

#define APLOG_TRACE(sink, tag, fmt, ...) (sink).write(autopick::log::Level::Trace, tag, fmt, ##__VA_ARGS__)
#define APLOG_DEBUG(sink, tag, fmt, ...) (sink).write(autopick::log::Level::Debug, tag, fmt, ##__VA_ARGS__)
#define APLOG_INFO(sink, tag, fmt, ...)  (sink).write(autopick::log::Level::Info,  tag, fmt, ##__VA_ARGS__)
#define APLOG_WARN(sink, tag, fmt, ...)  (sink).write(autopick::log::Level::Warn,  tag, fmt, ##__VA_ARGS__)
#define APLOG_ERROR(sink, tag, fmt, ...) (sink).write(autopick::log::Level::Error, tag, fmt, ##__VA_ARGS__)
#define APLOG_FATAL(sink, tag, fmt, ...) (sink).write(autopick::log::Level::Fatal, tag, fmt, ##__VA_ARGS__)
