#pragma once

#include <unistd.h>
#include <atomic>
#include <format>
#include <mutex>
#include <string>
#include <string_view>

namespace compact {

enum class Level { Debug = 0, Info = 1, Warn = 2, Error = 3, Off = 4 };

// Unbuffered writer shared by the log and the progress line
class Writer {
public:
    static void print(std::string_view s) {
        std::lock_guard<std::mutex> lock(get_mutex());
        write_all(STDOUT_FILENO, s);
    }

    static void error(std::string_view s) {
        std::lock_guard<std::mutex> lock(get_mutex());
        write_all(STDERR_FILENO, s);
    }

    // Progress output rewrites the current line; the next regular line
    // must start on a fresh one.
    static void progress(std::string_view s) {
        std::lock_guard<std::mutex> lock(get_mutex());
        line_open() = false;
        write_all(STDOUT_FILENO, s);
        line_open() = true;
    }

    static void nl() {
        print("\n");
    }

private:
    static void write_all(int fd, std::string_view s) {
        if (line_open()) {
            line_open() = false;
            if (::write(STDOUT_FILENO, "\n", 1) < 0) return;
        }
        while (!s.empty()) {
            ssize_t n = ::write(fd, s.data(), s.size());
            if (n <= 0) return;
            s.remove_prefix(static_cast<size_t>(n));
        }
    }

    static std::mutex& get_mutex() {
        static std::mutex m;
        return m;
    }

    static bool& line_open() {
        static bool open = false;
        return open;
    }
};

class Log {
public:
    static void set_level(Level level) { threshold().store(level); }
    static bool enabled(Level level) { return level >= threshold().load(); }

    template<typename... Args>
    static void debug(std::format_string<Args...> fmt, Args&&... args) {
        emit(Level::Debug, std::format(fmt, std::forward<Args>(args)...));
    }

    template<typename... Args>
    static void info(std::format_string<Args...> fmt, Args&&... args) {
        emit(Level::Info, std::format(fmt, std::forward<Args>(args)...));
    }

    template<typename... Args>
    static void warn(std::format_string<Args...> fmt, Args&&... args) {
        emit(Level::Warn, std::format(fmt, std::forward<Args>(args)...));
    }

    template<typename... Args>
    static void error(std::format_string<Args...> fmt, Args&&... args) {
        emit(Level::Error, std::format(fmt, std::forward<Args>(args)...));
    }

private:
    static void emit(Level level, std::string message) {
        if (!enabled(level)) return;
        switch (level) {
            case Level::Debug: message.insert(0, "[debug] "); break;
            case Level::Warn:  message.insert(0, "Warning: "); break;
            case Level::Error: message.insert(0, "Error: "); break;
            default: break;
        }
        message += '\n';
        if (level >= Level::Warn) Writer::error(message);
        else Writer::print(message);
    }

    static std::atomic<Level>& threshold() {
        static std::atomic<Level> t{Level::Info};
        return t;
    }
};

} // namespace compact
