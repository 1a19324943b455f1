#pragma once

// std includes
#include <deque>
#include <mutex>
#include <string>
#include <vector>

#include <stdio.h>
#include <stdarg.h>

namespace LView {

    using LogLevel = int;

    // one formatted log line, as handed to every handler
    struct LogRecord {
        LogLevel level;
        std::string timestamp;
        std::string message;
    };

    ///////////////////////////////////////////////////////////////////////////
    // handlers see records at or below their level

    class LogHandlerBase {
    public:
        LogHandlerBase(LogLevel level);
        virtual ~LogHandlerBase();

    public:
        bool accepts(LogLevel level) const {
            return level <= this->level;
        }

        virtual void onReport(const LogRecord& record) = 0;
        virtual void cleanup();

    public:
        LogLevel level;
    };

    ///////////////////////////////////////////////////////////////////////////

    class FileLogHandler : public LogHandlerBase {
    public:
        // throws SysException if filename cannot be opened
        FileLogHandler(LogLevel level, const std::string& filename);
        ~FileLogHandler() override;

    public:
        void onReport(const LogRecord& record) override;
        void cleanup() override;

    private:
        FILE* fp;
    };

    class ConsoleLogHandler : public LogHandlerBase {
    public:
        ConsoleLogHandler(LogLevel level);

    public:
        void onReport(const LogRecord& record) override;

    private:
        bool coloured;
    };

    // Keeps the most recent records in memory.  range_test uses it to check what the views
    // reported (rejected adds, fail-fast detections).
    class MemoryLogHandler : public LogHandlerBase {
    public:
        MemoryLogHandler(LogLevel level, size_t capacity=1024);

    public:
        void onReport(const LogRecord& record) override;

        std::vector <LogRecord> records() const;
        int count(LogLevel level) const;
        void clear();

    private:
        size_t capacity;
        std::deque <LogRecord> buffer;
        mutable std::mutex mutex;
    };

    ///////////////////////////////////////////////////////////////////////////
    // the logger class itself

    class Logger {
    public:
        // don't log
        static constexpr LogLevel LOG_NONE = 1;

        static constexpr LogLevel LOG_CRITICAL = 2;
        static constexpr LogLevel LOG_ERROR = 3;

        // fail-fast detections
        static constexpr LogLevel LOG_WARNING = 4;

        static constexpr LogLevel LOG_INFO = 5;

        // elements refused by a view
        static constexpr LogLevel LOG_DEBUG = 6;

        // bulk changes to a sequence
        static constexpr LogLevel LOG_VERBOSE = 7;

    public:
        Logger();
        ~Logger();

    public:
        void fileLogging(const std::string& filename, LogLevel level=Logger::LOG_VERBOSE);
        void consoleLogging(LogLevel level=Logger::LOG_VERBOSE);

        // handlers added here are not owned, nor cleaned up, by the logger
        void addHandler(LogHandlerBase* handler);
        void removeHandler(LogHandlerBase* handler);

        // releases the file and console handlers only
        void cleanup();

        void makeLog(LogLevel level, const char* fmt, va_list args);
        void makeLog(LogLevel level, const std::string& msg);

    private:
        // Handlers run without the lock held.  Anything a handler logs from inside onReport()
        // is dropped rather than dispatched recursively.
        void dispatch(LogLevel level, std::string msg);

    private:
        LogHandlerBase* file_handler;
        LogHandlerBase* console_handler;

        std::vector <LogHandlerBase*> handlers;
        std::mutex mutex;
    };

    ///////////////////////////////////////////////////////////////////////////

    const char* levelName(LogLevel level);

    // YYYY-MM-DD HH:MM:SS.uuuuuu, local time
    std::string logTimestamp();

    // an empty filename means console only
    void loggerSetup(const std::string& filename, LogLevel console_level);

    void addLogHandler(LogHandlerBase* handler);
    void removeLogHandler(LogHandlerBase* handler);

    // registers a handler for the lifetime of the scope
    class ScopedLogHandler {
    public:
        explicit ScopedLogHandler(LogHandlerBase* handler);
        ~ScopedLogHandler();

        ScopedLogHandler(const ScopedLogHandler&) = delete;
        ScopedLogHandler& operator= (const ScopedLogHandler&) = delete;

    private:
        LogHandlerBase* handler;
    };

    ///////////////////////////////////////////////////////////////////////////

    // logging helpers
    void l_critical(const char* fmt, ...) __attribute__ ((format (printf, 1, 2)));
    void l_critical(const std::string& msg);

    void l_error(const char* fmt, ...) __attribute__ ((format (printf, 1, 2)));
    void l_error(const std::string& msg);

    void l_warning(const char* fmt, ...) __attribute__ ((format (printf, 1, 2)));
    void l_warning(const std::string& msg);

    void l_info(const char* fmt, ...) __attribute__ ((format (printf, 1, 2)));
    void l_info(const std::string& msg);

    void l_debug(const char* fmt, ...) __attribute__ ((format (printf, 1, 2)));
    void l_debug(const std::string& msg);

    void l_verbose(const char* fmt, ...) __attribute__ ((format (printf, 1, 2)));
    void l_verbose(const std::string& msg);
}
