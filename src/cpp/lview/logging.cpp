// local includes
#include "lview/logging.h"
#include "lview/exception.h"
#include "lview/strutils.h"

// 3rd party
#include <fmt/chrono.h>
#include <fmt/format.h>

// std includes
#include <chrono>
#include <ctime>
#include <string>
#include <vector>
#include <utility>
#include <algorithm>

#include <errno.h>
#include <unistd.h>

///////////////////////////////////////////////////////////////////////////////

using namespace std;
using namespace LView;

///////////////////////////////////////////////////////////////////////////////

namespace {

    const int BUF_SIZE = 4096;

    Logger the_logger;

    // set while this thread is inside a handler
    thread_local bool in_dispatch = false;

    struct DispatchGuard {
        DispatchGuard() {
            in_dispatch = true;
        }

        ~DispatchGuard() {
            in_dispatch = false;
        }
    };

    const char* levelColour(LogLevel level) {
        switch (level) {
        case Logger::LOG_CRITICAL:
            return "\033[1;35m";
        case Logger::LOG_ERROR:
            return "\033[1;31m";
        case Logger::LOG_WARNING:
            return "\033[1;33m";
        case Logger::LOG_INFO:
            return "\033[1;32m";
        case Logger::LOG_DEBUG:
            return "\033[0;37m";
        default:
            return "\033[0;90m";
        }
    }

    const char* const RESET_COLOUR = "\033[0m";
}

const char* LView::levelName(LogLevel level) {
    switch (level) {
    case Logger::LOG_CRITICAL:
        return "CRITICAL";
    case Logger::LOG_ERROR:
        return "ERROR";
    case Logger::LOG_WARNING:
        return "WARNING";
    case Logger::LOG_INFO:
        return "INFO";
    case Logger::LOG_DEBUG:
        return "DEBUG";
    case Logger::LOG_VERBOSE:
        return "VERBOSE";
    default:
        return "NONE";
    }
}

string LView::logTimestamp() {
    auto now = std::chrono::system_clock::now();
    auto usecs = std::chrono::duration_cast<std::chrono::microseconds>(
        now.time_since_epoch()).count() % 1000000;

    std::time_t secs = std::chrono::system_clock::to_time_t(now);
    return fmt::format("{:%Y-%m-%d %H:%M:%S}.{:06d}", fmt::localtime(secs), usecs);
}

///////////////////////////////////////////////////////////////////////////////

LogHandlerBase::LogHandlerBase(LogLevel level) :
    level(level) {
}

LogHandlerBase::~LogHandlerBase() {
}

void LogHandlerBase::cleanup() {
}

///////////////////////////////////////////////////////////////////////////////

FileLogHandler::FileLogHandler(LogLevel level, const string& filename) :
    LogHandlerBase(level),
    fp(::fopen(filename.c_str(), "w")) {

    if (this->fp == nullptr) {
        throw SysException(fmtString("failed to open log file '%s'", filename), errno);
    }
}

FileLogHandler::~FileLogHandler() {
    this->cleanup();
}

void FileLogHandler::onReport(const LogRecord& record) {
    if (this->fp == nullptr) {
        return;
    }

    fmt::print(this->fp, "{} {:<8} {}\n", record.timestamp, levelName(record.level),
               record.message);
    ::fflush(this->fp);
}

void FileLogHandler::cleanup() {
    if (this->fp != nullptr) {
        ::fclose(this->fp);
        this->fp = nullptr;
    }
}

///////////////////////////////////////////////////////////////////////////////

ConsoleLogHandler::ConsoleLogHandler(LogLevel level) :
    LogHandlerBase(level),
    coloured(::isatty(STDERR_FILENO) == 1) {
}

void ConsoleLogHandler::onReport(const LogRecord& record) {
    if (this->coloured) {
        fmt::print(stderr, "{}{} {}{}\n", levelColour(record.level), record.timestamp,
                   record.message, RESET_COLOUR);
    } else {
        fmt::print(stderr, "{} {}\n", record.timestamp, record.message);
    }
}

///////////////////////////////////////////////////////////////////////////////

MemoryLogHandler::MemoryLogHandler(LogLevel level, size_t capacity) :
    LogHandlerBase(level),
    capacity(capacity) {
}

void MemoryLogHandler::onReport(const LogRecord& record) {
    std::lock_guard <std::mutex> lk(this->mutex);
    if (this->capacity == 0) {
        return;
    }

    if (this->buffer.size() == this->capacity) {
        this->buffer.pop_front();
    }

    this->buffer.push_back(record);
}

vector <LogRecord> MemoryLogHandler::records() const {
    std::lock_guard <std::mutex> lk(this->mutex);
    return vector <LogRecord>(this->buffer.begin(), this->buffer.end());
}

int MemoryLogHandler::count(LogLevel level) const {
    std::lock_guard <std::mutex> lk(this->mutex);
    auto n = std::count_if(this->buffer.begin(), this->buffer.end(),
                           [level](const LogRecord& r) {
                               return r.level == level;
                           });

    return static_cast<int> (n);
}

void MemoryLogHandler::clear() {
    std::lock_guard <std::mutex> lk(this->mutex);
    this->buffer.clear();
}

///////////////////////////////////////////////////////////////////////////////

Logger::Logger() :
    file_handler(nullptr),
    console_handler(nullptr) {
}

Logger::~Logger() {
    this->cleanup();
}

void Logger::fileLogging(const string& filename, LogLevel level) {
    // construct first, so that a failure leaves the logger untouched
    LogHandlerBase* handler = new FileLogHandler(level, filename);

    if (this->file_handler != nullptr) {
        this->removeHandler(this->file_handler);
        delete this->file_handler;
    }

    this->file_handler = handler;
    this->addHandler(this->file_handler);
}

void Logger::consoleLogging(LogLevel level) {
    if (this->console_handler != nullptr) {
        this->removeHandler(this->console_handler);
        delete this->console_handler;
    }

    this->console_handler = new ConsoleLogHandler(level);
    this->addHandler(this->console_handler);
}

void Logger::addHandler(LogHandlerBase* handler) {
    std::lock_guard <std::mutex> lk(this->mutex);
    this->handlers.push_back(handler);
}

void Logger::removeHandler(LogHandlerBase* handler) {
    std::lock_guard <std::mutex> lk(this->mutex);
    this->handlers.erase(std::remove(this->handlers.begin(), this->handlers.end(), handler),
                         this->handlers.end());
}

void Logger::cleanup() {
    std::lock_guard <std::mutex> lk(this->mutex);

    // external handlers are forgotten, never touched
    this->handlers.clear();

    for (LogHandlerBase** owned : {&this->file_handler, &this->console_handler}) {
        if (*owned != nullptr) {
            (*owned)->cleanup();
            delete *owned;
            *owned = nullptr;
        }
    }
}

void Logger::makeLog(LogLevel level, const char* fmt, va_list args) {
    char buf[BUF_SIZE];

    va_list copied;
    va_copy(copied, args);
    int needed = ::vsnprintf(buf, BUF_SIZE, fmt, copied);
    va_end(copied);

    if (needed < 0) {
        this->dispatch(Logger::LOG_ERROR, "bad log format string");
        return;
    }

    if (needed < BUF_SIZE) {
        this->dispatch(level, buf);
        return;
    }

    // too big for the stack buffer
    vector <char> big(needed + 1);
    ::vsnprintf(big.data(), big.size(), fmt, args);
    this->dispatch(level, big.data());
}

void Logger::makeLog(LogLevel level, const string& msg) {
    this->dispatch(level, msg);
}

void Logger::dispatch(LogLevel level, string msg) {
    if (in_dispatch) {
        return;
    }

    vector <LogHandlerBase*> targets;
    {
        std::lock_guard <std::mutex> lk(this->mutex);
        for (LogHandlerBase* handler : this->handlers) {
            if (handler->accepts(level)) {
                targets.push_back(handler);
            }
        }
    }

    if (targets.empty()) {
        return;
    }

    const LogRecord record{level, logTimestamp(), std::move(msg)};

    DispatchGuard guard;
    for (LogHandlerBase* handler : targets) {
        handler->onReport(record);
    }
}

///////////////////////////////////////////////////////////////////////////////

void LView::loggerSetup(const string& filename, LogLevel console_level) {
    if (!filename.empty()) {
        the_logger.fileLogging(filename);
    }

    the_logger.consoleLogging(console_level);
}

void LView::addLogHandler(LogHandlerBase* handler) {
    the_logger.addHandler(handler);
}

void LView::removeLogHandler(LogHandlerBase* handler) {
    the_logger.removeHandler(handler);
}

ScopedLogHandler::ScopedLogHandler(LogHandlerBase* handler) :
    handler(handler) {
    addLogHandler(this->handler);
}

ScopedLogHandler::~ScopedLogHandler() {
    removeLogHandler(this->handler);
}

///////////////////////////////////////////////////////////////////////////////

#define LOG_HELPER(name, level)                         \
    void LView::name(const char* fmt, ...) {            \
        va_list args;                                   \
        va_start(args, fmt);                            \
        the_logger.makeLog(level, fmt, args);           \
        va_end(args);                                   \
    }                                                   \
                                                        \
    void LView::name(const string& msg) {               \
        the_logger.makeLog(level, msg);                 \
    }

LOG_HELPER(l_critical, Logger::LOG_CRITICAL)
LOG_HELPER(l_error, Logger::LOG_ERROR)
LOG_HELPER(l_warning, Logger::LOG_WARNING)
LOG_HELPER(l_info, Logger::LOG_INFO)
LOG_HELPER(l_debug, Logger::LOG_DEBUG)
LOG_HELPER(l_verbose, Logger::LOG_VERBOSE)
