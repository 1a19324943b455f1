#pragma once

// std includes
#include <string>
#include <exception>

namespace LView {

    class Exception : public std::exception {
    public:
        Exception(const std::string& msg);
        virtual ~Exception();

    public:
        const std::string& getMessage() const {
            return this->msg;
        }

        const std::string& getStacktrace() const {
            return this->stacktrace;
        }

        const char* what() const noexcept override {
            return this->msg.c_str();
        }

    private:
        std::string msg;
        std::string stacktrace;
    };

    ///////////////////////////////////////////////////////////////////////////

    class Assertion : public Exception {
    public:
        Assertion(int line, const char* file, const char* expr, const std::string& msg="");
        virtual ~Assertion();

    public:
        int getLine() const {
            return this->line;
        }

        const std::string& getFile() const {
            return this->file;
        }

    private:
        int line;
        std::string file;
    };

    ///////////////////////////////////////////////////////////////////////////

    class SysException : public Exception {
    public:
        SysException(const std::string& msg, int error_code);
        virtual ~SysException();

    public:
        int getErrorCode() const {
            return this->error_code;
        }

        std::string getErrorString() const;

    private:
        int error_code;
    };

    ///////////////////////////////////////////////////////////////////////////
    // view errors

    // element refused by a view, or an argument out of range
    class InvalidArgument : public Exception {
    public:
        InvalidArgument(const std::string& msg);
        virtual ~InvalidArgument();
    };

    class UnsupportedOperation : public Exception {
    public:
        UnsupportedOperation(const std::string& msg);
        virtual ~UnsupportedOperation();
    };

    // backing sequence was structurally modified while being iterated
    class ConcurrentModification : public Exception {
    public:
        ConcurrentModification(const std::string& msg);
        virtual ~ConcurrentModification();
    };
}

///////////////////////////////////////////////////////////////////////////////

#define ASSERT(expr)                                                    \
    do {                                                                \
        if (!(expr)) {                                                  \
            throw LView::Assertion(__LINE__, __FILE__, #expr);          \
        }                                                               \
    } while (0)

#define ASSERT_MSG(expr, msg)                                           \
    do {                                                                \
        if (!(expr)) {                                                  \
            throw LView::Assertion(__LINE__, __FILE__, #expr, msg);     \
        }                                                               \
    } while (0)
