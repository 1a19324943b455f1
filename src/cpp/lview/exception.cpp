// local includes
#include "lview/exception.h"
#include "lview/strutils.h"

// std includes
#include <string>
#include <cstdlib>
#include <cstring>

#include <execinfo.h>

///////////////////////////////////////////////////////////////////////////////

using namespace std;
using namespace LView;

///////////////////////////////////////////////////////////////////////////////

namespace {

    const int MAX_FRAMES = 64;

    string captureStacktrace() {
        void* frames[MAX_FRAMES];
        int count = ::backtrace(frames, MAX_FRAMES);

        char** symbols = ::backtrace_symbols(frames, count);
        if (symbols == nullptr) {
            return "<no stacktrace available>";
        }

        // skip ourselves and the Exception constructor
        string res;
        for (int ii=2; ii<count; ii++) {
            res += LView::fmtString("  #%d %s\n", ii - 2, symbols[ii]);
        }

        ::free(symbols);
        return res;
    }
}

///////////////////////////////////////////////////////////////////////////////

Exception::Exception(const string& msg) :
    msg(msg),
    stacktrace(captureStacktrace()) {
}

Exception::~Exception() {
}

///////////////////////////////////////////////////////////////////////////////

Assertion::Assertion(int line, const char* file, const char* expr, const string& msg) :
    Exception(msg.empty() ?
              LView::fmtString("assert failed '%s' at %s:%d", expr, file, line) :
              LView::fmtString("assert failed '%s' at %s:%d : %s", expr, file, line, msg)),
    line(line),
    file(file) {
}

Assertion::~Assertion() {
}

///////////////////////////////////////////////////////////////////////////////

SysException::SysException(const string& msg, int error_code) :
    Exception(msg),
    error_code(error_code) {
}

SysException::~SysException() {
}

string SysException::getErrorString() const {
    return ::strerror(this->error_code);
}

///////////////////////////////////////////////////////////////////////////////

InvalidArgument::InvalidArgument(const string& msg) :
    Exception(msg) {
}

InvalidArgument::~InvalidArgument() {
}

UnsupportedOperation::UnsupportedOperation(const string& msg) :
    Exception(msg) {
}

UnsupportedOperation::~UnsupportedOperation() {
}

ConcurrentModification::ConcurrentModification(const string& msg) :
    Exception(msg) {
}

ConcurrentModification::~ConcurrentModification() {
}
