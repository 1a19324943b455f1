// local includes
#include "lview/strutils.h"
#include "lview/exception.h"

// std includes
#include <string>
#include <cerrno>
#include <climits>
#include <cstdlib>

///////////////////////////////////////////////////////////////////////////////

using namespace std;

///////////////////////////////////////////////////////////////////////////////

int LView::toInt(const string& s) {
    if (s.empty()) {
        throw InvalidArgument("toInt() of empty string");
    }

    char* end = nullptr;
    errno = 0;
    long value = ::strtol(s.c_str(), &end, 10);

    if (*end != '\0') {
        throw InvalidArgument(fmtString("toInt() not an integer: '%s'", s));
    }

    if (errno == ERANGE || value < INT_MIN || value > INT_MAX) {
        throw InvalidArgument(fmtString("toInt() out of range: '%s'", s));
    }

    return static_cast<int> (value);
}

bool LView::startsWith(const string& s, const string& prefix) {
    return s.compare(0, prefix.size(), prefix) == 0;
}
