// local includes
#include "lview/parseargs.h"
#include "lview/strutils.h"
#include "lview/exception.h"

// std includes
#include <vector>
#include <string>
#include <algorithm>

///////////////////////////////////////////////////////////////////////////////

using namespace std;
using namespace LView;

///////////////////////////////////////////////////////////////////////////////

ParseArgs::ParseArgs(const vector<string>& args) {
    vector<string>* current = nullptr;

    for (size_t ii=1; ii<args.size(); ii++) {
        const string& arg = args[ii];

        if (startsWith(arg, "--")) {
            auto inserted = this->options.emplace(arg, vector<string>());
            if (!inserted.second) {
                throw InvalidArgument(fmtString("option '%s' given more than once", arg));
            }

            current = &inserted.first->second;
            continue;
        }

        if (current == nullptr) {
            throw InvalidArgument(fmtString("unexpected argument '%s' before any option", arg));
        }

        current->push_back(arg);
    }
}

const vector<string>* ParseArgs::find(const string& option) const {
    auto it = this->options.find(option);
    if (it == this->options.end()) {
        return nullptr;
    }

    return &it->second;
}

bool ParseArgs::has(const string& option) const {
    return this->find(option) != nullptr;
}

string ParseArgs::getString(const string& option, const string& default_value) const {
    const vector<string>* values = this->find(option);
    if (values == nullptr) {
        return default_value;
    }

    if (values->size() != 1) {
        throw InvalidArgument(fmtString("option '%s' takes one value, got %d",
                                        option, values->size()));
    }

    return values->front();
}

int ParseArgs::getInt(const string& option, int default_value) const {
    if (!this->has(option)) {
        return default_value;
    }

    return toInt(this->getString(option, ""));
}

vector<string> ParseArgs::getStrings(const string& option,
                                     const vector<string>& default_values) const {
    const vector<string>* values = this->find(option);
    if (values == nullptr) {
        return default_values;
    }

    if (values->empty()) {
        throw InvalidArgument(fmtString("option '%s' needs at least one value", option));
    }

    return *values;
}

void ParseArgs::checkKnown(const vector<string>& known) const {
    for (const auto& kv : this->options) {
        if (std::find(known.begin(), known.end(), kv.first) == known.end()) {
            throw InvalidArgument(fmtString("unknown option '%s'", kv.first));
        }
    }
}

void ParseArgs::checkFlag(const string& option) const {
    const vector<string>* values = this->find(option);
    if (values != nullptr && !values->empty()) {
        throw InvalidArgument(fmtString("option '%s' takes no value, got '%s'",
                                        option, values->front()));
    }
}
