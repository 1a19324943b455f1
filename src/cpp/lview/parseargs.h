#pragma once

// std includes
#include <map>
#include <vector>
#include <string>

namespace LView {

    // Splits argv into "--option value value ..." groups, args[0] (the program name) is
    // skipped.  An option takes every following argument up to the next "--option".
    //
    // Throws InvalidArgument for a value before the first option and for a repeated option.
    class ParseArgs {
    public:
        ParseArgs(const std::vector<std::string>& args);

    public:
        bool has(const std::string& option) const;

        // the single value of option, default_value if absent
        std::string getString(const std::string& option, const std::string& default_value) const;
        int getInt(const std::string& option, int default_value) const;

        // every value of option, default_values if absent
        std::vector<std::string> getStrings(const std::string& option,
                                            const std::vector<std::string>& default_values) const;

        // throws InvalidArgument naming the first option not in known
        void checkKnown(const std::vector<std::string>& known) const;

        // flags take no values
        void checkFlag(const std::string& option) const;

    private:
        const std::vector<std::string>* find(const std::string& option) const;

    private:
        std::map <std::string, std::vector<std::string>> options;
    };

}
