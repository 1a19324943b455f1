#pragma once

// local includes
#include "lview/logging.h"
#include "lview/exception.h"
#include "lview/parseargs.h"

// 3rd party
#include <fmt/format.h>

// std includes
#include <string>
#include <vector>
#include <exception>

namespace LView::Runner {

    // process exit codes, one per error category
    constexpr int EXIT_OK = 0;
    constexpr int EXIT_ERROR = 1;
    constexpr int EXIT_BAD_ARGUMENTS = 2;
    constexpr int EXIT_UNSUPPORTED = 3;
    constexpr int EXIT_CONCURRENT_MODIFICATION = 4;

    // Common options, understood by every program run through Main():
    //   --log <file>   log file, an empty value disables file logging
    //   --verbose      console logs at VERBOSE instead of DEBUG
    struct Config {
        Config(int argc, char** argv) {
            for (int ii=0; ii<argc && argv[ii] != nullptr; ii++) {
                this->args.emplace_back(argv[ii]);
            }
        }

        std::vector <std::string> args;
        std::string log_filename;
        LogLevel console_level = Logger::LOG_DEBUG;
    };

    inline const std::vector<std::string>& commonOptions() {
        static const std::vector<std::string> options{"--log", "--verbose"};
        return options;
    }

    inline int report(const char* category, const Exception& exc, int exit_code) {
        fmt::print(stderr, "{} : {}\n", category, exc.getMessage());
        return exit_code;
    }

    // Parses the common options, sets up logging and calls f(parser).  LView errors are
    // reported on stderr and turned into the exit code of their category.
    template <typename F> int Main(F f, Config& config) {

        try {
            ParseArgs parser(config.args);

            config.log_filename = parser.getString("--log", config.log_filename);

            parser.checkFlag("--verbose");
            if (parser.has("--verbose")) {
                config.console_level = Logger::LOG_VERBOSE;
            }

            LView::loggerSetup(config.log_filename, config.console_level);
            f(parser);

        } catch (const InvalidArgument& exc) {
            return report("InvalidArgument", exc, EXIT_BAD_ARGUMENTS);

        } catch (const UnsupportedOperation& exc) {
            return report("UnsupportedOperation", exc, EXIT_UNSUPPORTED);

        } catch (const ConcurrentModification& exc) {
            return report("ConcurrentModification", exc, EXIT_CONCURRENT_MODIFICATION);

        } catch (const Assertion& exc) {
            fmt::print(stderr, "Stacktrace :\n{}\n", exc.getStacktrace());
            return report("Assertion", exc, EXIT_ERROR);

        } catch (const SysException& exc) {
            fmt::print(stderr, "  error {} : {}\n", exc.getErrorCode(), exc.getErrorString());
            return report("SysException", exc, EXIT_ERROR);

        } catch (const Exception& exc) {
            fmt::print(stderr, "Stacktrace :\n{}\n", exc.getStacktrace());
            return report("Exception", exc, EXIT_ERROR);

        } catch (const std::exception& exc) {
            l_critical("std::exception What : %s", exc.what());
            throw;
        }

        return EXIT_OK;
    }
}
