// lview includes
#include <lview/runner.h>
#include <lview/lview.h>

// 3rd party
#include <catch2/catch.hpp>

// std includes
#include <string>
#include <vector>
#include <stdexcept>

using namespace LView;

///////////////////////////////////////////////////////////////////////////////

namespace {

    // no log file, console quiet
    template <typename F>
    int runWith(std::vector<const char*> argv, F f) {
        Runner::Config config(static_cast<int> (argv.size()), const_cast<char**> (argv.data()));
        config.log_filename = "";
        config.console_level = Logger::LOG_NONE;
        return Runner::Main(f, config);
    }
}

TEST_CASE("runner passes parsed options through", "[runner]") {
    std::vector <std::string> seen;

    int code = runWith({"prog", "--names", "John", "Jane"}, [&seen](const ParseArgs& parser) {
        seen = parser.getStrings("--names", {});
    });

    REQUIRE(code == Runner::EXIT_OK);
    REQUIRE(seen == std::vector<std::string>{"John", "Jane"});
}

TEST_CASE("runner exit code per error category", "[runner]") {
    auto noop = [](const ParseArgs&) {
    };

    SECTION("bad arguments") {
        REQUIRE(runWith({"prog", "stray"}, noop) == Runner::EXIT_BAD_ARGUMENTS);
        REQUIRE(runWith({"prog", "--verbose", "yes"}, noop) == Runner::EXIT_BAD_ARGUMENTS);
    }

    SECTION("element refused by a filter") {
        int code = runWith({"prog"}, [](const ParseArgs&) {
            Sequence<int> numbers{1, 2};
            numbers.filter([](const int& i) { return i > 0; }).add(-1);
        });

        REQUIRE(code == Runner::EXIT_BAD_ARGUMENTS);
    }

    SECTION("unsupported add through a map") {
        int code = runWith({"prog"}, [](const ParseArgs&) {
            Sequence<int> numbers{1, 2};
            numbers.map([](const int& i) { return i * 2; }).add(4);
        });

        REQUIRE(code == Runner::EXIT_UNSUPPORTED);
    }

    SECTION("modified while iterating") {
        int code = runWith({"prog"}, [](const ParseArgs&) {
            Sequence<int> numbers{1, 2};
            for (int i : numbers) {
                numbers.add(i);
            }
        });

        REQUIRE(code == Runner::EXIT_CONCURRENT_MODIFICATION);
    }

    SECTION("assertion") {
        int code = runWith({"prog"}, [](const ParseArgs&) {
            ASSERT(1 == 2);
        });

        REQUIRE(code == Runner::EXIT_ERROR);
    }

    SECTION("foreign exceptions are rethrown") {
        auto bad = [](const ParseArgs&) {
            throw std::runtime_error("not ours");
        };

        REQUIRE_THROWS_AS(runWith({"prog"}, bad), std::runtime_error);
    }
}
