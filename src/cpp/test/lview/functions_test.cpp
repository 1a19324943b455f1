// lview includes
#include <lview/functions.h>
#include <lview/exception.h>

// 3rd party
#include <catch2/catch.hpp>

// std includes
#include <map>
#include <string>
#include <vector>

using namespace LView;

///////////////////////////////////////////////////////////////////////////////

TEST_CASE("compose applies right to left", "[functions]") {
    Transform<std::string, int> length = [](const std::string& s) {
        return static_cast<int> (s.size());
    };

    Transform<int, bool> even = [](const int& i) {
        return i % 2 == 0;
    };

    auto even_length = Functions::compose(even, length);

    for (const std::string x : {"John", "Tom", "", "Alexander"}) {
        REQUIRE(even_length(x) == even(length(x)));
    }

    Transform<int, int> twice = [](const int& i) {
        return i * 2;
    };

    Transform<int, int> plus_one = [](const int& i) {
        return i + 1;
    };

    REQUIRE(Functions::compose(twice, plus_one)(3) == 8);
    REQUIRE(Functions::compose(plus_one, twice)(3) == 7);
}

TEST_CASE("forPredicate", "[functions]") {
    Predicate<int> positive = [](const int& i) {
        return i > 0;
    };

    auto f = Functions::forPredicate(positive);
    REQUIRE(f(3) == true);
    REQUIRE(f(-3) == false);
}

TEST_CASE("identity and constant", "[functions]") {
    REQUIRE(Functions::identity<std::string>()("Tom") == "Tom");
    REQUIRE(Functions::constant<std::string, int>(42)("anything") == 42);
}

TEST_CASE("forMap", "[functions]") {
    std::map<std::string, int> ages{{"John", 31}, {"Jane", 29}};

    SECTION("strict") {
        auto age = Functions::forMap(ages);
        REQUIRE(age("Jane") == 29);
        REQUIRE_THROWS_AS(age("Tom"), InvalidArgument);
    }

    SECTION("with default") {
        auto age = Functions::forMap(ages, -1);
        REQUIRE(age("John") == 31);
        REQUIRE(age("Tom") == -1);
    }
}

TEST_CASE("toStringFunction", "[functions]") {
    REQUIRE(Functions::toStringFunction<int>()(42) == "42");
    REQUIRE(Functions::toStringFunction<double>()(1.5) == "1.5");
    REQUIRE(Functions::toStringFunction<std::string>()("Tom") == "Tom");
}
