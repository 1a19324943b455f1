// lview includes
#include <lview/lview.h>
#include <lview/strutils.h>

// 3rd party
#include <catch2/catch.hpp>

// std includes
#include <string>
#include <vector>
#include <optional>

using namespace LView;

using Names = std::vector<std::string>;

namespace {
    int length(const std::string& s) {
        return static_cast<int> (s.size());
    }

    bool isEven(const int& i) {
        return i % 2 == 0;
    }

    Predicate<std::string> startsWithAny(const Names& prefixes) {
        return [prefixes](const std::string& s) {
            for (const auto& p : prefixes) {
                if (startsWith(s, p)) {
                    return true;
                }
            }

            return false;
        };
    }
}

///////////////////////////////////////////////////////////////////////////////

TEST_CASE("names containing a", "[names]") {
    Sequence<std::string> names{"John", "Jane", "Adam", "Tom"};

    auto result = names.filter(Predicates::containsPattern("a"));
    REQUIRE(result.toList() == Names{"Jane", "Adam"});
    REQUIRE(result.size() == 2);

    // Adam matches either way
    auto ignoring_case = names.filter(Predicates::containsPattern("a", true));
    REQUIRE(ignoring_case.toList() == Names{"Jane", "Adam"});

    SECTION("add through the view") {
        result.add("Anna");
        REQUIRE(names.size() == 5);
        REQUIRE(result.size() == 3);
    }

    SECTION("rejected add") {
        REQUIRE_THROWS_AS(result.add("Elvis"), InvalidArgument);
        REQUIRE(names.size() == 4);
        REQUIRE(names.toList() == Names{"John", "Jane", "Adam", "Tom"});
    }
}

TEST_CASE("names starting with A or J", "[names]") {
    Sequence<std::string> names{"John", "Jane", "Adam", "Tom"};

    auto result = names.filter(startsWithAny({"A", "J"}));
    REQUIRE(result.size() == 3);
    REQUIRE(result.toList() == Names{"John", "Jane", "Adam"});
}

TEST_CASE("names by combined predicates", "[names]") {
    Sequence<std::string> names{"John", "Jane", "Adam", "Tom"};

    auto result = names.filter(Predicates::or_(Predicates::containsPattern("J"),
                                               Predicates::not_(Predicates::containsPattern("a"))));

    REQUIRE(result.toList() == Names{"John", "Jane", "Tom"});
}

TEST_CASE("names with gaps", "[names]") {
    using MaybeName = std::optional<std::string>;

    Sequence<MaybeName> names{MaybeName("John"), std::nullopt, MaybeName("Jane"),
                              std::nullopt, MaybeName("Adam"), MaybeName("Tom")};

    auto present = names.filter(Predicates::notNull<MaybeName>());
    REQUIRE(present.size() == 4);
    REQUIRE(names.size() == 6);

    auto unwrapped = present.map([](const MaybeName& n) {
        return *n;
    });

    REQUIRE(unwrapped.toList() == Names{"John", "Jane", "Adam", "Tom"});
}

TEST_CASE("names all match a pattern", "[names]") {
    Sequence<std::string> names{"John", "Jane", "Adam", "Tom"};

    REQUIRE(names.all(Predicates::containsPattern("n|m")));
    REQUIRE_FALSE(names.all(Predicates::containsPattern("a")));
}

TEST_CASE("names mapped to lengths", "[names]") {
    Sequence<std::string> names{"John", "Jane", "Adam", "Tom"};

    auto lengths = names.map(length);
    REQUIRE(lengths.toList() == std::vector<int>{4, 4, 4, 3});

    SECTION("remove through the mapped view") {
        REQUIRE(lengths.remove(3));
        REQUIRE(names.size() == 3);
        REQUIRE_FALSE(names.contains("Tom"));
    }

    SECTION("filtered then mapped") {
        auto short_a_or_t = names.filter(startsWithAny({"A", "T"})).map(length);
        REQUIRE(short_a_or_t.toList() == std::vector<int>{4, 3});
    }
}

TEST_CASE("names mapped through a predicate", "[names]") {
    Sequence<std::string> names{"John", "Jane", "Adam", "Tom"};

    auto has_m = names.map(Functions::forPredicate(Predicates::containsPattern("m")));
    REQUIRE(has_m.toList() == std::vector<bool>{false, false, true, true});
}

TEST_CASE("names mapped through a composed function", "[names]") {
    Sequence<std::string> names{"John", "Jane", "Adam", "Tom"};

    Transform<int, bool> even = isEven;
    Transform<std::string, int> len = length;

    auto even_length = names.map(Functions::compose(even, len));
    REQUIRE(even_length.toList() == std::vector<bool>{true, true, true, false});

    // the same thing as a filter
    auto evens = names.filter(Predicates::compose(Predicate<int>(isEven), len));
    REQUIRE(evens.toList() == Names{"John", "Jane", "Adam"});
}
