#pragma once

// std includes
#include <regex>
#include <string>
#include <vector>
#include <utility>
#include <algorithm>
#include <functional>

namespace LView {

    template <typename T>
    using Predicate = std::function <bool (const T&)>;

    template <typename T, typename R>
    using Transform = std::function <R (const T&)>;

    namespace Detail {
        // stops deduction on a parameter, so lambdas can be passed alongside a typed argument
        template <typename T>
        struct Identity {
            using type = T;
        };

        template <typename T>
        using NonDeduced = typename Identity<T>::type;
    }

    namespace Predicates {

        template <typename T>
        Predicate<T> alwaysTrue() {
            return [](const T&) {
                return true;
            };
        }

        template <typename T>
        Predicate<T> alwaysFalse() {
            return [](const T&) {
                return false;
            };
        }

        // T is anything testable in a boolean context: pointers, std::optional, smart pointers
        template <typename T>
        Predicate<T> isNull() {
            return [](const T& value) {
                return !value;
            };
        }

        template <typename T>
        Predicate<T> notNull() {
            return [](const T& value) {
                return static_cast<bool> (value);
            };
        }

        template <typename T>
        Predicate<T> equalTo(T target) {
            return [target = std::move(target)](const T& value) {
                return value == target;
            };
        }

        template <typename T>
        Predicate<T> in(std::vector<T> values) {
            return [values = std::move(values)](const T& value) {
                return std::find(values.begin(), values.end(), value) != values.end();
            };
        }

        // true if the regex pattern is found anywhere in the input (a search, not a full match)
        inline Predicate<std::string> containsPattern(const std::string& pattern,
                                                      bool ignore_case=false) {
            auto flags = std::regex::ECMAScript;
            if (ignore_case) {
                flags |= std::regex::icase;
            }

            std::regex re(pattern, flags);
            return [re](const std::string& value) {
                return std::regex_search(value, re);
            };
        }

        ///////////////////////////////////////////////////////////////////////
        // combinators, evaluated left to right with short circuit

        template <typename T>
        Predicate<T> and_(Predicate<T> first, Detail::NonDeduced<Predicate<T>> second) {
            return [first = std::move(first), second = std::move(second)](const T& value) {
                return first(value) && second(value);
            };
        }

        template <typename T>
        Predicate<T> or_(Predicate<T> first, Detail::NonDeduced<Predicate<T>> second) {
            return [first = std::move(first), second = std::move(second)](const T& value) {
                return first(value) || second(value);
            };
        }

        template <typename T>
        Predicate<T> not_(Predicate<T> p) {
            return [p = std::move(p)](const T& value) {
                return !p(value);
            };
        }

        // p(f(x))
        template <typename T, typename R>
        Predicate<T> compose(Predicate<R> p, Transform<T, R> f) {
            return [p = std::move(p), f = std::move(f)](const T& value) {
                return p(f(value));
            };
        }
    }
}
