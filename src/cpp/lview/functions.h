#pragma once

// local includes
#include "lview/predicates.h"
#include "lview/exception.h"

// 3rd party
#include <fmt/format.h>

// std includes
#include <map>
#include <string>
#include <utility>

namespace LView::Functions {

    // f(g(x))
    template <typename A, typename B, typename C>
    Transform<A, C> compose(Transform<B, C> f, Transform<A, B> g) {
        return [f = std::move(f), g = std::move(g)](const A& value) {
            return f(g(value));
        };
    }

    template <typename T>
    Transform<T, bool> forPredicate(Predicate<T> p) {
        return [p = std::move(p)](const T& value) {
            return p(value);
        };
    }

    template <typename T>
    Transform<T, T> identity() {
        return [](const T& value) {
            return value;
        };
    }

    template <typename T, typename R>
    Transform<T, R> constant(R result) {
        return [result = std::move(result)](const T&) {
            return result;
        };
    }

    // lookup, throws InvalidArgument for keys not in the map
    template <typename K, typename V>
    Transform<K, V> forMap(std::map<K, V> mapping) {
        return [mapping = std::move(mapping)](const K& key) {
            auto it = mapping.find(key);
            if (it == mapping.end()) {
                throw InvalidArgument(fmt::format("key '{}' not present in map", key));
            }

            return it->second;
        };
    }

    template <typename K, typename V>
    Transform<K, V> forMap(std::map<K, V> mapping, V default_value) {
        return [mapping = std::move(mapping),
                default_value = std::move(default_value)](const K& key) {
            auto it = mapping.find(key);
            return it == mapping.end() ? default_value : it->second;
        };
    }

    template <typename T>
    Transform<T, std::string> toStringFunction() {
        return [](const T& value) {
            return fmt::format("{}", value);
        };
    }
}
