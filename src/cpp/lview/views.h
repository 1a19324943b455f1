#pragma once

// local includes
#include "lview/predicates.h"
#include "lview/exception.h"
#include "lview/logging.h"

// 3rd party
#include <range/v3/all.hpp>

// std includes
#include <vector>
#include <cstdint>
#include <utility>
#include <optional>
#include <type_traits>

namespace LView {

    template <typename T> class Sequence;
    template <typename T> class SequenceView;
    template <typename Source> class FilteredView;
    template <typename Source, typename R> class MappedView;

    namespace Detail {
        template <typename T, typename = void>
        struct IsEqualityComparable : std::false_type {
        };

        template <typename T>
        struct IsEqualityComparable<T, std::void_t<decltype(std::declval<const T&>() ==
                                                            std::declval<const T&>())>> :
            std::true_type {
        };
    }

    ///////////////////////////////////////////////////////////////////////////
    // Fluent operations shared by a Sequence and every view derived from it.
    //
    // Derived provides:
    //   iterate()      lazy range over the elements, as they are right now
    //   view()         what a new view stores as its source
    //
    // Views are live: they store no elements, only their source and a callable.  They hold the
    // backing Sequence by address and so must not outlive it.  Views are not thread safe.

    template <typename Derived, typename T>
    class ViewOps {
    public:
        using value_type = T;

    public:
        auto filter(Predicate<T> predicate) {
            using Source = decltype(this->derived().view());
            return FilteredView<Source>(this->derived().view(), std::move(predicate));
        }

        template <typename F>
        auto map(F f) {
            using R = std::decay_t<std::invoke_result_t<F&, const T&>>;
            using Source = decltype(this->derived().view());
            return MappedView<Source, R>(this->derived().view(), Transform<T, R>(std::move(f)));
        }

        // with an inverse the mapped view also accepts add()
        template <typename F, typename G>
        auto map(F f, G inverse) {
            using R = std::decay_t<std::invoke_result_t<F&, const T&>>;
            using Source = decltype(this->derived().view());
            return MappedView<Source, R>(this->derived().view(),
                                         Transform<T, R>(std::move(f)),
                                         Transform<R, T>(std::move(inverse)));
        }

        // snapshot, independent of the backing sequence
        std::vector<T> toList() const {
            return this->derived().iterate() | ranges::to<std::vector<T>>();
        }

        int size() const {
            return static_cast<int> (ranges::distance(this->derived().iterate()));
        }

        bool empty() const {
            auto rng = this->derived().iterate();
            return ranges::begin(rng) == ranges::end(rng);
        }

        bool all(const Predicate<T>& p) const {
            return ranges::all_of(this->derived().iterate(), p);
        }

        bool any(const Predicate<T>& p) const {
            return ranges::any_of(this->derived().iterate(), p);
        }

        bool contains(const T& value) const {
            auto rng = this->derived().iterate();
            return ranges::find(rng, value) != ranges::end(rng);
        }

        std::optional<T> firstMatch(const Predicate<T>& p) const {
            auto rng = this->derived().iterate();
            auto it = ranges::find_if(rng, p);
            if (it == ranges::end(rng)) {
                return std::nullopt;
            }

            return *it;
        }

    protected:
        Derived& derived() {
            return static_cast<Derived&> (*this);
        }

        const Derived& derived() const {
            return static_cast<const Derived&> (*this);
        }
    };

    ///////////////////////////////////////////////////////////////////////////
    // leaf view, a handle on the backing sequence

    template <typename T>
    class SequenceView : public ViewOps<SequenceView<T>, T> {
    public:
        using value_type = T;
        using root_type = T;

    public:
        explicit SequenceView(Sequence<T>* seq) :
            seq(seq) {
        }

    public:
        auto iterate() const {
            return this->seq->iterate();
        }

        void add(const T& value) {
            this->seq->add(value);
        }

        bool remove(const T& value) {
            return this->seq->remove(value);
        }

        int size() const {
            return this->seq->size();
        }

        bool empty() const {
            return this->seq->empty();
        }

        template <typename F>
        auto locateIf(F matches) const {
            return this->seq->locateIf(matches);
        }

        Sequence<T>& backing() const {
            return *this->seq;
        }

        SequenceView view() const {
            return *this;
        }

    private:
        Sequence<T>* seq;
    };

    ///////////////////////////////////////////////////////////////////////////

    template <typename Source>
    class FilteredView : public ViewOps<FilteredView<Source>, typename Source::value_type> {
    public:
        using value_type = typename Source::value_type;
        using root_type = typename Source::root_type;

    public:
        FilteredView(Source source, Predicate<value_type> predicate) :
            source(std::move(source)),
            predicate(std::move(predicate)),
            cached_size(-1),
            cached_mods(0) {
        }

    public:
        // predicate is evaluated on every pass, nothing is cached
        auto iterate() const {
            return this->source.iterate() | ranges::views::filter(this->predicate);
        }

        // throws InvalidArgument if value is not accepted by the predicate
        void add(const value_type& value) {
            if (!this->predicate(value)) {
                l_debug("FilteredView::add() element rejected by predicate");
                throw InvalidArgument("FilteredView::add() element does not satisfy the predicate");
            }

            this->source.add(value);
        }

        // removes the first visible element equal to value.  false if there is none.
        bool remove(const value_type& value) {
            if (!this->predicate(value)) {
                return false;
            }

            auto node = this->locateIf([&value](const value_type& e) {
                return e == value;
            });

            if (node == nullptr) {
                return false;
            }

            this->backing().erase(node);
            return true;
        }

        // cached until the backing sequence is structurally modified
        int size() const {
            const uint64_t mods = this->backing().modCount();
            if (this->cached_size < 0 || this->cached_mods != mods) {
                this->cached_size = static_cast<int> (ranges::distance(this->iterate()));
                this->cached_mods = mods;
            }

            return this->cached_size;
        }

        template <typename F>
        auto locateIf(F matches) const {
            return this->source.locateIf([this, &matches](const auto& e) {
                return this->predicate(e) && matches(e);
            });
        }

        Sequence<root_type>& backing() const {
            return this->source.backing();
        }

        FilteredView view() const {
            return *this;
        }

    private:
        Source source;
        Predicate<value_type> predicate;

        mutable int cached_size;
        mutable uint64_t cached_mods;
    };

    ///////////////////////////////////////////////////////////////////////////

    template <typename Source, typename R>
    class MappedView : public ViewOps<MappedView<Source, R>, R> {
    public:
        using source_type = typename Source::value_type;
        using value_type = R;
        using root_type = typename Source::root_type;

    public:
        MappedView(Source source, Transform<source_type, R> transform,
                   Transform<R, source_type> inverse=Transform<R, source_type>()) :
            source(std::move(source)),
            transform(std::move(transform)),
            inverse(std::move(inverse)) {
        }

    public:
        auto iterate() const {
            return this->source.iterate() | ranges::views::transform(this->transform);
        }

        void add(const R& value) {
            if (!this->inverse) {
                throw UnsupportedOperation("MappedView::add() without an inverse transform");
            }

            this->source.add(this->inverse(value));
        }

        // removes the backing element of the first mapped value equal to value
        bool remove(const R& value) {
            if constexpr (Detail::IsEqualityComparable<R>::value) {
                auto node = this->locateIf([&value](const R& e) {
                    return e == value;
                });

                if (node == nullptr) {
                    return false;
                }

                this->backing().erase(node);
                return true;

            } else {
                throw UnsupportedOperation("MappedView::remove() mapped values are not comparable");
            }
        }

        int size() const {
            return this->source.size();
        }

        template <typename F>
        auto locateIf(F matches) const {
            return this->source.locateIf([this, &matches](const source_type& e) {
                return matches(this->transform(e));
            });
        }

        Sequence<root_type>& backing() const {
            return this->source.backing();
        }

        MappedView view() const {
            return *this;
        }

    private:
        Source source;
        Transform<source_type, R> transform;
        Transform<R, source_type> inverse;
    };
}
