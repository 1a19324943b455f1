#pragma once

// local includes
#include "lview/inplist.h"
#include "lview/views.h"
#include "lview/exception.h"
#include "lview/logging.h"
#include "lview/strutils.h"

// 3rd party
#include <range/v3/all.hpp>

// std includes
#include <cstdint>
#include <initializer_list>

namespace LView {

    // Lazy range over a Sequence.  Fails fast: once iteration has begun, any structural change
    // to the sequence makes the next read or advance throw ConcurrentModification.
    template <typename T>
    class ListRange : public ranges::view_facade<ListRange<T>> {
        friend ranges::range_access;
        using Node = typename InplaceList<T>::Node;

        struct cursor {
            const Sequence<T>* owner = nullptr;
            Node* node = nullptr;
            uint64_t expected_mods = 0;

            const T& read() const {
                this->check();
                return this->node->get();
            }

            bool equal(ranges::default_sentinel_t) const {
                return this->node == nullptr;
            }

            bool equal(const cursor& other) const {
                return this->node == other.node;
            }

            void next() {
                this->check();
                this->node = this->node->next();
            }

            void check() const {
                const uint64_t mods = this->owner->modCount();
                if (mods != this->expected_mods) {
                    l_warning("sequence modified during iteration");
                    throw ConcurrentModification(
                        fmtString("sequence modified during iteration (mod count %d, expected %d)",
                                  mods, this->expected_mods));
                }
            }
        };

        cursor begin_cursor() const {
            return cursor{this->owner, this->owner->list().head(), this->owner->modCount()};
        }

    public:
        ListRange() = default;

        explicit ListRange(const Sequence<T>* owner) :
            owner(owner) {
        }

    private:
        const Sequence<T>* owner = nullptr;
    };

    ///////////////////////////////////////////////////////////////////////////
    // The backing sequence.  Owns its elements; views derived from it hold its address, so it is
    // neither copyable nor movable.

    template <typename T>
    class Sequence : public ViewOps<Sequence<T>, T> {
    public:
        using value_type = T;
        using root_type = T;
        using List = InplaceList<T>;
        using Node = typename List::Node;

    public:
        Sequence() = default;

        Sequence(std::initializer_list<T> values) {
            for (const T& value : values) {
                this->add(value);
            }
        }

        ~Sequence() = default;

        Sequence(const Sequence&) = delete;
        Sequence& operator= (const Sequence&) = delete;

    public:
        void add(const T& value) {
            this->elements.emplaceBack(value);
        }

        template <typename Rng>
        void addAll(const Rng& values) {
            for (const auto& value : values) {
                this->add(value);
            }
        }

        void addFirst(const T& value) {
            this->elements.pushFront(this->elements.createNode(value));
        }

        // insert before position index, 0 <= index <= size()
        void insert(int index, const T& value) {
            if (index < 0 || index > this->size()) {
                throw InvalidArgument(fmtString("Sequence::insert() index %d out of range [0, %d]",
                                                index, this->size()));
            }

            if (index == this->size()) {
                this->add(value);
                return;
            }

            Node* node = this->elements.head();
            for (int ii=0; ii<index; ii++) {
                node = node->next();
            }

            this->elements.insertBefore(node, this->elements.createNode(value));
        }

        // removes first element equal to value
        bool remove(const T& value) {
            Node* node = this->locateIf([&value](const T& e) {
                return e == value;
            });

            if (node == nullptr) {
                return false;
            }

            this->erase(node);
            return true;
        }

        void erase(Node* node) {
            this->elements.erase(node);
        }

        void clear() {
            l_verbose("Sequence::clear() dropping %d elements", this->size());
            this->elements.clear();
        }

        int size() const {
            return this->elements.size();
        }

        bool empty() const {
            return this->elements.empty();
        }

        uint64_t modCount() const {
            return this->elements.modCount();
        }

        template <typename F>
        Node* locateIf(F matches) const {
            for (Node* node = this->elements.head(); node != nullptr; node = node->next()) {
                if (matches(node->get())) {
                    return node;
                }
            }

            return nullptr;
        }

        ListRange<T> iterate() const {
            return ListRange<T>(this);
        }

        auto begin() const {
            return this->iterate().begin();
        }

        auto end() const {
            return this->iterate().end();
        }

        const List& list() const {
            return this->elements;
        }

        SequenceView<T> view() {
            return SequenceView<T>(this);
        }

        Sequence& backing() {
            return *this;
        }

    private:
        List elements;
    };
}
