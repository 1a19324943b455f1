#pragma once

// local includes
#include "lview/exception.h"

// std includes
#include <cstdint>

namespace LView {

    // Intrusive doubly linked list.  Nodes know which list they are in, so removal of a node
    // found while walking is O(1) and a node can never be in two lists.
    //
    // mod_count is bumped on every structural change, iterators built on top of the list use it
    // to fail fast.
    template <typename T, bool owns_memory=true>
    class InplaceList {
    public:
        using DataType = T;

        // the node is internal to us
        class Node {
        public:
            template<class ... Types> Node(Types ... args) :
                data(args...),
                next_node(nullptr),
                prev_node(nullptr),
                inplace_list(nullptr) {
            }

        public:
            Node* next() const {
                return this->next_node;
            }

            Node* prev() const {
                return this->prev_node;
            }

            InplaceList* parent() const {
                return this->inplace_list;
            }

            DataType& get() {
                return this->data;
            }

            const DataType& get() const {
                return this->data;
            }

        private:
            DataType data;
            Node* next_node;
            Node* prev_node;
            InplaceList* inplace_list;
            friend InplaceList;
        };

    public:
        explicit InplaceList() :
            head_node(nullptr),
            tail_node(nullptr),
            node_count(0),
            mod_count(0) {
        }

        ~InplaceList() {
            this->clear();
        }

        InplaceList(InplaceList const &) = delete;
        InplaceList& operator= (const InplaceList&) = delete;

    public:
        Node* head() const {
            return this->head_node;
        }

        Node* tail() const {
            return this->tail_node;
        }

        template<class ... Types> Node* createNode(Types ... args) {
            return new Node(args ...);
        }

        void pushBack(Node* new_node) {
            ASSERT_MSG (new_node->inplace_list == nullptr, "node is already in a list");

            new_node->prev_node = this->tail_node;
            new_node->next_node = nullptr;
            new_node->inplace_list = this;

            if (this->tail_node == nullptr) {
                ASSERT (this->head_node == nullptr);
                this->head_node = this->tail_node = new_node;
            } else {
                this->tail_node->next_node = new_node;
                this->tail_node = new_node;
            }

            this->node_count++;
            this->mod_count++;
        }

        template<class ... Types> void emplaceBack(Types ... args) {
            this->pushBack(new Node(args ...));
        }

        void pushFront(Node* new_node) {
            if (this->head_node == nullptr) {
                this->pushBack(new_node);
            } else {
                this->insertBefore(this->head_node, new_node);
            }
        }

        void insertBefore(Node* existing_node, Node* new_node) {
            ASSERT_MSG (new_node->inplace_list == nullptr, "node is already in a list");
            ASSERT_MSG (existing_node->inplace_list == this, "existing node is not in this list");

            // get reference to previous, and replace previous on existing
            Node* previous = existing_node->prev_node;
            existing_node->prev_node = new_node;

            new_node->prev_node = previous;
            new_node->next_node = existing_node;
            new_node->inplace_list = this;

            // are we the head?
            if (previous == nullptr) {
                ASSERT (existing_node == this->head_node);
                this->head_node = new_node;
            } else {
                previous->next_node = new_node;
            }

            this->node_count++;
            this->mod_count++;
        }

        Node* remove(Node* node) {
            // returns the next node if not empty.  Memory of node is now the callers.

            ASSERT_MSG (node->inplace_list == this, "node is not in this list");

            Node* previous = node->prev_node;
            Node* next = node->next_node;

            // fix previous if it exists
            if (previous == nullptr) {
                ASSERT (node == this->head_node);
                this->head_node = next;
            } else {
                previous->next_node = next;
            }

            // fix next if it exists
            if (next == nullptr) {
                ASSERT (node == this->tail_node);
                this->tail_node = previous;
            } else {
                next->prev_node = previous;
            }

            node->prev_node = nullptr;
            node->next_node = nullptr;
            node->inplace_list = nullptr;

            this->node_count--;
            this->mod_count++;

            return next;
        }

        // remove and free (when we own the memory)
        Node* erase(Node* node) {
            Node* next = this->remove(node);
            if (owns_memory) {
                delete node;
            }

            return next;
        }

        int size() const {
            return this->node_count;
        }

        bool empty() const {
            return this->size() == 0;
        }

        uint64_t modCount() const {
            return this->mod_count;
        }

        void clear() {
            // spin through all and call delete and then set head/tail

            Node* node = this->head_node;
            while (node != nullptr) {
                Node* carcass = node;
                node = node->next_node;

                carcass->prev_node = nullptr;
                carcass->next_node = nullptr;
                carcass->inplace_list = nullptr;

                if (owns_memory) {
                    delete carcass;
                }
            }

            if (this->node_count > 0) {
                this->mod_count++;
            }

            // reset all
            this->head_node = nullptr;
            this->tail_node = nullptr;
            this->node_count = 0;
        }

    private:
        Node* head_node;
        Node* tail_node;
        int node_count;
        uint64_t mod_count;

    private:
        class nodeIterator {
        public:
            nodeIterator(Node* n) :
                node(n) {
            }

            bool operator!= (const nodeIterator& other) const {
                return this->node != other.node;
            }

            Node* operator*() {
                return this->node;
            }

            const nodeIterator& operator++() {
                this->node = this->node->next();
                return *this;
            }

        private:
            Node* node;
        };

    public:
        nodeIterator begin() {
            return nodeIterator(this->head());
        }

        nodeIterator end() {
            return nodeIterator(nullptr);
        }
    };
}
