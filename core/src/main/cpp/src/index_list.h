/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 *
 * The Lucenia project is free software: you can redistribute it
 * and/or modify it under the terms of the GNU Affero General
 * Public License as published by the Free Software Foundation,
 * either version 3 of the License, or (at your option) any later
 * version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
 * GNU Affero General Public License for more details.
 *
 * You should have received a copy of the GNU Affero General Public
 * License along with this program. If not, see:
 * https://www.gnu.org/licenses/agpl-3.0.html
 */

#pragma once

#include <cstddef>
#include <optional>
#include <vector>
#include "config.h"
#include "entry.hpp"
#include "index.hpp"

namespace indexlist {

    template< typename T > class ForwardIter;
    template< typename T > class ForwardIntoIter;
    template< typename T > class ListConstIterator;

    // Grants tests access to the slot store; defined by the test suite only
    struct IndexListTestPeer;

    /**
     * Doubly-linked list stored in a single vector of slots.
     *
     * Values are addressed through Index handles instead of pointers.
     * Removed slots go on a free list and are reused by later insertions;
     * every removal bumps the list generation so handles to removed values
     * stay invalid even when their slot is reused.
     *
     * Traversal order is kept by next/prev slot positions and is independent
     * of where a value sits in the vector.
     *
     * Not thread safe. The list must not be mutated while an iterator is live.
     */
    template< typename T >
    class IndexList {
    public:
        typedef T value_type;
        typedef size_t size_type;
        typedef Index<T> index_type;
        typedef ListConstIterator<T> const_iterator;

        /**
         * Empty list. Reserves INDEXLIST_RESERVE_HINT slots when that is set.
         */
        IndexList() : IndexList(config::index_list::default_reserve_hint()) {}

        /**
         * Empty list with room for reserve_hint slots. The hint is not a bound.
         */
        explicit IndexList(size_type reserve_hint)
            : generation_(0), size_(0) {
            contents_.reserve(reserve_hint);
        }

        static IndexList with_capacity(size_type reserve_hint) {
            return IndexList(reserve_hint);
        }

        /**
         * Moves take the source's values, handles and generation. The source
         * is left empty and its generation is pushed past every handle it
         * issued, so those handles stay stale if the source is reused.
         *
         * Move-assignment drops the target's values. Handles the target
         * issued before the assignment are the caller's to retire: they may
         * match slots of the incoming list.
         */
        IndexList(IndexList&& o) noexcept;
        IndexList& operator=(IndexList&& o) noexcept;

        // The list owns its values
        IndexList(const IndexList&) = delete;
        IndexList& operator=(const IndexList&) = delete;

        size_type size() const { return size_; }
        bool empty() const { return size_ == 0; }

        /** Length of the slot vector, free slots included. Never shrinks. */
        size_type slot_count() const { return contents_.size(); }
        size_type capacity() const { return contents_.capacity(); }
        void reserve(size_type n) { contents_.reserve(n); }

        /** Number of successful removals so far */
        size_type generation() const { return generation_; }

        // First and last values in traversal order, nullptr when empty
        const T* head() const;
        T* head_mut();
        const T* tail() const;
        T* tail_mut();

        /**
         * Value for a handle, or nullptr if the handle is out of range,
         * points at a free slot, or was issued for an earlier occupant.
         */
        const T* get(const Index<T>& index) const;
        T* get_mut(const Index<T>& index);

        bool contains(const Index<T>& index) const {
            return get(index) != nullptr;
        }

        Index<T> push_back(const T& value) { return emplace_back(value); }
        Index<T> push_back(T&& value) { return emplace_back(std::move(value)); }
        Index<T> push_front(const T& value) { return emplace_front(value); }
        Index<T> push_front(T&& value) { return emplace_front(std::move(value)); }

        template< typename... Args >
        Index<T> emplace_back(Args&&... args);

        template< typename... Args >
        Index<T> emplace_front(Args&&... args);

        /**
         * Removes the value for a handle and returns it.
         * Returns nullopt under the same conditions as get() and leaves
         * the list untouched in that case.
         */
        std::optional<T> remove(const Index<T>& index);

        std::optional<T> pop_front();
        std::optional<T> pop_back();

        /** Borrowing iterator, head to tail */
        ForwardIter<T> iter() const;

        /** Consuming iterator, head to tail. Takes the list over. */
        ForwardIntoIter<T> into_iter() &&;

        const_iterator begin() const;
        const_iterator end() const;

        template< typename Fn >
        void for_each(Fn&& fn) const;

        template< typename Fn >
        void for_each(Fn&& fn);

        /**
         * Walks the order list and the free list and verifies that every
         * slot is on exactly one of them with consistent links.
         * Logs the first violation at ERROR and returns false.
         */
        bool check_invariants() const;

    private:
        friend class ForwardIter<T>;
        friend class ForwardIntoIter<T>;
        friend class ListConstIterator<T>;
        friend struct IndexListTestPeer;

        template< typename... Args >
        size_type allocate(std::optional<size_type> next, std::optional<size_type> prev, Args&&... args);

        OccupiedEntry<T>* lookup(const Index<T>& index);
        const OccupiedEntry<T>* lookup(const Index<T>& index) const;

        // Slot reached through an internal link; aborts if it is free
        OccupiedEntry<T>& linked(size_type slot, const char* what);
        const OccupiedEntry<T>& linked(size_type slot, const char* what) const;

        std::vector<Entry<T>> contents_;
        size_type generation_;
        std::optional<size_type> next_free_;
        std::optional<size_type> head_;
        std::optional<size_type> tail_;
        size_type size_;
    };

} // namespace indexlist
