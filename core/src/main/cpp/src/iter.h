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
#include <iterator>
#include <optional>
#include <utility>
#include <variant>
#include "index_list.h"
#include "util/fatal.h"

namespace indexlist {

    /**
     * Borrowing iterator over an IndexList, head to tail.
     *
     * next() returns a pointer to the next value, or nullptr once the tail
     * has been passed. Not restartable; call IndexList::iter() again.
     */
    template< typename T >
    class ForwardIter {
    public:
        ForwardIter(const IndexList<T>& list, std::optional<size_t> next_index)
            : _list(&list), _nextIndex(next_index) {}

        const T* next() {
            if (!_nextIndex) {
                return nullptr;
            }

            const OccupiedEntry<T>* entry = std::get_if<OccupiedEntry<T>>(&_list->contents_[*_nextIndex]);
            if (!entry) {
                list_corrupted("Next in iterator");
            }
            _nextIndex = entry->next;
            return &entry->item;
        }

        bool has_next() const {
            return _nextIndex.has_value();
        }

    private:
        const IndexList<T>* _list;
        std::optional<size_t> _nextIndex;
    };

    /**
     * Consuming iterator. Owns the list it was created from and moves each
     * value out as it goes, leaving an empty free marker in the slot.
     */
    template< typename T >
    class ForwardIntoIter {
    public:
        explicit ForwardIntoIter(IndexList<T>&& list)
            : _list(std::move(list)), _nextIndex(_list.head_) {}

        std::optional<T> next() {
            if (!_nextIndex) {
                return std::nullopt;
            }

            Entry<T> entry = std::exchange(_list.contents_[*_nextIndex], Entry<T>(FreeEntry{std::nullopt}));

            OccupiedEntry<T>* occupied = std::get_if<OccupiedEntry<T>>(&entry);
            if (!occupied) {
                list_corrupted("Corrupt into iter");
            }
            _nextIndex = occupied->next;
            return std::optional<T>(std::move(occupied->item));
        }

        bool has_next() const {
            return _nextIndex.has_value();
        }

    private:
        IndexList<T> _list;
        std::optional<size_t> _nextIndex;
    };

    /**
     * Forward iterator for range-based for loops.
     */
    template< typename T >
    class ListConstIterator {
    public:
        typedef std::forward_iterator_tag iterator_category;
        typedef T value_type;
        typedef std::ptrdiff_t difference_type;
        typedef const T* pointer;
        typedef const T& reference;

        ListConstIterator() : _list(nullptr) {}
        ListConstIterator(const IndexList<T>* list, std::optional<size_t> slot)
            : _list(list), _slot(slot) {}

        reference operator*() const { return entry().item; }
        pointer operator->() const { return &entry().item; }

        ListConstIterator& operator++() {
            _slot = entry().next;
            return *this;
        }

        ListConstIterator operator++(int) {
            ListConstIterator tmp = *this;
            ++(*this);
            return tmp;
        }

        bool operator==(const ListConstIterator& o) const { return _slot == o._slot; }
        bool operator!=(const ListConstIterator& o) const { return _slot != o._slot; }

    private:
        const OccupiedEntry<T>& entry() const {
            return _list->linked(*_slot, "Free slot in iterator");
        }

        const IndexList<T>* _list;
        std::optional<size_t> _slot;
    };

} // namespace indexlist
