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

#include "index_list.h"
#include "iter.h"
#include "util/fatal.h"
#include "util/log.h"
#include <cstdint>
#include <utility>

namespace indexlist {

    template< typename T >
    IndexList<T>::IndexList(IndexList&& o) noexcept
        : contents_(std::move(o.contents_)),
          generation_(o.generation_),
          next_free_(std::exchange(o.next_free_, std::nullopt)),
          head_(std::exchange(o.head_, std::nullopt)),
          tail_(std::exchange(o.tail_, std::nullopt)),
          size_(std::exchange(o.size_, 0)) {
        o.contents_.clear();
        // Anything o issued so far must stay stale if o is reused
        o.generation_ = generation_ + 1;
    }

    template< typename T >
    IndexList<T>& IndexList<T>::operator=(IndexList&& o) noexcept {
        if (this != &o) {
            contents_ = std::move(o.contents_);
            o.contents_.clear();
            generation_ = o.generation_;
            next_free_ = std::exchange(o.next_free_, std::nullopt);
            head_ = std::exchange(o.head_, std::nullopt);
            tail_ = std::exchange(o.tail_, std::nullopt);
            size_ = std::exchange(o.size_, 0);
            o.generation_ = generation_ + 1;
        }
        return *this;
    }

    template< typename T >
    OccupiedEntry<T>& IndexList<T>::linked(size_type slot, const char* what) {
        OccupiedEntry<T>* entry = std::get_if<OccupiedEntry<T>>(&contents_[slot]);
        if (!entry) {
            list_corrupted(what);
        }
        return *entry;
    }

    template< typename T >
    const OccupiedEntry<T>& IndexList<T>::linked(size_type slot, const char* what) const {
        const OccupiedEntry<T>* entry = std::get_if<OccupiedEntry<T>>(&contents_[slot]);
        if (!entry) {
            list_corrupted(what);
        }
        return *entry;
    }

    template< typename T >
    const T* IndexList<T>::head() const {
        if (!head_) {
            return nullptr;
        }
        return &linked(*head_, "Free head").item;
    }

    template< typename T >
    T* IndexList<T>::head_mut() {
        if (!head_) {
            return nullptr;
        }
        return &linked(*head_, "Free head").item;
    }

    template< typename T >
    const T* IndexList<T>::tail() const {
        if (!tail_) {
            return nullptr;
        }
        return &linked(*tail_, "Free tail").item;
    }

    template< typename T >
    T* IndexList<T>::tail_mut() {
        if (!tail_) {
            return nullptr;
        }
        return &linked(*tail_, "Free tail").item;
    }

    template< typename T >
    const OccupiedEntry<T>* IndexList<T>::lookup(const Index<T>& index) const {
        if (index.slot_ >= contents_.size()) {
            return nullptr;
        }

        const OccupiedEntry<T>* entry = std::get_if<OccupiedEntry<T>>(&contents_[index.slot_]);
        if (!entry || entry->generation != index.generation_) {
            return nullptr;
        }
        return entry;
    }

    template< typename T >
    OccupiedEntry<T>* IndexList<T>::lookup(const Index<T>& index) {
        if (index.slot_ >= contents_.size()) {
            return nullptr;
        }

        OccupiedEntry<T>* entry = std::get_if<OccupiedEntry<T>>(&contents_[index.slot_]);
        if (!entry || entry->generation != index.generation_) {
            return nullptr;
        }
        return entry;
    }

    template< typename T >
    const T* IndexList<T>::get(const Index<T>& index) const {
        const OccupiedEntry<T>* entry = lookup(index);
        return entry ? &entry->item : nullptr;
    }

    template< typename T >
    T* IndexList<T>::get_mut(const Index<T>& index) {
        OccupiedEntry<T>* entry = lookup(index);
        return entry ? &entry->item : nullptr;
    }

    /**
     * Places a new occupied entry and returns its slot.
     * Reuses the head of the free list when there is one, otherwise
     * appends to the slot vector.
     */
    template< typename T >
    template< typename... Args >
    typename IndexList<T>::size_type
        IndexList<T>::allocate(std::optional<size_type> next, std::optional<size_type> prev, Args&&... args) {

        // A throwing constructor here leaves the list untouched
        OccupiedEntry<T> entry(generation_, next, prev, std::forward<Args>(args)...);

        if (!next_free_) {
            const size_type index = contents_.size();
            if (index == contents_.capacity()) {
                debug() << "IndexList: growing slot vector past " << contents_.capacity() << " slots";
            }
            contents_.emplace_back(std::in_place_type<OccupiedEntry<T>>, std::move(entry));
            return index;
        }

        const size_type index = *next_free_;
        const FreeEntry* free = std::get_if<FreeEntry>(&contents_[index]);
        if (!free) {
            list_corrupted("Occupied next_free");
        }
        const std::optional<size_type> following = free->next_free;
        try {
            contents_[index].template emplace<OccupiedEntry<T>>(std::move(entry));
        } catch (...) {
            // emplace destroyed the free marker; put it back before propagating
            contents_[index] = FreeEntry{following};
            throw;
        }
        next_free_ = following;
        return index;
    }

    template< typename T >
    template< typename... Args >
    Index<T> IndexList<T>::emplace_back(Args&&... args) {
        const size_type index = allocate(std::nullopt, tail_, std::forward<Args>(args)...);

        // The old tail now points forward to the new entry
        if (tail_) {
            linked(*tail_, "Free tail").next = index;
        }

        if (!head_) {
            head_ = index;
        }
        tail_ = index;
        ++size_;

        return Index<T>(index, generation_);
    }

    template< typename T >
    template< typename... Args >
    Index<T> IndexList<T>::emplace_front(Args&&... args) {
        const size_type index = allocate(head_, std::nullopt, std::forward<Args>(args)...);

        // The old head now points back to the new entry
        if (head_) {
            linked(*head_, "Free head").prev = index;
        }

        if (!tail_) {
            tail_ = index;
        }
        head_ = index;
        ++size_;

        return Index<T>(index, generation_);
    }

    template< typename T >
    std::optional<T> IndexList<T>::remove(const Index<T>& index) {
        if (!head_ || !tail_) {
            return std::nullopt;
        }

        OccupiedEntry<T>* entry = lookup(index);
        if (!entry) {
            if (config::debug_config::kTraceStaleHandles) {
                trace() << "IndexList: remove ignored stale handle " << index
                        << " (generation " << generation_ << ")";
            }
            return std::nullopt;
        }

        // Take the value before touching any links so a throwing move leaves the list intact
        std::optional<T> removed(std::move(entry->item));

        const std::optional<size_type> prev = entry->prev;
        const std::optional<size_type> next = entry->next;

        // Both neighbours are relinked independently; an endpoint moves the head or tail instead
        if (prev) {
            linked(*prev, "Free prev in remove").next = next;
        } else {
            head_ = next;
        }

        if (next) {
            linked(*next, "Free next in remove").prev = prev;
        } else {
            tail_ = prev;
        }

        contents_[index.slot_] = FreeEntry{next_free_};
        next_free_ = index.slot_;
        ++generation_;
        --size_;

        return removed;
    }

    template< typename T >
    std::optional<T> IndexList<T>::pop_front() {
        if (!head_) {
            return std::nullopt;
        }
        return remove(Index<T>(*head_, linked(*head_, "Free head").generation));
    }

    template< typename T >
    std::optional<T> IndexList<T>::pop_back() {
        if (!tail_) {
            return std::nullopt;
        }
        return remove(Index<T>(*tail_, linked(*tail_, "Free tail").generation));
    }

    template< typename T >
    ForwardIter<T> IndexList<T>::iter() const {
        return ForwardIter<T>(*this, head_);
    }

    template< typename T >
    ForwardIntoIter<T> IndexList<T>::into_iter() && {
        return ForwardIntoIter<T>(std::move(*this));
    }

    template< typename T >
    typename IndexList<T>::const_iterator IndexList<T>::begin() const {
        return const_iterator(this, head_);
    }

    template< typename T >
    typename IndexList<T>::const_iterator IndexList<T>::end() const {
        return const_iterator(this, std::nullopt);
    }

    template< typename T >
    template< typename Fn >
    void IndexList<T>::for_each(Fn&& fn) const {
        for (std::optional<size_type> idx = head_; idx; ) {
            const OccupiedEntry<T>& entry = linked(*idx, "Next in for_each");
            fn(entry.item);
            idx = entry.next;
        }
    }

    template< typename T >
    template< typename Fn >
    void IndexList<T>::for_each(Fn&& fn) {
        for (std::optional<size_type> idx = head_; idx; ) {
            OccupiedEntry<T>& entry = linked(*idx, "Next in for_each");
            fn(entry.item);
            idx = entry.next;
        }
    }

    template< typename T >
    bool IndexList<T>::check_invariants() const {
        enum : uint8_t { kUnseen = 0, kOrdered = 1, kFree = 2 };
        std::vector<uint8_t> seen(contents_.size(), kUnseen);

        if (head_.has_value() != tail_.has_value()) {
            error() << "IndexList: head and tail disagree on emptiness";
            return false;
        }

        // Order list: head to tail, checking back links as we go
        size_type count = 0;
        std::optional<size_type> prev;
        for (std::optional<size_type> idx = head_; idx; ) {
            if (*idx >= contents_.size()) {
                error() << "IndexList: order link " << *idx << " out of range";
                return false;
            }
            if (seen[*idx] != kUnseen) {
                error() << "IndexList: cycle on order list at slot " << *idx;
                return false;
            }
            seen[*idx] = kOrdered;

            const OccupiedEntry<T>* entry = std::get_if<OccupiedEntry<T>>(&contents_[*idx]);
            if (!entry) {
                error() << "IndexList: free slot " << *idx << " on order list";
                return false;
            }
            if (entry->prev != prev) {
                error() << "IndexList: slot " << *idx << " has a broken prev link";
                return false;
            }
            if (entry->generation > generation_) {
                error() << "IndexList: slot " << *idx << " stamped with future generation "
                        << entry->generation << " > " << generation_;
                return false;
            }
            prev = idx;
            idx = entry->next;
            ++count;
        }

        if (tail_ != prev) {
            error() << "IndexList: tail does not match the last slot on the order list";
            return false;
        }
        if (count != size_) {
            error() << "IndexList: order list holds " << count << " slots but size is " << size_;
            return false;
        }

        // Free list
        for (std::optional<size_type> idx = next_free_; idx; ) {
            if (*idx >= contents_.size()) {
                error() << "IndexList: free link " << *idx << " out of range";
                return false;
            }
            if (seen[*idx] != kUnseen) {
                error() << "IndexList: slot " << *idx << " reached twice (cycle or on both lists)";
                return false;
            }
            seen[*idx] = kFree;

            const FreeEntry* entry = std::get_if<FreeEntry>(&contents_[*idx]);
            if (!entry) {
                error() << "IndexList: occupied slot " << *idx << " on free list";
                return false;
            }
            idx = entry->next_free;
        }

        for (size_type i = 0; i < seen.size(); ++i) {
            if (seen[i] == kUnseen) {
                error() << "IndexList: slot " << i << " is on neither list";
                return false;
            }
        }

        return true;
    }

} // namespace indexlist
