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
#include <ostream>

namespace indexlist {

    template< typename T > class IndexList;

    /**
     * Index is the handle returned by IndexList insertions.
     * It pairs a slot position with the list generation the slot was
     * stamped with when the value was inserted.
     *
     * A slot position can be reused after a removal, but the list
     * generation moves on with every removal, so a handle to the old
     * occupant never matches the new one.
     *
     * The value type is part of the handle type: an Index<int> only
     * resolves against an IndexList<int>.
     */
    template< typename T >
    class Index {
    public:
        static constexpr size_t npos = ~size_t{0};

        // Default constructed handles never resolve
        Index() : slot_(npos), generation_(0) {}

        static Index invalid() {
            return Index();
        }

        /** True if the handle was issued by a list (says nothing about liveness) */
        bool valid() const {
            return slot_ != npos;
        }

        bool operator==(const Index& o) const {
            return slot_ == o.slot_ && generation_ == o.generation_;
        }

        bool operator!=(const Index& o) const {
            return !(*this == o);
        }

        friend std::ostream& operator<<(std::ostream& os, const Index& idx) {
            if (!idx.valid()) {
                return os << "Index(invalid)";
            }
            return os << "Index(slot=" << idx.slot_ << ", gen=" << idx.generation_ << ")";
        }

    private:
        friend class IndexList<T>;

        Index(size_t slot, size_t generation) : slot_(slot), generation_(generation) {}

        size_t slot_;
        size_t generation_;
    }; // Index

} // namespace indexlist
