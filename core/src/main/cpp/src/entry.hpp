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
#include <utility>
#include <variant>

namespace indexlist {

    /**
     * Unused slot. Free slots form a singly-linked list through next_free,
     * rooted at the list's next_free_.
     */
    struct FreeEntry {
        std::optional<size_t> next_free;
    };

    /**
     * Slot holding a live value.
     * next/prev are slot positions of the neighbours in traversal order.
     * generation is the list generation when the value was inserted.
     */
    template< typename T >
    struct OccupiedEntry {
        template< typename... Args >
        explicit OccupiedEntry(size_t gen, std::optional<size_t> n, std::optional<size_t> p, Args&&... args)
            : item(std::forward<Args>(args)...), generation(gen), next(n), prev(p) {}

        T item;
        size_t generation;
        std::optional<size_t> next;
        std::optional<size_t> prev;
    };

    template< typename T >
    using Entry = std::variant<FreeEntry, OccupiedEntry<T>>;

} // namespace indexlist
