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

#include <gtest/gtest.h>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>
#include "../src/index_list.hpp"

using namespace indexlist;

class IndexListTest : public ::testing::Test {
protected:
    void SetUp() override {}
    void TearDown() override {
        EXPECT_TRUE(list.check_invariants());
    }

    std::vector<size_t> values() const {
        std::vector<size_t> out;
        for (size_t v : list) {
            out.push_back(v);
        }
        return out;
    }

    IndexList<size_t> list{0};
};

// ============= Construction =============

TEST_F(IndexListTest, EmptyList) {
    EXPECT_EQ(list.slot_count(), 0u);
    EXPECT_EQ(list.size(), 0u);
    EXPECT_TRUE(list.empty());
    EXPECT_EQ(list.generation(), 0u);
    EXPECT_EQ(list.head(), nullptr);
    EXPECT_EQ(list.tail(), nullptr);
    EXPECT_EQ(list.head_mut(), nullptr);
    EXPECT_EQ(list.tail_mut(), nullptr);
    EXPECT_TRUE(values().empty());
}

TEST_F(IndexListTest, WithCapacity) {
    IndexList<size_t> sized = IndexList<size_t>::with_capacity(10);
    EXPECT_GE(sized.capacity(), 10u);
    EXPECT_EQ(sized.slot_count(), 0u);
    EXPECT_EQ(sized.generation(), 0u);
    EXPECT_EQ(sized.head(), nullptr);
    EXPECT_EQ(sized.tail(), nullptr);

    // The hint is not a bound
    for (size_t i = 0; i < 25; ++i) {
        sized.push_back(i);
    }
    EXPECT_EQ(sized.size(), 25u);
    EXPECT_TRUE(sized.check_invariants());
}

// ============= Insertion =============

TEST_F(IndexListTest, PushBack) {
    list.push_back(100);
    ASSERT_NE(list.head(), nullptr);
    EXPECT_EQ(*list.head(), 100u);
    EXPECT_EQ(*list.tail(), 100u);

    list.push_back(200);
    list.push_back(300);
    list.push_back(400);

    EXPECT_EQ(*list.head(), 100u);
    EXPECT_EQ(*list.tail(), 400u);
    EXPECT_EQ(*list.head_mut(), 100u);
    EXPECT_EQ(*list.tail_mut(), 400u);
    EXPECT_EQ(values(), (std::vector<size_t>{100, 200, 300, 400}));
}

TEST_F(IndexListTest, PushFront) {
    list.push_front(100);
    EXPECT_EQ(*list.head(), 100u);
    EXPECT_EQ(*list.tail(), 100u);

    list.push_front(200);
    list.push_front(300);

    EXPECT_EQ(*list.head(), 300u);
    EXPECT_EQ(*list.tail(), 100u);
    EXPECT_EQ(values(), (std::vector<size_t>{300, 200, 100}));

    list.push_front(400);
    EXPECT_EQ(*list.head(), 400u);
    EXPECT_EQ(*list.tail(), 100u);
    EXPECT_EQ(values(), (std::vector<size_t>{400, 300, 200, 100}));
}

TEST_F(IndexListTest, PushFrontLinksOldHead) {
    // The old head must get the back link, not the tail
    list.push_back(1);
    list.push_back(2);
    list.push_back(3);
    list.push_front(0);
    EXPECT_EQ(values(), (std::vector<size_t>{0, 1, 2, 3}));
    EXPECT_TRUE(list.check_invariants());

    // Walking backwards through removals exercises the prev links
    EXPECT_EQ(list.pop_back(), std::optional<size_t>(3));
    EXPECT_EQ(list.pop_back(), std::optional<size_t>(2));
    EXPECT_EQ(list.pop_back(), std::optional<size_t>(1));
    EXPECT_EQ(*list.tail(), 0u);
    EXPECT_EQ(*list.head(), 0u);
}

TEST_F(IndexListTest, InterleavedFrontAndBack) {
    Index<size_t> b1 = list.push_back(10);
    Index<size_t> f1 = list.push_front(5);
    Index<size_t> b2 = list.push_back(20);
    Index<size_t> f2 = list.push_front(1);
    EXPECT_EQ(values(), (std::vector<size_t>{1, 5, 10, 20}));
    EXPECT_TRUE(list.check_invariants());

    // Remove the interior front-pushed entry, then push on both ends again
    ASSERT_EQ(list.remove(f1), std::optional<size_t>(5));
    list.push_front(0);
    list.push_back(30);
    EXPECT_EQ(values(), (std::vector<size_t>{0, 1, 10, 20, 30}));
    EXPECT_TRUE(list.check_invariants());

    ASSERT_EQ(list.remove(f2), std::optional<size_t>(1));
    ASSERT_EQ(list.remove(b2), std::optional<size_t>(20));
    EXPECT_EQ(values(), (std::vector<size_t>{0, 10, 30}));
    EXPECT_EQ(*list.get(b1), 10u);

    // Recycled slots are relinked at the front
    list.push_front(99);
    list.push_front(98);
    EXPECT_EQ(values(), (std::vector<size_t>{98, 99, 0, 10, 30}));
    EXPECT_EQ(list.slot_count(), 5u);
}

TEST_F(IndexListTest, PushFrontAfterDrainingFromBack) {
    list.push_front(1);
    list.push_front(2);
    EXPECT_EQ(list.pop_back(), std::optional<size_t>(1));
    EXPECT_EQ(list.pop_back(), std::optional<size_t>(2));
    EXPECT_TRUE(list.empty());

    list.push_front(3);
    list.push_back(4);
    list.push_front(5);
    EXPECT_EQ(values(), (std::vector<size_t>{5, 3, 4}));
    EXPECT_EQ(*list.head(), 5u);
    EXPECT_EQ(*list.tail(), 4u);
}

TEST_F(IndexListTest, EmplaceConstructsInPlace) {
    IndexList<std::string> strings(4);
    Index<std::string> a = strings.emplace_back(3, 'x');
    Index<std::string> b = strings.emplace_front("front");
    EXPECT_EQ(*strings.get(a), "xxx");
    EXPECT_EQ(*strings.get(b), "front");
    EXPECT_EQ(*strings.head(), "front");
    EXPECT_EQ(*strings.tail(), "xxx");
}

TEST_F(IndexListTest, MoveOnlyValues) {
    IndexList<std::unique_ptr<int>> owned(2);
    Index<std::unique_ptr<int>> h = owned.push_back(std::make_unique<int>(7));
    owned.push_front(std::make_unique<int>(6));

    std::optional<std::unique_ptr<int>> out = owned.remove(h);
    ASSERT_TRUE(out.has_value());
    EXPECT_EQ(**out, 7);
    EXPECT_EQ(**owned.head(), 6);
}

// ============= Lookup =============

TEST_F(IndexListTest, KeyValues) {
    Index<size_t> key_100 = list.push_back(100);
    Index<size_t> key_200 = list.push_back(200);
    Index<size_t> key_300 = list.push_back(300);
    Index<size_t> key_400 = list.push_back(400);

    EXPECT_EQ(*list.get(key_100), 100u);
    EXPECT_EQ(*list.get(key_200), 200u);
    EXPECT_EQ(*list.get(key_300), 300u);
    EXPECT_EQ(*list.get(key_400), 400u);

    EXPECT_EQ(*list.get_mut(key_100), 100u);
    EXPECT_EQ(*list.get_mut(key_400), 400u);
    EXPECT_TRUE(list.contains(key_200));
}

TEST_F(IndexListTest, GetMutWritesThrough) {
    Index<size_t> key = list.push_back(1);
    list.push_back(2);

    *list.get_mut(key) = 11;
    *list.tail_mut() = 22;
    EXPECT_EQ(values(), (std::vector<size_t>{11, 22}));
    *list.head_mut() += 100;
    EXPECT_EQ(*list.get(key), 111u);
}

TEST_F(IndexListTest, LookupDoesNotChangeGeneration) {
    Index<size_t> key = list.push_back(1);
    list.get(key);
    list.get_mut(key);
    list.head();
    list.tail_mut();
    list.contains(key);
    EXPECT_EQ(list.generation(), 0u);
}

TEST_F(IndexListTest, OutOfRangeHandleFromAnotherList) {
    IndexList<size_t> other(4);
    other.push_back(1);
    other.push_back(2);
    Index<size_t> foreign = other.push_back(3);

    list.push_back(1);
    EXPECT_EQ(list.get(foreign), nullptr);
    EXPECT_FALSE(list.remove(foreign).has_value());
    EXPECT_EQ(list.size(), 1u);
}

// ============= Removal =============

TEST_F(IndexListTest, Remove) {
    Index<size_t> key_100 = list.push_back(100);
    list.push_back(200);
    Index<size_t> key_300 = list.push_back(300);
    list.push_back(400);
    list.push_back(500);

    std::optional<size_t> val_300 = list.remove(key_300);
    EXPECT_EQ(val_300, std::optional<size_t>(300));
    EXPECT_EQ(list.get(key_300), nullptr);
    EXPECT_EQ(list.generation(), 1u);
    EXPECT_EQ(values(), (std::vector<size_t>{100, 200, 400, 500}));
    EXPECT_EQ(*list.tail(), 500u);

    // The freed slot is reused with the bumped generation
    Index<size_t> key_900 = list.push_back(900);
    EXPECT_EQ(list.slot_count(), 5u);
    EXPECT_EQ(*list.get(key_900), 900u);
    EXPECT_EQ(list.get(key_300), nullptr);
    EXPECT_EQ(*list.tail(), 900u);

    // Head is reassigned
    EXPECT_EQ(list.remove(key_100), std::optional<size_t>(100));
    EXPECT_EQ(list.generation(), 2u);
    EXPECT_EQ(*list.head(), 200u);

    // Tail is reassigned
    EXPECT_EQ(list.remove(key_900), std::optional<size_t>(900));
    EXPECT_EQ(list.generation(), 3u);
    EXPECT_EQ(*list.tail(), 500u);
    EXPECT_EQ(values(), (std::vector<size_t>{200, 400, 500}));
}

TEST_F(IndexListTest, DoubleRemoveIsAbsent) {
    Index<size_t> key = list.push_back(1);
    list.push_back(2);

    EXPECT_EQ(list.remove(key), std::optional<size_t>(1));
    EXPECT_FALSE(list.remove(key).has_value());
    EXPECT_EQ(list.generation(), 1u);
    EXPECT_EQ(list.size(), 1u);
}

TEST_F(IndexListTest, RemoveSoleElement) {
    Index<size_t> key = list.push_back(42);
    EXPECT_EQ(list.remove(key), std::optional<size_t>(42));

    EXPECT_TRUE(list.empty());
    EXPECT_EQ(list.head(), nullptr);
    EXPECT_EQ(list.tail(), nullptr);
    EXPECT_TRUE(values().empty());

    // Empty list short-circuits removal
    EXPECT_FALSE(list.remove(key).has_value());
    EXPECT_EQ(list.generation(), 1u);

    // And is usable again
    Index<size_t> again = list.push_front(43);
    EXPECT_EQ(*list.head(), 43u);
    EXPECT_EQ(*list.tail(), 43u);
    EXPECT_EQ(list.slot_count(), 1u);
    EXPECT_EQ(list.get(key), nullptr);
    EXPECT_EQ(*list.get(again), 43u);
}

TEST_F(IndexListTest, StaleHandleStaysStaleAcrossManyReuses) {
    Index<size_t> first = list.push_back(0);
    ASSERT_TRUE(list.remove(first).has_value());

    for (size_t i = 1; i <= 50; ++i) {
        Index<size_t> h = list.push_back(i);
        EXPECT_EQ(list.slot_count(), 1u);
        EXPECT_EQ(list.get(first), nullptr);
        ASSERT_EQ(list.remove(h), std::optional<size_t>(i));
    }
    EXPECT_EQ(list.generation(), 51u);
}

TEST_F(IndexListTest, GenerationCountsOnlySuccessfulRemovals) {
    std::vector<Index<size_t>> keys;
    for (size_t i = 0; i < 10; ++i) {
        keys.push_back(list.push_back(i));
        EXPECT_EQ(list.generation(), 0u);
    }

    size_t expected = 0;
    for (size_t i = 0; i < keys.size(); i += 2) {
        ASSERT_TRUE(list.remove(keys[i]).has_value());
        EXPECT_EQ(list.generation(), ++expected);
        EXPECT_FALSE(list.remove(keys[i]).has_value());
        EXPECT_EQ(list.generation(), expected);
    }
    EXPECT_EQ(values(), (std::vector<size_t>{1, 3, 5, 7, 9}));
}

TEST_F(IndexListTest, FreeListIsLifo) {
    std::vector<Index<size_t>> keys;
    for (size_t i = 0; i < 4; ++i) {
        keys.push_back(list.push_back(i));
    }
    list.remove(keys[1]);
    list.remove(keys[3]);

    // Most recently freed slot first, no growth while free slots remain
    list.push_back(10);
    list.push_back(11);
    EXPECT_EQ(list.slot_count(), 4u);
    list.push_back(12);
    EXPECT_EQ(list.slot_count(), 5u);
    EXPECT_EQ(values(), (std::vector<size_t>{0, 2, 10, 11, 12}));
}

TEST_F(IndexListTest, PopFrontAndBack) {
    EXPECT_FALSE(list.pop_front().has_value());
    EXPECT_FALSE(list.pop_back().has_value());

    for (size_t i = 1; i <= 4; ++i) {
        list.push_back(i);
    }
    EXPECT_EQ(list.pop_front(), std::optional<size_t>(1));
    EXPECT_EQ(list.pop_back(), std::optional<size_t>(4));
    EXPECT_EQ(list.generation(), 2u);
    EXPECT_EQ(values(), (std::vector<size_t>{2, 3}));
    EXPECT_EQ(list.pop_front(), std::optional<size_t>(2));
    EXPECT_EQ(list.pop_front(), std::optional<size_t>(3));
    EXPECT_TRUE(list.empty());
    EXPECT_EQ(list.head(), nullptr);
    EXPECT_EQ(list.tail(), nullptr);
}

// ============= Move semantics =============

TEST_F(IndexListTest, MoveLeavesSourceEmpty) {
    Index<size_t> key = list.push_back(1);
    list.push_back(2);

    IndexList<size_t> moved(std::move(list));
    EXPECT_EQ(*moved.get(key), 1u);
    EXPECT_EQ(moved.size(), 2u);

    EXPECT_TRUE(list.empty());
    EXPECT_EQ(list.slot_count(), 0u);
    EXPECT_EQ(list.head(), nullptr);
    EXPECT_EQ(list.get(key), nullptr);

    // The moved-from list is still usable
    list.push_back(5);
    EXPECT_EQ(*list.head(), 5u);
    // Slot 0 is occupied again, but not by the value key named
    EXPECT_EQ(list.get(key), nullptr);
    EXPECT_FALSE(list.remove(key).has_value());

    list = std::move(moved);
    EXPECT_EQ(values(), (std::vector<size_t>{1, 2}));
    EXPECT_EQ(*list.get(key), 1u);
    EXPECT_TRUE(moved.empty());
    EXPECT_TRUE(moved.check_invariants());

    Index<size_t> reused = moved.push_back(9);
    EXPECT_EQ(moved.get(key), nullptr);
    EXPECT_EQ(*moved.get(reused), 9u);
    EXPECT_TRUE(moved.check_invariants());
}

TEST_F(IndexListTest, IntoIterSourceHandlesStayStale) {
    Index<size_t> key = list.push_back(1);
    {
        ForwardIntoIter<size_t> drain = std::move(list).into_iter();
        EXPECT_EQ(drain.next(), std::optional<size_t>(1));
    }
    list.push_back(2);
    EXPECT_EQ(list.get(key), nullptr);
}

// ============= Throwing moves =============

namespace {

    // Move fails for negative values, or for every value while failMoves is set
    struct Brittle {
        static inline bool failMoves = false;

        explicit Brittle(int v) : value(v) {}
        Brittle(const Brittle&) = default;
        Brittle(Brittle&& o) : value(o.value) {
            if (value < 0 || failMoves) {
                throw std::runtime_error("move failed");
            }
        }
        Brittle& operator=(const Brittle&) = default;

        int value;
    };

}

class IndexListThrowingMoveTest : public ::testing::Test {
protected:
    void TearDown() override {
        Brittle::failMoves = false;
        EXPECT_TRUE(list.check_invariants());
    }

    std::vector<int> values() const {
        std::vector<int> out;
        list.for_each([&](const Brittle& b) { out.push_back(b.value); });
        return out;
    }

    IndexList<Brittle> list{8};
};

TEST_F(IndexListThrowingMoveTest, InsertIntoRecycledSlot) {
    Index<Brittle> k1 = list.emplace_back(1);
    list.emplace_back(2);
    ASSERT_TRUE(list.remove(k1).has_value());

    EXPECT_THROW(list.emplace_back(-1), std::runtime_error);
    EXPECT_TRUE(list.check_invariants());
    EXPECT_EQ(list.size(), 1u);
    EXPECT_EQ(values(), (std::vector<int>{2}));

    // The free slot survived and is handed out next
    Index<Brittle> k3 = list.emplace_back(3);
    EXPECT_EQ(list.slot_count(), 2u);
    EXPECT_EQ(list.get(k3)->value, 3);
    EXPECT_EQ(values(), (std::vector<int>{2, 3}));
}

TEST_F(IndexListThrowingMoveTest, InsertIntoNewSlot) {
    list.emplace_back(1);
    EXPECT_THROW(list.emplace_front(-1), std::runtime_error);
    EXPECT_EQ(list.slot_count(), 1u);
    EXPECT_EQ(list.size(), 1u);

    list.emplace_front(0);
    EXPECT_EQ(values(), (std::vector<int>{0, 1}));
}

TEST_F(IndexListThrowingMoveTest, Remove) {
    list.emplace_back(1);
    Index<Brittle> k2 = list.emplace_back(2);
    list.emplace_back(3);
    const size_t gen = list.generation();

    Brittle::failMoves = true;
    EXPECT_THROW(list.remove(k2), std::runtime_error);
    Brittle::failMoves = false;

    EXPECT_TRUE(list.check_invariants());
    EXPECT_EQ(list.generation(), gen);
    EXPECT_TRUE(list.contains(k2));
    EXPECT_EQ(values(), (std::vector<int>{1, 2, 3}));

    std::optional<Brittle> removed = list.remove(k2);
    ASSERT_TRUE(removed.has_value());
    EXPECT_EQ(removed->value, 2);
    EXPECT_EQ(values(), (std::vector<int>{1, 3}));
}
