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
#include <chrono>
#include <cstdint>
#include <iostream>
#include <list>
#include <random>
#include <vector>
#include "../src/index_list.hpp"

using namespace indexlist;

namespace {

    struct Order {
        uint64_t id;
        int32_t qty;
    };

    enum class Op { Add, Cancel };

    struct ChurnStep {
        Op op;
        size_t cancel_pos;  // valid when op == Cancel
        Order order;        // valid when op == Add
    };

    // Precomputed add/cancel sequence shared by both containers
    std::vector<ChurnStep> makeChurn(size_t depth, size_t ops, uint64_t seed) {
        std::mt19937_64 rng(seed);
        std::bernoulli_distribution add_bias(0.5);
        std::uniform_int_distribution<int> qty_dist(1, 10);
        std::vector<ChurnStep> steps;
        steps.reserve(ops);
        size_t live = depth;
        for (size_t i = 0; i < ops; ++i) {
            bool do_add = add_bias(rng) || live == 0;
            if (do_add) {
                steps.push_back(ChurnStep{Op::Add, 0, Order{depth + i + 1, qty_dist(rng)}});
                ++live;
            } else {
                std::uniform_int_distribution<size_t> pos(0, live - 1);
                steps.push_back(ChurnStep{Op::Cancel, pos(rng), Order{0, 0}});
                --live;
            }
        }
        return steps;
    }

    double msSince(std::chrono::steady_clock::time_point start) {
        return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();
    }

} // namespace

class IndexListChurnBenchmark : public ::testing::Test {
protected:
    static constexpr size_t kDepth = 32 * 1024;
    static constexpr size_t kOps = 200000;
    static constexpr int kIterateLoops = 200;
};

TEST_F(IndexListChurnBenchmark, ChurnAgainstStdList) {
    const std::vector<ChurnStep> steps = makeChurn(kDepth, kOps, 7);

    // IndexList: handles kept in a swap-remove vector, as an order book would
    IndexList<Order> list(kDepth);
    std::vector<Index<Order>> handles;
    handles.reserve(kDepth * 2);
    for (size_t i = 0; i < kDepth; ++i) {
        handles.push_back(list.push_back(Order{i + 1, 1}));
    }

    auto start = std::chrono::steady_clock::now();
    for (const ChurnStep& step : steps) {
        if (step.op == Op::Add) {
            handles.push_back(list.push_back(step.order));
        } else {
            ASSERT_TRUE(list.remove(handles[step.cancel_pos]).has_value());
            handles[step.cancel_pos] = handles.back();
            handles.pop_back();
        }
    }
    const double list_ms = msSince(start);

    // std::list with stored iterators
    std::list<Order> orders;
    std::vector<std::list<Order>::iterator> iters;
    iters.reserve(kDepth * 2);
    for (size_t i = 0; i < kDepth; ++i) {
        iters.push_back(orders.insert(orders.end(), Order{i + 1, 1}));
    }

    start = std::chrono::steady_clock::now();
    for (const ChurnStep& step : steps) {
        if (step.op == Op::Add) {
            iters.push_back(orders.insert(orders.end(), step.order));
        } else {
            orders.erase(iters[step.cancel_pos]);
            iters[step.cancel_pos] = iters.back();
            iters.pop_back();
        }
    }
    const double std_ms = msSince(start);

    std::cout << "Churn (" << kOps << " ops from depth " << kDepth << ")\n"
              << "  IndexList: " << list_ms << " ms (" << (list_ms * 1e6 / kOps) << " ns/op)\n"
              << "  std::list: " << std_ms << " ms (" << (std_ms * 1e6 / kOps) << " ns/op)\n";

    // Same survivors in the same order
    ASSERT_EQ(list.size(), orders.size());
    auto it = orders.begin();
    for (const Order& o : list) {
        ASSERT_EQ(o.id, it->id);
        ++it;
    }

    // Churn never grows the slot vector past the peak live count
    EXPECT_LE(list.slot_count(), kDepth + kOps);
    EXPECT_TRUE(list.check_invariants());
}

TEST_F(IndexListChurnBenchmark, IterateAgainstStdList) {
    IndexList<Order> list(kDepth);
    std::list<Order> orders;
    for (size_t i = 0; i < kDepth; ++i) {
        list.push_back(Order{i + 1, static_cast<int32_t>(i % 10)});
        orders.push_back(Order{i + 1, static_cast<int32_t>(i % 10)});
    }

    uint64_t list_sum = 0;
    auto start = std::chrono::steady_clock::now();
    for (int loop = 0; loop < kIterateLoops; ++loop) {
        list.for_each([&](const Order& o) { list_sum += static_cast<uint64_t>(o.qty); });
    }
    const double list_ms = msSince(start);

    uint64_t std_sum = 0;
    start = std::chrono::steady_clock::now();
    for (int loop = 0; loop < kIterateLoops; ++loop) {
        for (const Order& o : orders) {
            std_sum += static_cast<uint64_t>(o.qty);
        }
    }
    const double std_ms = msSince(start);

    std::cout << "Iterate (" << kIterateLoops << " traversals of " << kDepth << ")\n"
              << "  IndexList: " << list_ms << " ms\n"
              << "  std::list: " << std_ms << " ms\n";

    EXPECT_EQ(list_sum, std_sum);
}
