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
#include <iostream>
#include <string>
#include "../src/index_list.hpp"
#include "../src/util/log_runtime.h"

using namespace indexlist;
using namespace std;

namespace {

    void printList(const IndexList<string>& list) {
        cout << "  [";
        bool first = true;
        for (const string& s : list) {
            cout << (first ? "" : ", ") << s;
            first = false;
        }
        cout << "] size=" << list.size()
             << " slots=" << list.slot_count()
             << " generation=" << list.generation() << "\n";
    }

}

int main() {
    // INDEXLIST_LOG_LEVEL / INDEXLIST_LOG_ENABLE_FILE / INDEXLIST_LOG_DIR
    LogRuntime::getInstance();

    cout << "=== IndexList Example ===\n\n";

    IndexList<string> orders;

    cout << "Queueing orders at the back...\n";
    Index<string> a = orders.push_back("order-a");
    Index<string> b = orders.push_back("order-b");
    Index<string> c = orders.push_back("order-c");
    printList(orders);

    cout << "\nExpediting an order to the front...\n";
    Index<string> rush = orders.push_front("order-rush");
    printList(orders);

    cout << "\nCancelling " << *orders.get(b) << " by handle...\n";
    optional<string> cancelled = orders.remove(b);
    info() << "cancelled " << *cancelled << " via " << b;
    printList(orders);

    cout << "\nQueueing a new order, it reuses the freed slot...\n";
    Index<string> d = orders.push_back("order-d");
    printList(orders);

    cout << "\nThe cancelled handle " << b << " no longer resolves: "
         << (orders.get(b) ? "still live" : "absent") << "\n";
    cout << "The new handle " << d << " resolves to " << *orders.get(d) << "\n";

    if (string* s = orders.get_mut(a)) {
        *s += " (amended)";
    }
    cout << "head=" << *orders.head() << " tail=" << *orders.tail() << "\n";
    cout << "rush order " << rush << " is " << *orders.get(rush)
         << ", " << c << (orders.contains(c) ? " still queued" : " gone") << "\n";

    cout << "\nDraining the list in order...\n";
    auto drain = std::move(orders).into_iter();
    while (optional<string> next = drain.next()) {
        cout << "  processed " << *next << "\n";
    }

    return 0;
}
