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

#include "fatal.h"
#include "log.h"

#include <cstdio>
#include <cstdlib>
#if !defined(_WIN32)
#include <execinfo.h>
#include <unistd.h>
#endif

namespace indexlist {

    void list_corrupted(const char* what) {
        severe() << "Corrupted list: " << what;

        std::fprintf(stderr, "Corrupted list: %s\n", what);
#if !defined(_WIN32)
        void* bt[32];
        int n = ::backtrace(bt, 32);
        ::backtrace_symbols_fd(bt, n, STDERR_FILENO);
#endif
        std::abort();
    }

}
