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
#include "log.h"

namespace indexlist {

    std::atomic<int> logLevel{LOG_WARNING};
    boost::mutex Logger::sm;
    FILE* Logger::logfile = nullptr;
    boost::thread_specific_ptr<Logger> Logger::tsp;

    const char* logLevelToString(LogLevel l) {
        switch (l) {
        case LOG_TRACE:   return "TRACE";
        case LOG_DEBUG:   return "DEBUG";
        case LOG_INFO:    return "INFO";
        case LOG_WARNING: return "WARNING";
        case LOG_ERROR:   return "ERROR";
        case LOG_SEVERE:  return "SEVERE";
        }
        return "UNKNOWN";
    }

    void Logger::flush() {
        ostringstream line;
        line << time_t_to_String() << " [" << _threadName << "] "
             << logLevelToString(_level) << ": " << _ss.str();
        const string out = line.str();
        _ss.str("");

        boost::mutex::scoped_lock lk(sm);
        FILE* f = logfile ? logfile : stderr;
        if (fputs(out.c_str(), f) < 0) {
            int x = errno;
            cerr << "Failed to write to logfile: " << errnoWithDescription(x) << ": " << out << endl;
            return;
        }
        fflush(f);
    }

    void Logger::setLogFile(FILE* f) {
        boost::mutex::scoped_lock lk(sm);
        logfile = f;
    }
}
