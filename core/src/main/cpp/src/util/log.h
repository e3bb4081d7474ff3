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

#include "../pch.h"
#include "../config.h"
#include <cctype>
#include <type_traits>
#include <atomic>
#include <boost/filesystem/path.hpp>

namespace indexlist {

    enum LogLevel {
        LOG_TRACE,    // per-operation detail (stale handles)
        LOG_DEBUG,    // storage growth
        LOG_INFO,     // runtime setup
        LOG_WARNING,
        LOG_ERROR,    // failed invariant checks
        LOG_SEVERE    // corruption, followed by abort
    };

    const char* logLevelToString(LogLevel l);

    /**
     * Per-thread message buffer. A line is collected with operator<< and
     * written out by flush() as "<time> [<thread>] <LEVEL>: <message>".
     */
    class Logger {
    public:
        /**
         * Route every thread's output to f. nullptr goes back to stderr.
         * The caller keeps ownership of f.
         */
        static void setLogFile(FILE* f);

        static Logger& get() {
            Logger* p = tsp.get();
            if (p == nullptr) {
                tsp.reset(p = new Logger());
            }
            return *p;
        }

        void flush();

        static string time_t_to_String(time_t t = time(0)) {
            char buf[26];
            ctime_r(&t, buf);
            buf[24] = 0; // drop ctime's newline
            return buf;
        }

        Logger& setLogLevel(LogLevel l) {
            _level = l;
            return *this;
        }

        Logger& operator<<(const char* x)        { _ss << x; return *this; }
        Logger& operator<<(const string& x)      { _ss << x; return *this; }
        Logger& operator<<(char x)               { _ss << x; return *this; }
        Logger& operator<<(bool x)               { _ss << x; return *this; }
        Logger& operator<<(int x)                { _ss << x; return *this; }
        Logger& operator<<(unsigned x)           { _ss << x; return *this; }
        Logger& operator<<(long x)               { _ss << x; return *this; }
        Logger& operator<<(unsigned long x)      { _ss << x; return *this; }
        Logger& operator<<(long long x)          { _ss << x; return *this; }
        Logger& operator<<(unsigned long long x) { _ss << x; return *this; }
        Logger& operator<<(double x)             { _ss << x; return *this; }
        Logger& operator<<(const void* x)        { _ss << x; return *this; }

        // Paths print unquoted
        template<typename PathType>
        typename std::enable_if<
            std::is_same<PathType, boost::filesystem::path>::value,
            Logger&
        >::type operator<<(const PathType& p) {
            _ss << p.string();
            return *this;
        }

        // Handles and other streamable values
        template<typename T>
        typename std::enable_if<
            !std::is_arithmetic<T>::value &&
            !std::is_same<T, boost::filesystem::path>::value,
            Logger&
        >::type operator<<(const T& x) {
            _ss << x;
            return *this;
        }

    private:
        Logger() : _level(LOG_INFO), _threadName(config::logging::kThreadName) {}

        static boost::mutex sm;
        static FILE* logfile;
        static boost::thread_specific_ptr<Logger> tsp;

        stringstream _ss;
        LogLevel _level;
        string _threadName;
    };

    extern std::atomic<int> logLevel;

    /**
     * Temporary returned by trace() .. severe(). Writes the buffered line
     * when it goes out of scope; a filtered message carries no logger and
     * every insertion is a no-op.
     */
    class LoggerWrapper {
    public:
        __attribute__((always_inline))
        explicit LoggerWrapper(Logger* logger) : logger_(logger) {}

        LoggerWrapper(const LoggerWrapper&) = delete;
        LoggerWrapper& operator=(const LoggerWrapper&) = delete;
        LoggerWrapper(LoggerWrapper&& o) noexcept : logger_(o.logger_) {
            o.logger_ = nullptr;
        }

        ~LoggerWrapper() {
            if (logger_) {
                (*logger_) << '\n';
                logger_->flush();
            }
        }

        template<typename T>
        __attribute__((always_inline))
        LoggerWrapper& operator<<(const T& value) {
            if (logger_) {
                (*logger_) << value;
            }
            return *this;
        }

    private:
        Logger* logger_;
    };

    __attribute__((always_inline))
    inline LoggerWrapper logAt(LogLevel l) {
        if (l < logLevel.load(std::memory_order_relaxed)) {
            return LoggerWrapper(nullptr);
        }
        return LoggerWrapper(&Logger::get().setLogLevel(l));
    }

    inline LoggerWrapper trace()   { return logAt(LOG_TRACE); }
    inline LoggerWrapper debug()   { return logAt(LOG_DEBUG); }
    inline LoggerWrapper info()    { return logAt(LOG_INFO); }
    inline LoggerWrapper warning() { return logAt(LOG_WARNING); }
    inline LoggerWrapper warn()    { return logAt(LOG_WARNING); }
    inline LoggerWrapper error()   { return logAt(LOG_ERROR); }
    inline LoggerWrapper severe()  { return logAt(LOG_SEVERE); }

    inline string errnoWithDescription(int x = errno) {
        stringstream s;
        s << "errno:" << x << ' ' << strerror(x);
        return s.str();
    }

    /**
     * Parse a level name (case-insensitive). WARN and FATAL are accepted
     * as aliases of WARNING and SEVERE.
     */
    inline bool parseLogLevel(const string& name, LogLevel& out) {
        static const struct { const char* name; LogLevel level; } kNames[] = {
            {"TRACE", LOG_TRACE}, {"DEBUG", LOG_DEBUG}, {"INFO", LOG_INFO},
            {"WARNING", LOG_WARNING}, {"WARN", LOG_WARNING},
            {"ERROR", LOG_ERROR}, {"SEVERE", LOG_SEVERE}, {"FATAL", LOG_SEVERE},
        };
        string upper(name);
        for (char& c : upper) {
            c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
        }
        for (const auto& entry : kNames) {
            if (upper == entry.name) {
                out = entry.level;
                return true;
            }
        }
        return false;
    }

    inline bool setLogLevelFromString(const string& name) {
        LogLevel level;
        if (!parseLogLevel(name, level)) {
            return false;
        }
        logLevel.store(level, std::memory_order_relaxed);
        return true;
    }

    // Applies INDEXLIST_LOG_LEVEL when set; a bad value is reported and ignored
    inline void initLoggingFromEnv() {
        const char* env_level = std::getenv(config::logging::kLevelEnvVar);
        if (env_level && !setLogLevelFromString(env_level)) {
            std::cerr << "Warning: Invalid " << config::logging::kLevelEnvVar << " '" << env_level
                      << "'. Valid levels: TRACE, DEBUG, INFO, WARNING, ERROR, SEVERE\n";
        }
    }

}
