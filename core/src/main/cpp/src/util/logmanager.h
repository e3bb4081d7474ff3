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

#include "log.h"

#include <boost/filesystem.hpp>

namespace indexlist {

    /**
     * Owns the log file and routes all Logger output into it.
     * Output returns to stderr when the manager is destroyed.
     */
    class LogManager {
    public:

        explicit LogManager(const string& logdir="", bool append=true) : _enabled(false), _append(append), _file(0) {
            string dir = logdir;
            if(dir.empty()) {
                const char* env = getenv(config::logging::kDirEnvVar);
                dir = env ? env : boost::filesystem::temp_directory_path().string();
            }
            boost::filesystem::path lp = boost::filesystem::path(dir) / config::logging::kLogFileName;
            start(lp.string());
        }

        ~LogManager() {
            if ( _file ) {
                Logger::setLogFile(nullptr);
                fclose( _file );
                _file = 0;
            }
        }

        LogManager(const LogManager&) = delete;
        LogManager& operator=(const LogManager&) = delete;

        const string& path() const { return _path; }

        void start( const string& lp ) {
            bool exists = boost::filesystem::exists(lp);

            if (boost::filesystem::is_directory(lp)) {
                throw std::runtime_error("logpath [" + lp + "] should be a file name not a directory");
            }

            FILE * test = fopen( lp.c_str() , _append ? "a" : "w" );
            if ( ! test ) {
                throw std::runtime_error("can't open [" + lp + "] for log file: " + errnoWithDescription());
            }

            if (_append && exists){
                // two blank lines before and after
                const string msg = "\n\n***** PROCESS RESTARTED *****\n\n\n";
                if (fwrite(msg.data(), 1, msg.size(), test) != msg.size()) {
                    cerr << "can't write restart banner to [" << lp << "]: " << errnoWithDescription() << endl;
                }
            }

            fclose( test );

            _path = lp;
            _enabled = true;
            rotate();
        }

        /**
         * Renames the current log file to a timestamped name and reopens
         * the original path. The first call just opens the file.
         */
        void rotate() {
            if( !_enabled ) {
                cerr << "LogManager not enabled" << endl;
                return;
            }

            if ( _file ) {
                // Rename the (open) existing log file to a timestamped name
                stringstream ss;
                ss << _path << "." << terseCurrentTime( false );
                string s = ss.str();
                if ( rename( _path.c_str() , s.c_str() ) != 0 ) {
                    cerr << "can't rename [" << _path << "] to [" << s << "]: " << errnoWithDescription() << endl;
                }
            }

            FILE* tmp = fopen(_path.c_str(), _append ? "a" : "w");
            if ( !tmp ) {
                throw std::runtime_error("can't open: " + _path + " for log file");
            }

            Logger::setLogFile(tmp); // after this point no thread will be using old file

            if ( _file )
                fclose( _file );

            _file = tmp;    // Save new file for next rotation
        }

    private:
        // UTC timestamp for rotated file names
        static string terseCurrentTime(bool colonsOk=true) {
            struct tm t;
            time_t now = time(0);
            gmtime_r(&now, &t);

            const char* fmt = (colonsOk ? "%Y-%m-%dT%H:%M:%S" : "%Y-%m-%dT%H-%M-%S");
            char buf[32];
            if (strftime(buf, sizeof(buf), fmt, &t) == 0) {
                return "unknown-time";
            }
            return buf;
        }

        bool _enabled;
        string _path;
        bool _append;
        FILE *_file;
    };
}
