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

namespace pollcache {

    /**
     * Owns the process log file. Lines go to stderr until a LogManager is
     * constructed; destroying it hands output back to stderr.
     */
    class LogManager {
    public:

        explicit LogManager(const string& logpath, bool append = true)
            : _path(logpath), _append(append), _file(0) {
            start();
        }

        ~LogManager() {
            Logger::setLogFile(nullptr);
            if ( _file )
                fclose( _file );
        }

        LogManager(const LogManager&) = delete;
        LogManager& operator=(const LogManager&) = delete;

        static string terseCurrentTime(bool colonsOk=true) {
            struct tm t;
            time_t now = time(0);
            gmtime_r(&now, &t);

            const char* fmt = (colonsOk ? "%Y-%m-%dT%H:%M:%S" : "%Y-%m-%dT%H-%M-%S");
            char buf[32];
            if (strftime(buf, sizeof(buf), fmt, &t) == 0)
                return "";
            return buf;
        }

        /**
         * Rename the open log file to a timestamped name and continue
         * logging into a fresh file at the original path.
         */
        void rotate() {
            if ( _file ) {
                stringstream ss;
                ss << _path << "." << terseCurrentTime( false );
                boost::system::error_code ec;
                boost::filesystem::rename( _path, ss.str(), ec );
                if ( ec ) {
                    warning() << "log rotation failed for [" << _path << "]: " << ec.message();
                    return;
                }
            }

            FILE* tmp = fopen( _path.c_str(), _append ? "a" : "w" );
            if ( !tmp ) {
                throw std::runtime_error("LogManager: can't open " + _path + " for log file: "
                                         + errnoWithDescription());
            }

            Logger::setLogFile(tmp); // after this point no thread will be using old file

            if ( _file )
                fclose( _file );
            _file = tmp;
        }

        const string& path() const { return _path; }

    private:
        void start() {
            if ( boost::filesystem::is_directory(_path) ) {
                throw std::invalid_argument("LogManager: logpath [" + _path
                                            + "] should be a file name not a directory");
            }

            bool exists = boost::filesystem::exists(_path);
            boost::filesystem::path parent = boost::filesystem::path(_path).parent_path();
            if ( !parent.empty() )
                boost::filesystem::create_directories(parent);

            rotate_in_place();

            if ( _append && exists ) {
                const string msg = "\n\n***** SERVER RESTARTED *****\n\n\n";
                fwrite(msg.data(), 1, msg.size(), _file);
                fflush(_file);
            }
        }

        // Opens the initial file without renaming anything.
        void rotate_in_place() {
            FILE* tmp = fopen( _path.c_str(), _append ? "a" : "w" );
            if ( !tmp ) {
                throw std::runtime_error("LogManager: can't open " + _path + " for log file: "
                                         + errnoWithDescription());
            }
            _file = tmp;
            Logger::setLogFile(tmp);
        }

        string _path;
        bool _append;
        FILE *_file;
    };
}
