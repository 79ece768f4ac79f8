/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 *
 * The seekbuf project is free software: you can redistribute it
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

namespace seekbuf {

    /**
     * Routes the process logger to a file for the lifetime of the manager.
     * The previous sink (stderr) is restored on destruction.
     */
    class LogManager {
    public:

        explicit LogManager(const string& logpath, bool append = true) : _file(0) {
            start(logpath, append);
        }

        ~LogManager() {
            stop();
        }

        LogManager(const LogManager&) = delete;
        LogManager& operator=(const LogManager&) = delete;

        const string& path() const { return _path; }

        void stop() {
            if ( !_file )
                return;
            Logger::setLogFile(nullptr); // after this point no thread will be using the file
            fclose( _file );
            _file = 0;
        }

    private:
        void start( const string& lp, bool append ) {
            boost::filesystem::path p(lp);
            if (boost::filesystem::is_directory(p)) {
                throw std::runtime_error("logpath [" + lp + "] should be a file name not a directory");
            }

            bool exists = boost::filesystem::exists(p);

            FILE* f = fopen( lp.c_str(), append ? "a" : "w" );
            if ( !f ) {
                throw std::runtime_error("can't open [" + lp + "] for log file: " + errnoWithDescription());
            }

            if (append && exists) {
                const string msg = "\n\n***** LOG REOPENED *****\n\n\n";
                if (fwrite(msg.data(), 1, msg.size(), f) != msg.size()) {
                    int x = errno;
                    fclose(f);
                    throw std::runtime_error("can't write to log file [" + lp + "]: " + errnoWithDescription(x));
                }
            }

            _path = lp;
            _file = f;
            Logger::setLogFile(f);
        }

        string _path;
        FILE *_file;
    };
}
