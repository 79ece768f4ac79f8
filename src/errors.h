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
#include <cstddef>
#include <stdexcept>
#include <string>
#include <cstring>

namespace seekbuf {

    // Commit or Rollback issued while no transaction is open.
    class NoActiveTransaction : public std::logic_error {
    public:
        NoActiveTransaction()
            : std::logic_error("no transaction in progress") {}
    };

    // Filesystem failure while mirroring a buffer to a file.
    class IoError : public std::runtime_error {
    public:
        IoError(const std::string& what, const std::string& path, int err)
            : std::runtime_error(what + " [" + path + "]: " + std::strerror(err)),
              path_(path), err_(err) {}

        const std::string& path() const noexcept { return path_; }
        int error_code() const noexcept { return err_; }

    private:
        std::string path_;
        int err_;
    };

    // The in-memory mutation succeeded but the file catch-up did not.
    // The accepted bytes stay in the buffer and are retried on the next sync.
    class SyncError : public IoError {
    public:
        SyncError(const IoError& cause, size_t bytes_accepted)
            : IoError(cause), bytes_accepted_(bytes_accepted) {}

        size_t bytes_accepted() const noexcept { return bytes_accepted_; }

    private:
        size_t bytes_accepted_;
    };

} // namespace seekbuf
