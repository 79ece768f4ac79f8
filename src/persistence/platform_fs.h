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
#include <cstdint>
#include <cstddef>
#include <string>
#include <utility>
#include <vector>
#include <sys/types.h>

namespace seekbuf {
    namespace persist {

        struct FSResult {
            bool ok;
            int err;
        };

        // Open file descriptor plus the path it was opened from.
        struct FileHandle {
            int fd = -1;
            std::string path;

            bool is_open() const { return fd >= 0; }

            // Close the file descriptor if open. The handle is cleared even
            // when close(2) reports an error.
            FSResult close();
        };

        // Thin POSIX layer; every call reports errno through FSResult.
        class PlatformFS {
        public:
            static FSResult open_rw(const std::string& path, mode_t mode, FileHandle* out);

            // Positioned write that handles short writes and EINTR. `written`
            // receives the bytes that reached the file even on failure.
            static FSResult pwrite_all(const FileHandle& fh, const void* buf, size_t len,
                                       uint64_t offset, size_t* written);

            static FSResult truncate_file(const FileHandle& fh, uint64_t size);
            static FSResult seek(const FileHandle& fh, uint64_t offset);
            static std::pair<FSResult, uint64_t> tell(const FileHandle& fh);
            static FSResult flush_file(const FileHandle& fh);

            // Whole-file helpers
            static FSResult write_file(const std::string& path, const void* buf, size_t len,
                                       bool append, mode_t mode);
            static FSResult read_file(const std::string& path, std::vector<uint8_t>* out);
            static std::pair<FSResult, size_t> file_size(const std::string& path);
            static FSResult truncate(const std::string& path, size_t size);
        };

    }
} // namespace seekbuf::persist
