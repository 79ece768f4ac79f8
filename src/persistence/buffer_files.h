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
#include <memory>
#include <string>
#include "platform_fs.h"
#include "../seek_buffer.h"
#include "../config.h"

namespace seekbuf {
    namespace persist {

        // Whole-buffer file operations. They read and replace content through
        // the buffer contract but do not take part in transaction or sync
        // bookkeeping; using them on a layer with an active mirror leaves the
        // mirror's synced length stale until its next sync.
        class BufferFiles {
        public:
            // Overwrite (or create) `path` with the full content.
            static FSResult save(const SeekableBuffer& buf, const std::string& path,
                                 mode_t mode = SEEKBUF_DEFAULT_FILE_MODE);

            // Append the full content, creating the file if needed.
            static FSResult append(const SeekableBuffer& buf, const std::string& path,
                                   mode_t mode = SEEKBUF_DEFAULT_FILE_MODE);

            // Append only the bytes between the cursor and the end.
            static FSResult append_unread(const SeekableBuffer& buf, const std::string& path,
                                          mode_t mode = SEEKBUF_DEFAULT_FILE_MODE);

            // Replace the content with the file bytes and rewind. On failure
            // the buffer is left untouched.
            static FSResult load(SeekableBuffer& buf, const std::string& path);

            // New buffer holding the file bytes; throws IoError.
            static std::unique_ptr<SeekBuffer> load_new(const std::string& path);
        };

    }
} // namespace seekbuf::persist
