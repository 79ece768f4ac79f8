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

#include "buffer_files.h"
#include "../errors.h"
#include "../util/log.h"

namespace seekbuf {
namespace persist {

FSResult BufferFiles::save(const SeekableBuffer& buf, const std::string& path, mode_t mode) {
    std::vector<uint8_t> data = buf.bytes();
    FSResult r = PlatformFS::write_file(path, data.data(), data.size(), false, mode);
    if (!r.ok) {
        warning() << "[BufferFiles] save to " << path << " failed: " << errnoWithDescription(r.err);
    }
    return r;
}

FSResult BufferFiles::append(const SeekableBuffer& buf, const std::string& path, mode_t mode) {
    std::vector<uint8_t> data = buf.bytes();
    FSResult r = PlatformFS::write_file(path, data.data(), data.size(), true, mode);
    if (!r.ok) {
        warning() << "[BufferFiles] append to " << path << " failed: " << errnoWithDescription(r.err);
    }
    return r;
}

FSResult BufferFiles::append_unread(const SeekableBuffer& buf, const std::string& path, mode_t mode) {
    std::vector<uint8_t> data = buf.bytes();
    size_t from = buf.offset();
    if (from >= data.size()) {
        // nothing unread; still create the file like append() would
        return PlatformFS::write_file(path, nullptr, 0, true, mode);
    }
    FSResult r = PlatformFS::write_file(path, data.data() + from, data.size() - from, true, mode);
    if (!r.ok) {
        warning() << "[BufferFiles] append_unread to " << path << " failed: " << errnoWithDescription(r.err);
    }
    return r;
}

FSResult BufferFiles::load(SeekableBuffer& buf, const std::string& path) {
    std::vector<uint8_t> data;
    FSResult r = PlatformFS::read_file(path, &data);
    if (!r.ok) {
        return r;
    }

    buf.reset();
    if (!data.empty()) {
        buf.write(data.data(), data.size());
    }
    buf.rewind();

    debug() << "[BufferFiles] loaded " << data.size() << " bytes from " << path;
    return r;
}

std::unique_ptr<SeekBuffer> BufferFiles::load_new(const std::string& path) {
    std::vector<uint8_t> data;
    FSResult r = PlatformFS::read_file(path, &data);
    if (!r.ok) {
        throw IoError("Failed to load buffer from file", path, r.err);
    }
    return std::make_unique<SeekBuffer>(std::move(data));
}

} // namespace persist
} // namespace seekbuf
