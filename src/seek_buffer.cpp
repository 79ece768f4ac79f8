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

#include "seek_buffer.h"
#include <algorithm>
#include <cstring>

namespace seekbuf {

SeekBuffer::SeekBuffer(const void* data, size_t len) {
    const uint8_t* p = static_cast<const uint8_t*>(data);
    buffer_.assign(p, p + len);
}

SeekBuffer::SeekBuffer(const std::string& src)
    : buffer_(src.begin(), src.end()) {}

size_t SeekBuffer::write(const void* data, size_t len) {
    append(data, len);
    return len;
}

void SeekBuffer::append(const void* data, size_t len) {
    if (len == 0) return;
    const uint8_t* p = static_cast<const uint8_t*>(data);
    buffer_.insert(buffer_.end(), p, p + len);
}

ReadResult SeekBuffer::read(void* dst, size_t len) {
    if (offset_ >= buffer_.size()) {
        return {0, true};
    }

    size_t n = std::min(len, buffer_.size() - offset_);
    if (n > 0) {
        std::memcpy(dst, buffer_.data() + offset_, n);
    }
    offset_ += n;
    return {n, false};
}

ReadUntilResult SeekBuffer::read_until(uint8_t delim) {
    if (offset_ >= buffer_.size()) {
        return {{}, false};
    }

    auto begin = buffer_.begin() + offset_;
    auto it = std::find(begin, buffer_.end(), delim);
    if (it == buffer_.end()) {
        ReadUntilResult rest{std::vector<uint8_t>(begin, buffer_.end()), false};
        offset_ = buffer_.size();
        return rest;
    }

    ++it; // inclusive of the delimiter
    ReadUntilResult slice{std::vector<uint8_t>(begin, it), true};
    offset_ = static_cast<size_t>(it - buffer_.begin());
    return slice;
}

void SeekBuffer::reset() {
    buffer_.clear();
    offset_ = 0;
    epoch_++;
}

void SeekBuffer::close() {
    // release the storage, not just the size
    std::vector<uint8_t>().swap(buffer_);
    offset_ = 0;
    epoch_++;
}

} // namespace seekbuf
