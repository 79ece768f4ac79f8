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

#include "random_buffer.h"
#include <cstring>
#include <stdexcept>
#include <string>

namespace seekbuf {

RandomBuffer::RandomBuffer(std::vector<uint8_t> src)
    : buffer_(std::move(src)), read_offset_(0), write_offset_(buffer_.size()) {}

RandomBuffer RandomBuffer::with_capacity(size_t capacity) {
    RandomBuffer b;
    b.buffer_.reserve(capacity);
    return b;
}

void RandomBuffer::write(const void* data, size_t len) {
    if (len == 0) return;
    size_t end = write_offset_ + len;
    if (end > buffer_.size()) {
        buffer_.resize(end);
    }
    std::memcpy(buffer_.data() + write_offset_, data, len);
    write_offset_ = end;
}

void RandomBuffer::append(const void* data, size_t len) {
    const uint8_t* p = static_cast<const uint8_t*>(data);
    buffer_.insert(buffer_.end(), p, p + len);
    write_offset_ = buffer_.size();
}

void RandomBuffer::read(void* dst, size_t len) {
    size_t avail = buffer_.size() - read_offset_;
    if (len > avail) {
        throw std::out_of_range("not enough bytes to read: need " + std::to_string(len) +
                                " bytes but only " + std::to_string(avail) + " available");
    }
    if (len > 0) {
        std::memcpy(dst, buffer_.data() + read_offset_, len);
    }
    read_offset_ += len;
}

void RandomBuffer::seek(size_t offset) {
    if (offset > buffer_.size()) {
        throw std::out_of_range("seek offset " + std::to_string(offset) +
                                " exceeds buffer length " + std::to_string(buffer_.size()));
    }
    read_offset_ = offset;
}

void RandomBuffer::seek_write(size_t offset) {
    if (offset > buffer_.size()) {
        throw std::out_of_range("write offset " + std::to_string(offset) +
                                " exceeds buffer length " + std::to_string(buffer_.size()));
    }
    write_offset_ = offset;
}

std::vector<uint8_t> RandomBuffer::unread_bytes() const {
    return std::vector<uint8_t>(buffer_.begin() + read_offset_, buffer_.end());
}

} // namespace seekbuf
