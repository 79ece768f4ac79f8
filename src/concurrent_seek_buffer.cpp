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

#include "concurrent_seek_buffer.h"

namespace seekbuf {

size_t ConcurrentSeekBuffer::write(const void* data, size_t len) {
    std::lock_guard<std::mutex> lock(mu_);
    return inner_.write(data, len);
}

void ConcurrentSeekBuffer::append(const void* data, size_t len) {
    std::lock_guard<std::mutex> lock(mu_);
    inner_.append(data, len);
}

ReadResult ConcurrentSeekBuffer::read(void* dst, size_t len) {
    std::lock_guard<std::mutex> lock(mu_);
    return inner_.read(dst, len);
}

ReadUntilResult ConcurrentSeekBuffer::read_until(uint8_t delim) {
    std::lock_guard<std::mutex> lock(mu_);
    return inner_.read_until(delim);
}

void ConcurrentSeekBuffer::seek(size_t offset) {
    std::lock_guard<std::mutex> lock(mu_);
    inner_.seek(offset);
}

void ConcurrentSeekBuffer::rewind() {
    std::lock_guard<std::mutex> lock(mu_);
    inner_.rewind();
}

size_t ConcurrentSeekBuffer::unread_length() const {
    std::lock_guard<std::mutex> lock(mu_);
    return inner_.unread_length();
}

std::vector<uint8_t> ConcurrentSeekBuffer::bytes() const {
    std::lock_guard<std::mutex> lock(mu_);
    return inner_.bytes();
}

size_t ConcurrentSeekBuffer::size() const {
    std::lock_guard<std::mutex> lock(mu_);
    return inner_.size();
}

size_t ConcurrentSeekBuffer::offset() const {
    std::lock_guard<std::mutex> lock(mu_);
    return inner_.offset();
}

uint64_t ConcurrentSeekBuffer::epoch() const {
    std::lock_guard<std::mutex> lock(mu_);
    return inner_.epoch();
}

void ConcurrentSeekBuffer::reset() {
    std::lock_guard<std::mutex> lock(mu_);
    inner_.reset();
}

void ConcurrentSeekBuffer::close() {
    std::lock_guard<std::mutex> lock(mu_);
    inner_.close();
}

} // namespace seekbuf
