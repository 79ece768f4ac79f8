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
#include <cstdint>
#include <vector>

namespace seekbuf {

    /**
     * Byte buffer with independent read and write offsets.
     *
     * write() overwrites at the write offset and grows the buffer when the
     * data runs past the end; append() always adds at the end. Reads are
     * strict: a read either fills the whole destination or throws
     * std::out_of_range and leaves the read offset where it was.
     *
     * Not a SeekableBuffer and not thread-safe.
     */
    class RandomBuffer final {
    public:
        RandomBuffer() = default;
        explicit RandomBuffer(std::vector<uint8_t> src);

        static RandomBuffer with_capacity(size_t capacity);

        void write(const void* data, size_t len);
        void append(const void* data, size_t len);

        // throws std::out_of_range when fewer than len bytes are unread
        void read(void* dst, size_t len);

        // Both throw std::out_of_range for offsets past size()
        void seek(size_t offset);
        void seek_write(size_t offset);
        void rewind() { read_offset_ = 0; }

        size_t size() const { return buffer_.size(); }
        size_t unread_length() const { return buffer_.size() - read_offset_; }
        size_t capacity() const { return buffer_.capacity(); }
        size_t read_offset() const { return read_offset_; }
        size_t write_offset() const { return write_offset_; }

        // bytes from the read offset to the end
        std::vector<uint8_t> unread_bytes() const;

    private:
        std::vector<uint8_t> buffer_;
        size_t read_offset_ = 0;   // never past buffer_.size()
        size_t write_offset_ = 0;
    };

} // namespace seekbuf
