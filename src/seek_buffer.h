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
#include "seekable_buffer.h"
#include <string>
#include <vector>

namespace seekbuf {

    // In-memory byte buffer with a single read cursor. Not thread-safe;
    // see ConcurrentSeekBuffer.
    class SeekBuffer final : public SeekableBuffer {
    public:
        SeekBuffer() = default;
        explicit SeekBuffer(std::vector<uint8_t> src) : buffer_(std::move(src)) {}
        SeekBuffer(const void* data, size_t len);
        explicit SeekBuffer(const std::string& src);

        size_t write(const void* data, size_t len) override;
        void   append(const void* data, size_t len) override;

        ReadResult      read(void* dst, size_t len) override;
        ReadUntilResult read_until(uint8_t delim) override;

        void seek(size_t offset) override { offset_ = offset; }
        void rewind() override { offset_ = 0; }

        size_t unread_length() const override {
            return offset_ < buffer_.size() ? buffer_.size() - offset_ : 0;
        }
        std::vector<uint8_t> bytes() const override { return buffer_; }
        size_t size() const override { return buffer_.size(); }
        size_t offset() const override { return offset_; }
        uint64_t epoch() const override { return epoch_; }

        void reset() override;
        void close() override;

    private:
        std::vector<uint8_t> buffer_;
        size_t offset_ = 0;
        uint64_t epoch_ = 0;
    };

} // namespace seekbuf
