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
#include "seek_buffer.h"
#include <mutex>

namespace seekbuf {

    // SeekBuffer guarded by one mutex per call. Each call is atomic on its
    // own; a seek followed by a read from two threads may still interleave.
    class ConcurrentSeekBuffer final : public SeekableBuffer {
    public:
        ConcurrentSeekBuffer() = default;
        explicit ConcurrentSeekBuffer(std::vector<uint8_t> src) : inner_(std::move(src)) {}
        explicit ConcurrentSeekBuffer(const std::string& src) : inner_(src) {}

        size_t write(const void* data, size_t len) override;
        void   append(const void* data, size_t len) override;

        ReadResult      read(void* dst, size_t len) override;
        ReadUntilResult read_until(uint8_t delim) override;

        void seek(size_t offset) override;
        void rewind() override;

        size_t unread_length() const override;
        std::vector<uint8_t> bytes() const override;
        size_t size() const override;
        size_t offset() const override;
        uint64_t epoch() const override;

        void reset() override;
        void close() override;

    private:
        mutable std::mutex mu_;
        SeekBuffer inner_;
    };

} // namespace seekbuf
