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

    struct ReadResult {
        size_t n;   // bytes copied into the destination
        bool   eof; // cursor was at or past the end when the call started
    };

    struct ReadUntilResult {
        std::vector<uint8_t> bytes; // includes the delimiter when found
        bool found;                 // false means end-of-data was reached
    };

    // Operation set shared by the base stores and every decorator, so that any
    // implementation can be wrapped by any decorator in any order.
    class SeekableBuffer {
    public:
        virtual ~SeekableBuffer() = default;

        // 1) Mutation (append-only)
        virtual size_t write(const void* data, size_t len) = 0;
        virtual void   append(const void* data, size_t len) = 0;

        // 2) Cursor-relative reads
        virtual ReadResult      read(void* dst, size_t len) = 0;
        virtual ReadUntilResult read_until(uint8_t delim) = 0;

        // 3) Cursor control. Offsets past the end are legal and read as EOF.
        virtual void seek(size_t offset) = 0;
        virtual void rewind() = 0;

        // 4) Observers
        virtual size_t unread_length() const = 0;
        virtual std::vector<uint8_t> bytes() const = 0;  // full content, ignores cursor
        virtual size_t size() const = 0;
        virtual size_t offset() const = 0;

        // Changes whenever bytes previously visible through this layer are
        // discarded or replaced. Appends never change it.
        virtual uint64_t epoch() const = 0;

        // 5) Lifecycle
        // reset() drops content and cursor but leaves the layer usable;
        // close() additionally releases whatever the layer owns.
        virtual void reset() = 0;
        virtual void close() = 0;
    };

} // namespace seekbuf
