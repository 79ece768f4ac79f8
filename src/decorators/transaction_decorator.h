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
#include <vector>
#include "../seekable_buffer.h"
#include "../seek_buffer.h"

namespace seekbuf {

    /**
     * Adds Begin/Commit/Rollback on top of any SeekableBuffer.
     *
     * While a transaction is open every operation works on a private copy of
     * the wrapped content; the wrapped layer only sees the result of the
     * outermost commit, which resets it and rewrites the whole copy. Nested
     * Begin calls push a savepoint that the matching Rollback restores.
     *
     * The decorator owns the wrapped layer but close() never closes it; that
     * happens when the decorator is destroyed or through wrapped().close().
     */
    class TransactionDecorator final : public SeekableBuffer {
    public:
        explicit TransactionDecorator(std::unique_ptr<SeekableBuffer> buffer);

        void begin();
        void commit();    // throws NoActiveTransaction
        void rollback();  // throws NoActiveTransaction

        bool in_transaction() const { return active_; }
        int  transaction_level() const { return active_ ? level_ : 0; }

        SeekableBuffer& wrapped() { return *buffer_; }
        const SeekableBuffer& wrapped() const { return *buffer_; }

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
        struct Savepoint {
            std::vector<uint8_t> buffer;
            size_t offset;
            int level;
        };

        std::unique_ptr<SeekableBuffer> buffer_;

        bool active_ = false;
        int  level_ = 0;

        SeekBuffer tx_;                    // working copy and cursor

        std::vector<uint8_t> orig_buffer_; // wrapped state at the outermost begin
        size_t orig_offset_ = 0;

        std::vector<Savepoint> savepoints_;

        // bumped on every rollback and on reset inside a transaction
        uint64_t discards_ = 0;
    };

} // namespace seekbuf
