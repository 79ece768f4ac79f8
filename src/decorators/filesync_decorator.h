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
#include "../seekable_buffer.h"
#include "../buffer_config.h"
#include "../persistence/platform_fs.h"

namespace seekbuf {

    /**
     * Mirrors the wrapped buffer into a file.
     *
     * Only the unsynced tail is written after each write/append, at the
     * synced length rather than at the handle's position, so the handle can
     * follow the buffer cursor on seek/rewind. When the wrapped layer reports
     * a new epoch (reset, commit, rollback underneath) the mirrored bytes are
     * stale and the file is rewritten from the start.
     *
     * Invariant at quiescent points: file bytes == bytes()[0, synced_length).
     */
    class FileSyncDecorator final : public SeekableBuffer {
    public:
        explicit FileSyncDecorator(std::unique_ptr<SeekableBuffer> buffer,
                                   const BufferConfig& config = BufferConfig::defaults());
        ~FileSyncDecorator() override;

        FileSyncDecorator(const FileSyncDecorator&) = delete;
        FileSyncDecorator& operator=(const FileSyncDecorator&) = delete;

        // Throws IoError; sync stays disabled on failure.
        void enable_sync(const std::string& path);
        void disable_sync();

        // Catch-up sync of whatever the wrapped layer holds now. Needed after
        // changing an inner layer directly (e.g. rolling back a transaction
        // wrapped by this decorator). Throws IoError.
        void sync();

        bool is_sync_enabled() const { return enabled_; }
        const std::string& sync_path() const { return path_; }
        size_t synced_length() const { return synced_length_; }

        // Current position of the sync file handle; 0 while sync is off.
        // Throws IoError.
        uint64_t file_position() const;

        SeekableBuffer& wrapped() { return *buffer_; }
        const SeekableBuffer& wrapped() const { return *buffer_; }

        // Throw SyncError when the mirror could not catch up.
        size_t write(const void* data, size_t len) override;
        void   append(const void* data, size_t len) override;

        ReadResult      read(void* dst, size_t len) override { return buffer_->read(dst, len); }
        ReadUntilResult read_until(uint8_t delim) override { return buffer_->read_until(delim); }

        void seek(size_t offset) override;
        void rewind() override;

        size_t unread_length() const override { return buffer_->unread_length(); }
        std::vector<uint8_t> bytes() const override { return buffer_->bytes(); }
        size_t size() const override { return buffer_->size(); }
        size_t offset() const override { return buffer_->offset(); }
        uint64_t epoch() const override { return buffer_->epoch(); }

        void reset() override;
        void close() override;

    private:
        void sync_new_data();
        void truncate_mirror();
        void close_handle_noexcept();
        void position_handle(uint64_t offset);

        std::unique_ptr<SeekableBuffer> buffer_;
        BufferConfig config_;

        persist::FileHandle file_;
        std::string path_;
        bool enabled_ = false;
        size_t synced_length_ = 0;
        uint64_t synced_epoch_ = 0;
    };

} // namespace seekbuf
