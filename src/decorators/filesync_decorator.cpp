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

#include "filesync_decorator.h"
#include "../errors.h"
#include "../util/log.h"
#include <algorithm>
#include <cerrno>
#include <limits>
#include <stdexcept>
#include <sys/types.h>

namespace seekbuf {

using persist::FSResult;
using persist::PlatformFS;

FileSyncDecorator::FileSyncDecorator(std::unique_ptr<SeekableBuffer> buffer,
                                     const BufferConfig& config)
    : buffer_(std::move(buffer)), config_(config) {
    if (!buffer_) {
        throw std::invalid_argument("FileSyncDecorator requires a buffer");
    }
    if (!config_.validate()) {
        throw std::invalid_argument("FileSyncDecorator: invalid BufferConfig");
    }
}

FileSyncDecorator::~FileSyncDecorator() {
    close_handle_noexcept();
}

void FileSyncDecorator::close_handle_noexcept() {
    if (!file_.is_open()) {
        return;
    }
    std::string p = file_.path;
    FSResult r = file_.close();
    if (!r.ok) {
        warning() << "[FileSync] closing " << p << " failed: " << errnoWithDescription(r.err);
    }
}

void FileSyncDecorator::enable_sync(const std::string& path) {
    if (file_.is_open()) {
        // switching targets (or reopening the same one) starts from scratch
        close_handle_noexcept();
    }
    enabled_ = false;
    path_.clear();
    synced_length_ = 0;

    persist::FileHandle fh;
    FSResult r = PlatformFS::open_rw(path, config_.file_mode, &fh);
    if (!r.ok) {
        error() << "[FileSync] cannot open " << path << ": " << errnoWithDescription(r.err);
        throw IoError("Failed to open sync file", path, r.err);
    }

    r = PlatformFS::truncate_file(fh, 0);
    if (!r.ok) {
        FSResult c = fh.close();
        if (!c.ok) {
            warning() << "[FileSync] closing " << path << " failed: " << errnoWithDescription(c.err);
        }
        throw IoError("Failed to truncate sync file", path, r.err);
    }

    file_ = std::move(fh);
    path_ = path;
    enabled_ = true;
    synced_epoch_ = buffer_->epoch();

    try {
        sync_new_data();
    } catch (const IoError&) {
        close_handle_noexcept();
        enabled_ = false;
        path_.clear();
        synced_length_ = 0;
        throw;
    }

    info() << "[FileSync] mirroring to " << path << " (" << synced_length_ << " bytes)";
}

void FileSyncDecorator::disable_sync() {
    enabled_ = false;
    synced_length_ = 0;
    std::string p = path_;
    path_.clear();

    if (!file_.is_open()) {
        return;
    }

    FSResult r = file_.close();
    if (!r.ok) {
        throw IoError("Failed to close sync file", p, r.err);
    }
    info() << "[FileSync] stopped mirroring to " << p;
}

void FileSyncDecorator::sync() {
    if (!enabled_ || !file_.is_open()) {
        return;
    }
    sync_new_data();
}

void FileSyncDecorator::truncate_mirror() {
    FSResult r = PlatformFS::truncate_file(file_, 0);
    if (!r.ok) {
        throw IoError("Failed to truncate sync file", path_, r.err);
    }
    synced_length_ = 0;
}

void FileSyncDecorator::sync_new_data() {
    if (!enabled_ || !file_.is_open()) {
        return;
    }

    uint64_t epoch = buffer_->epoch();
    size_t total = buffer_->size();

    if (epoch != synced_epoch_ || total < synced_length_) {
        // bytes already in the file were discarded or replaced underneath us
        trace() << "[FileSync] epoch " << synced_epoch_ << " -> " << epoch
                << ", rewriting " << path_;
        truncate_mirror();
    }

    if (synced_length_ < total) {
        auto [pos_r, pos] = PlatformFS::tell(file_);
        if (!pos_r.ok) {
            throw IoError("Failed to query sync file position", path_, pos_r.err);
        }

        std::vector<uint8_t> data = buffer_->bytes();
        size_t written = 0;
        FSResult r = PlatformFS::pwrite_all(file_, data.data() + synced_length_,
                                            data.size() - synced_length_,
                                            synced_length_, &written);
        synced_length_ += written;
        if (!r.ok) {
            throw IoError("Failed to write sync file", path_, r.err);
        }

        // positioned writes leave the handle where seek/rewind put it
        r = PlatformFS::seek(file_, pos);
        if (!r.ok) {
            throw IoError("Failed to restore sync file position", path_, r.err);
        }

        trace() << "[FileSync] synced " << written << " bytes to " << path_
                << " (total " << synced_length_ << ")";
    }

    if (config_.durable_sync) {
        FSResult r = PlatformFS::flush_file(file_);
        if (!r.ok) {
            throw IoError("Failed to flush sync file", path_, r.err);
        }
    }

    synced_epoch_ = epoch;
}

size_t FileSyncDecorator::write(const void* data, size_t len) {
    size_t n = buffer_->write(data, len);
    try {
        sync_new_data();
    } catch (const IoError& e) {
        error() << "[FileSync] write of " << n << " bytes kept in memory, mirror behind: " << e.what();
        throw SyncError(e, n);
    }
    return n;
}

void FileSyncDecorator::append(const void* data, size_t len) {
    buffer_->append(data, len);
    try {
        sync_new_data();
    } catch (const IoError& e) {
        error() << "[FileSync] append of " << len << " bytes kept in memory, mirror behind: " << e.what();
        throw SyncError(e, len);
    }
}

void FileSyncDecorator::position_handle(uint64_t offset) {
    // lseek takes a signed off_t
    uint64_t limit = static_cast<uint64_t>(std::numeric_limits<off_t>::max());
    uint64_t target = std::min(offset, limit);

    FSResult r = PlatformFS::seek(file_, target);
    if (!r.ok && r.err == EINVAL && target > synced_length_) {
        // beyond what this filesystem can address; park at the mirrored end
        trace() << "[FileSync] offset " << offset << " not addressable in " << path_
                << ", handle parked at " << synced_length_;
        r = PlatformFS::seek(file_, synced_length_);
    }
    if (!r.ok) {
        throw IoError("Failed to seek sync file", path_, r.err);
    }
}

void FileSyncDecorator::seek(size_t offset) {
    if (enabled_ && file_.is_open()) {
        position_handle(offset);
    }
    buffer_->seek(offset);
}

void FileSyncDecorator::rewind() {
    if (enabled_ && file_.is_open()) {
        position_handle(0);
    }
    buffer_->rewind();
}

uint64_t FileSyncDecorator::file_position() const {
    if (!enabled_ || !file_.is_open()) {
        return 0;
    }
    auto [r, pos] = PlatformFS::tell(file_);
    if (!r.ok) {
        throw IoError("Failed to query sync file position", path_, r.err);
    }
    return pos;
}

void FileSyncDecorator::reset() {
    buffer_->reset();
    if (enabled_ && file_.is_open()) {
        truncate_mirror();
        FSResult r = PlatformFS::seek(file_, 0);
        if (!r.ok) {
            throw IoError("Failed to rewind sync file", path_, r.err);
        }
        synced_epoch_ = buffer_->epoch();
    }
}

void FileSyncDecorator::close() {
    buffer_->close();

    enabled_ = false;
    synced_length_ = 0;
    std::string p = path_;
    path_.clear();

    if (file_.is_open()) {
        FSResult r = file_.close();
        if (!r.ok) {
            throw IoError("Failed to close sync file", p, r.err);
        }
    }
}

} // namespace seekbuf
