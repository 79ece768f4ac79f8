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

#include "transaction_decorator.h"
#include "../errors.h"
#include "../util/log.h"
#include <stdexcept>

namespace seekbuf {

TransactionDecorator::TransactionDecorator(std::unique_ptr<SeekableBuffer> buffer)
    : buffer_(std::move(buffer)) {
    if (!buffer_) {
        throw std::invalid_argument("TransactionDecorator requires a buffer");
    }
}

namespace {

    // Replace the working copy with a snapshot taken earlier
    void restore(SeekBuffer& working, std::vector<uint8_t> content, size_t offset) {
        working = SeekBuffer(std::move(content));
        working.seek(offset);
    }

}

void TransactionDecorator::begin() {
    if (!active_) {
        orig_buffer_ = buffer_->bytes();
        orig_offset_ = buffer_->offset();

        restore(tx_, orig_buffer_, orig_offset_);

        active_ = true;
        level_ = 1;
    } else {
        savepoints_.push_back(Savepoint{tx_.bytes(), tx_.offset(), level_});
        level_++;
    }

    trace() << "[TX] begin level=" << level_ << " size=" << tx_.size();
}

void TransactionDecorator::commit() {
    if (!active_) {
        throw NoActiveTransaction();
    }

    if (level_ > 1) {
        // child edits already live in the working copy
        savepoints_.pop_back();
        level_--;
        trace() << "[TX] nested commit, level now " << level_;
        return;
    }

    level_ = 0;
    active_ = false;
    savepoints_.clear();
    orig_buffer_.clear();

    std::vector<uint8_t> data = tx_.bytes();
    size_t offset = tx_.offset();
    tx_.close();

    buffer_->reset();
    if (!data.empty()) {
        buffer_->write(data.data(), data.size());
    }
    buffer_->seek(offset);

    debug() << "[TX] committed " << data.size() << " bytes, offset " << offset;
}

void TransactionDecorator::rollback() {
    if (!active_) {
        throw NoActiveTransaction();
    }

    discards_++;

    if (level_ > 1) {
        Savepoint& sp = savepoints_.back();
        restore(tx_, std::move(sp.buffer), sp.offset);
        savepoints_.pop_back();
        level_--;
        trace() << "[TX] nested rollback, level now " << level_;
        return;
    }

    debug() << "[TX] rolled back to " << orig_buffer_.size() << " bytes, offset " << orig_offset_;

    tx_.close();
    orig_buffer_.clear();

    level_ = 0;
    active_ = false;
    savepoints_.clear();
}

size_t TransactionDecorator::write(const void* data, size_t len) {
    return active_ ? tx_.write(data, len) : buffer_->write(data, len);
}

void TransactionDecorator::append(const void* data, size_t len) {
    if (active_) {
        tx_.append(data, len);
        return;
    }
    buffer_->append(data, len);
}

ReadResult TransactionDecorator::read(void* dst, size_t len) {
    return active_ ? tx_.read(dst, len) : buffer_->read(dst, len);
}

ReadUntilResult TransactionDecorator::read_until(uint8_t delim) {
    return active_ ? tx_.read_until(delim) : buffer_->read_until(delim);
}

void TransactionDecorator::seek(size_t offset) {
    if (active_) {
        tx_.seek(offset);
    } else {
        buffer_->seek(offset);
    }
}

void TransactionDecorator::rewind() {
    if (active_) {
        tx_.rewind();
    } else {
        buffer_->rewind();
    }
}

size_t TransactionDecorator::unread_length() const {
    return active_ ? tx_.unread_length() : buffer_->unread_length();
}

std::vector<uint8_t> TransactionDecorator::bytes() const {
    return active_ ? tx_.bytes() : buffer_->bytes();
}

size_t TransactionDecorator::size() const {
    return active_ ? tx_.size() : buffer_->size();
}

size_t TransactionDecorator::offset() const {
    return active_ ? tx_.offset() : buffer_->offset();
}

uint64_t TransactionDecorator::epoch() const {
    return buffer_->epoch() + discards_;
}

void TransactionDecorator::reset() {
    if (active_) {
        tx_.reset();
        discards_++;
        return;
    }
    buffer_->reset();
}

void TransactionDecorator::close() {
    if (!active_) {
        return;
    }
    // discard uncommitted work down to the outermost savepoint
    while (active_) {
        rollback();
    }
    info() << "[TX] closed with an open transaction; uncommitted changes discarded";
}

} // namespace seekbuf
