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
#include "../util/log.h"

namespace seekbuf {

    // Pass-through layer that times every call and writes one log line per
    // operation: "[name] Op: details, duration: Nus". Results are returned
    // unchanged.
    class LoggingDecorator final : public SeekableBuffer {
    public:
        LoggingDecorator(std::unique_ptr<SeekableBuffer> buffer,
                         const std::string& name = std::string(),
                         LogLevel level = LOG_INFO);

        void set_name(const std::string& name) { if (!name.empty()) name_ = name; }
        const std::string& name() const { return name_; }

        void set_level(LogLevel level) { level_ = level; }
        LogLevel level() const { return level_; }

        // total / read / unread byte counts of the wrapped layer
        void log_summary() const;
        void log_message(const std::string& message) const;

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
        size_t size() const override { return buffer_->size(); }
        size_t offset() const override { return buffer_->offset(); }
        uint64_t epoch() const override { return buffer_->epoch(); }

        void reset() override;
        void close() override;

    private:
        std::unique_ptr<SeekableBuffer> buffer_;
        std::string name_;
        LogLevel level_;
    };

} // namespace seekbuf
