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

#include "logging_decorator.h"
#include <chrono>
#include <cstdio>
#include <stdexcept>

namespace seekbuf {

namespace {

    using Clock = std::chrono::steady_clock;

    long long micros_since(Clock::time_point start) {
        return std::chrono::duration_cast<std::chrono::microseconds>(Clock::now() - start).count();
    }

    std::string describe_delim(uint8_t c) {
        char buf[16];
        if (c >= 0x20 && c < 0x7f) {
            std::snprintf(buf, sizeof(buf), "'%c' (0x%02x)", c, c);
        } else {
            std::snprintf(buf, sizeof(buf), "0x%02x", c);
        }
        return buf;
    }

}

LoggingDecorator::LoggingDecorator(std::unique_ptr<SeekableBuffer> buffer,
                                   const std::string& name, LogLevel level)
    : buffer_(std::move(buffer)),
      name_(name.empty() ? BufferConfig::defaults().log_name : name),
      level_(level) {
    if (!buffer_) {
        throw std::invalid_argument("LoggingDecorator requires a buffer");
    }
}

size_t LoggingDecorator::write(const void* data, size_t len) {
    auto start = Clock::now();
    try {
        size_t n = buffer_->write(data, len);
        log(level_) << "[" << name_ << "] Write: " << n << " bytes, duration: "
                    << micros_since(start) << "us";
        return n;
    } catch (const std::exception& e) {
        log(level_) << "[" << name_ << "] Write: " << len << " bytes, error: " << e.what()
                    << ", duration: " << micros_since(start) << "us";
        throw;
    }
}

void LoggingDecorator::append(const void* data, size_t len) {
    auto start = Clock::now();
    try {
        buffer_->append(data, len);
    } catch (const std::exception& e) {
        log(level_) << "[" << name_ << "] Append: " << len << " bytes, error: " << e.what()
                    << ", duration: " << micros_since(start) << "us";
        throw;
    }
    log(level_) << "[" << name_ << "] Append: " << len << " bytes, duration: "
                << micros_since(start) << "us";
}

ReadResult LoggingDecorator::read(void* dst, size_t len) {
    auto start = Clock::now();
    ReadResult r = buffer_->read(dst, len);
    log(level_) << "[" << name_ << "] Read: " << r.n << " bytes" << (r.eof ? ", EOF" : "")
                << ", duration: " << micros_since(start) << "us";
    return r;
}

ReadUntilResult LoggingDecorator::read_until(uint8_t delim) {
    auto start = Clock::now();
    ReadUntilResult r = buffer_->read_until(delim);
    log(level_) << "[" << name_ << "] ReadUntil: delimiter=" << describe_delim(delim)
                << ", read " << r.bytes.size() << " bytes" << (r.found ? "" : ", EOF")
                << ", duration: " << micros_since(start) << "us";
    return r;
}

void LoggingDecorator::seek(size_t offset) {
    auto start = Clock::now();
    buffer_->seek(offset);
    log(level_) << "[" << name_ << "] Seek: moved to offset " << offset
                << ", duration: " << micros_since(start) << "us";
}

void LoggingDecorator::rewind() {
    auto start = Clock::now();
    buffer_->rewind();
    log(level_) << "[" << name_ << "] Rewind: offset reset to 0, duration: "
                << micros_since(start) << "us";
}

size_t LoggingDecorator::unread_length() const {
    auto start = Clock::now();
    size_t n = buffer_->unread_length();
    log(level_) << "[" << name_ << "] Len: " << n << " unread bytes, duration: "
                << micros_since(start) << "us";
    return n;
}

std::vector<uint8_t> LoggingDecorator::bytes() const {
    auto start = Clock::now();
    std::vector<uint8_t> out = buffer_->bytes();
    log(level_) << "[" << name_ << "] Bytes: retrieved " << out.size() << " bytes, duration: "
                << micros_since(start) << "us";
    return out;
}

void LoggingDecorator::reset() {
    auto start = Clock::now();
    buffer_->reset();
    log(level_) << "[" << name_ << "] Reset: duration: " << micros_since(start) << "us";
}

void LoggingDecorator::close() {
    auto start = Clock::now();
    try {
        buffer_->close();
    } catch (const std::exception& e) {
        log(level_) << "[" << name_ << "] Close: error: " << e.what()
                    << ", duration: " << micros_since(start) << "us";
        throw;
    }
    log(level_) << "[" << name_ << "] Close: success, duration: " << micros_since(start) << "us";
}

void LoggingDecorator::log_summary() const {
    size_t total = buffer_->size();
    size_t unread = buffer_->unread_length();
    log(level_) << "[" << name_ << "] Summary: total=" << total << " bytes, read="
                << (total - unread) << " bytes, unread=" << unread << " bytes";
}

void LoggingDecorator::log_message(const std::string& message) const {
    log(level_) << "[" << name_ << "] " << message;
}

} // namespace seekbuf
