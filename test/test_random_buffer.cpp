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

#include <gtest/gtest.h>
#include <stdexcept>
#include <vector>
#include "random_buffer.h"

using namespace seekbuf;

namespace {
    std::vector<uint8_t> bytes(std::initializer_list<uint8_t> l) { return l; }
}

TEST(RandomBufferTest, EmptyBuffer) {
    RandomBuffer buf;
    EXPECT_EQ(buf.unread_length(), 0u);
    EXPECT_EQ(buf.size(), 0u);
    EXPECT_EQ(buf.capacity(), 0u);
    EXPECT_EQ(buf.read_offset(), 0u);
    EXPECT_EQ(buf.write_offset(), 0u);
    EXPECT_TRUE(buf.unread_bytes().empty());
}

TEST(RandomBufferTest, FromExistingBytes) {
    RandomBuffer buf(bytes({1, 2, 3}));
    EXPECT_EQ(buf.unread_length(), 3u);
    EXPECT_EQ(buf.size(), 3u);
    EXPECT_EQ(buf.read_offset(), 0u);
    EXPECT_EQ(buf.write_offset(), 3u);
}

TEST(RandomBufferTest, WithCapacity) {
    RandomBuffer buf = RandomBuffer::with_capacity(10);
    EXPECT_EQ(buf.unread_length(), 0u);
    EXPECT_EQ(buf.size(), 0u);
    EXPECT_GE(buf.capacity(), 10u);
}

TEST(RandomBufferTest, Append) {
    RandomBuffer buf = RandomBuffer::with_capacity(10);
    std::vector<uint8_t> first = bytes({1, 2, 3, 5, 6, 7, 8, 9, 10});
    buf.append(first.data(), first.size());
    EXPECT_EQ(buf.read_offset(), 0u);
    EXPECT_EQ(buf.write_offset(), 9u);

    std::vector<uint8_t> second = bytes({4, 5, 6, 7});
    buf.append(second.data(), second.size());
    EXPECT_EQ(buf.write_offset(), 13u);
    EXPECT_EQ(buf.size(), 13u);
}

TEST(RandomBufferTest, AppendOverCapacity) {
    RandomBuffer buf = RandomBuffer::with_capacity(4);
    std::vector<uint8_t> a = bytes({1, 2, 3});
    std::vector<uint8_t> b = bytes({4, 5, 6, 7});
    buf.append(a.data(), a.size());
    EXPECT_EQ(buf.write_offset(), 3u);
    buf.append(b.data(), b.size());
    EXPECT_EQ(buf.write_offset(), 7u);
    EXPECT_GE(buf.capacity(), 7u);
    EXPECT_EQ(buf.unread_bytes(), bytes({1, 2, 3, 4, 5, 6, 7}));
}

TEST(RandomBufferTest, WriteAdvancesWriteOffset) {
    struct Case {
        size_t write_offset;
        std::vector<uint8_t> data;
    };
    std::vector<Case> cases = {
        {3, bytes({1, 2, 3})},
        {7, bytes({4, 5, 6, 7})},
        {12, bytes({8, 9, 10, 11, 12})},
    };

    RandomBuffer buf = RandomBuffer::with_capacity(3);
    for (const auto& tc : cases) {
        buf.write(tc.data.data(), tc.data.size());
        EXPECT_EQ(buf.write_offset(), tc.write_offset);
        EXPECT_EQ(buf.size(), tc.write_offset);
    }
}

TEST(RandomBufferTest, WriteOverwritesAtWriteOffset) {
    RandomBuffer buf(bytes({1, 2, 3, 4, 5}));
    buf.seek_write(1);
    std::vector<uint8_t> patch = bytes({9, 9});
    buf.write(patch.data(), patch.size());
    EXPECT_EQ(buf.write_offset(), 3u);
    EXPECT_EQ(buf.unread_bytes(), bytes({1, 9, 9, 4, 5}));

    // running past the end grows the buffer
    buf.seek_write(4);
    buf.write(patch.data(), patch.size());
    EXPECT_EQ(buf.unread_bytes(), bytes({1, 9, 9, 4, 9, 9}));

    // append ignores the write offset and moves it to the end
    buf.seek_write(0);
    uint8_t x = 7;
    buf.append(&x, 1);
    EXPECT_EQ(buf.write_offset(), 7u);
    EXPECT_EQ(buf.unread_bytes(), bytes({1, 9, 9, 4, 9, 9, 7}));
}

TEST(RandomBufferTest, StrictRead) {
    RandomBuffer buf(bytes({1, 2, 3}));
    uint8_t dst[2];
    buf.read(dst, 2);
    EXPECT_EQ(dst[0], 1);
    EXPECT_EQ(dst[1], 2);
    EXPECT_EQ(buf.read_offset(), 2u);
    EXPECT_EQ(buf.unread_length(), 1u);

    // too few bytes left: nothing consumed
    EXPECT_THROW(buf.read(dst, 2), std::out_of_range);
    EXPECT_EQ(buf.read_offset(), 2u);

    buf.read(dst, 1);
    EXPECT_EQ(dst[0], 3);
    EXPECT_NO_THROW(buf.read(dst, 0));
    EXPECT_THROW(buf.read(dst, 1), std::out_of_range);
}

TEST(RandomBufferTest, ReadsAreIndependentOfWrites) {
    RandomBuffer buf = RandomBuffer::with_capacity(3);
    std::vector<uint8_t> data = bytes({1, 2, 3});
    buf.write(data.data(), data.size());

    uint8_t dst[2];
    buf.read(dst, 2);
    EXPECT_EQ(buf.write_offset(), 3u);

    buf.rewind();
    EXPECT_EQ(buf.read_offset(), 0u);
    EXPECT_EQ(buf.write_offset(), 3u);
    EXPECT_EQ(buf.unread_bytes(), data);
}

TEST(RandomBufferTest, SeekIsBoundsChecked) {
    RandomBuffer buf(bytes({1, 2, 3, 4}));
    buf.seek(4);
    EXPECT_EQ(buf.unread_length(), 0u);
    EXPECT_TRUE(buf.unread_bytes().empty());

    buf.seek(1);
    EXPECT_EQ(buf.unread_bytes(), bytes({2, 3, 4}));

    EXPECT_THROW(buf.seek(5), std::out_of_range);
    EXPECT_EQ(buf.read_offset(), 1u);

    EXPECT_THROW(buf.seek_write(5), std::out_of_range);
    EXPECT_EQ(buf.write_offset(), 4u);
}
