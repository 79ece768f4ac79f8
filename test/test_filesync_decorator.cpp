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
#include <filesystem>
#include <memory>
#include <cerrno>
#include <csignal>
#include <limits>
#include <stdexcept>
#include <sys/resource.h>
#include <sys/stat.h>
#include <unistd.h>
#include "decorators/filesync_decorator.h"
#include "seek_buffer.h"
#include "errors.h"
#include "persistence/test_helpers.h"

using namespace seekbuf;
using namespace seekbuf::persist::test;

class FileSyncDecoratorTest : public ::testing::Test {
protected:
    std::string test_dir;
    std::string test_file;
    SeekBuffer* inner = nullptr;
    std::unique_ptr<FileSyncDecorator> sync;

    void SetUp() override {
        test_dir = "/tmp/seekbuf_filesync_test_" + std::to_string(getpid());
        std::filesystem::create_directories(test_dir);
        test_file = test_dir + "/mirror.dat";
        Init("");
    }

    void TearDown() override {
        sync.reset();
        std::filesystem::remove_all(test_dir);
    }

    void Init(const std::string& initial) {
        auto base = std::make_unique<SeekBuffer>(initial);
        inner = base.get();
        sync = std::make_unique<FileSyncDecorator>(std::move(base));
    }

    std::string file() const { return read_file_string(test_file); }
};

TEST_F(FileSyncDecoratorTest, HelloWorld) {
    sync->enable_sync(test_file);
    EXPECT_TRUE(sync->is_sync_enabled());
    EXPECT_EQ(sync->sync_path(), test_file);

    write_str(*sync, "Hello, ");
    write_str(*sync, "World!");

    EXPECT_EQ(file(), "Hello, World!");
    EXPECT_EQ(contents(*sync), "Hello, World!");
    EXPECT_EQ(sync->synced_length(), 13u);
}

TEST_F(FileSyncDecoratorTest, EnableCopiesExistingContent) {
    Init("already here");
    write_file_string(test_file, "old junk that is longer than the buffer");

    sync->enable_sync(test_file);
    EXPECT_EQ(file(), "already here");
    EXPECT_EQ(sync->synced_length(), 12u);
}

TEST_F(FileSyncDecoratorTest, AppendIsMirrored) {
    sync->enable_sync(test_file);
    append_str(*sync, "abc");
    append_str(*sync, "def");
    EXPECT_EQ(file(), "abcdef");
}

TEST_F(FileSyncDecoratorTest, WritesBeforeEnableAreNotMirrored) {
    write_str(*sync, "memory only");
    EXPECT_FALSE(std::filesystem::exists(test_file));
    EXPECT_EQ(sync->synced_length(), 0u);
}

TEST_F(FileSyncDecoratorTest, SeekKeepsMirrorAppendOnly) {
    sync->enable_sync(test_file);
    write_str(*sync, "0123456789");
    sync->seek(3);
    EXPECT_EQ(read_str(*sync, 2), "34");

    // file handle follows the cursor but new bytes land at the end
    write_str(*sync, "AB");
    EXPECT_EQ(file(), "0123456789AB");

    sync->rewind();
    EXPECT_EQ(sync->offset(), 0u);
    write_str(*sync, "C");
    EXPECT_EQ(file(), "0123456789ABC");
}

TEST_F(FileSyncDecoratorTest, HandleFollowsSeekAndRewind) {
    sync->enable_sync(test_file);
    write_str(*sync, "0123456789");
    EXPECT_EQ(sync->file_position(), 0u);

    sync->seek(3);
    EXPECT_EQ(sync->file_position(), 3u);

    // catch-up writes do not move the handle
    write_str(*sync, "tail");
    EXPECT_EQ(sync->file_position(), 3u);
    EXPECT_EQ(sync->synced_length(), 14u);

    sync->seek(20);
    EXPECT_EQ(sync->file_position(), 20u);

    sync->rewind();
    EXPECT_EQ(sync->file_position(), 0u);
    EXPECT_EQ(sync->offset(), 0u);
}

TEST_F(FileSyncDecoratorTest, FilePositionZeroWhileDisabled) {
    write_str(*sync, "abc");
    sync->seek(2);
    EXPECT_EQ(sync->file_position(), 0u);
}

TEST_F(FileSyncDecoratorTest, SeekBeyondFileOffsetRange) {
    Init("abc");
    sync->enable_sync(test_file);

    EXPECT_NO_THROW(sync->seek(std::numeric_limits<size_t>::max()));
    EXPECT_EQ(sync->offset(), std::numeric_limits<size_t>::max());
    EXPECT_EQ(sync->unread_length(), 0u);
    EXPECT_GE(sync->file_position(), sync->synced_length());

    char c;
    EXPECT_TRUE(sync->read(&c, 1).eof);

    // mirror keeps working and the handle can be brought back
    write_str(*sync, "def");
    EXPECT_EQ(file(), "abcdef");
    sync->seek(1);
    EXPECT_EQ(sync->file_position(), 1u);
}

TEST_F(FileSyncDecoratorTest, SeekMatchesPlainBufferPastEnd) {
    Init("abc");
    sync->enable_sync(test_file);
    SeekBuffer plain(std::string("abc"));

    for (size_t off : {size_t(3), size_t(4096), std::numeric_limits<size_t>::max() / 2 + 1,
                       std::numeric_limits<size_t>::max()}) {
        plain.seek(off);
        ASSERT_NO_THROW(sync->seek(off)) << "offset " << off;
        EXPECT_EQ(sync->offset(), plain.offset());
        EXPECT_EQ(sync->unread_length(), plain.unread_length());
    }
}

TEST_F(FileSyncDecoratorTest, SwitchFilesMirrorsCurrentContent) {
    std::string second = test_dir + "/second.dat";

    sync->enable_sync(test_file);
    write_str(*sync, "first part");

    sync->enable_sync(second);
    EXPECT_EQ(sync->sync_path(), second);
    EXPECT_EQ(read_file_string(second), "first part");

    write_str(*sync, "+more");
    EXPECT_EQ(read_file_string(second), "first part+more");
    // old file no longer updated
    EXPECT_EQ(file(), "first part");
}

TEST_F(FileSyncDecoratorTest, DisableStopsMirroring) {
    sync->enable_sync(test_file);
    write_str(*sync, "kept");
    sync->disable_sync();
    EXPECT_FALSE(sync->is_sync_enabled());
    EXPECT_TRUE(sync->sync_path().empty());

    write_str(*sync, "-not-synced");
    EXPECT_EQ(file(), "kept");
    EXPECT_EQ(contents(*sync), "kept-not-synced");

    // idempotent
    EXPECT_NO_THROW(sync->disable_sync());
}

TEST_F(FileSyncDecoratorTest, ResetTruncatesMirror) {
    sync->enable_sync(test_file);
    write_str(*sync, "to be dropped");
    sync->reset();
    EXPECT_EQ(file(), "");
    EXPECT_EQ(sync->synced_length(), 0u);

    write_str(*sync, "fresh");
    EXPECT_EQ(file(), "fresh");
}

TEST_F(FileSyncDecoratorTest, InnerResetDetectedByEpoch) {
    sync->enable_sync(test_file);
    write_str(*sync, "long original content");

    // replaced underneath the mirror with something of equal or greater length
    inner->reset();
    write_str(*inner, "completely different text");
    sync->sync();

    EXPECT_EQ(file(), "completely different text");
    EXPECT_EQ(sync->synced_length(), inner->size());
}

TEST_F(FileSyncDecoratorTest, SyncCatchesUpInnerWrites) {
    sync->enable_sync(test_file);
    write_str(*sync, "a");
    write_str(*inner, "bc");
    EXPECT_EQ(file(), "a");

    sync->sync();
    EXPECT_EQ(file(), "abc");
}

TEST_F(FileSyncDecoratorTest, SyncWhileDisabledIsNoop) {
    write_str(*sync, "x");
    EXPECT_NO_THROW(sync->sync());
    EXPECT_FALSE(std::filesystem::exists(test_file));
}

TEST_F(FileSyncDecoratorTest, CloseReleasesBufferAndFile) {
    sync->enable_sync(test_file);
    write_str(*sync, "persisted");
    sync->close();

    EXPECT_FALSE(sync->is_sync_enabled());
    EXPECT_EQ(sync->size(), 0u);
    // file keeps the last mirrored bytes
    EXPECT_EQ(file(), "persisted");
}

TEST_F(FileSyncDecoratorTest, EnableOnDirectoryFails) {
    write_str(*sync, "data");
    try {
        sync->enable_sync(test_dir);
        FAIL() << "expected IoError";
    } catch (const IoError& e) {
        EXPECT_EQ(e.path(), test_dir);
        EXPECT_EQ(e.error_code(), EISDIR);
    }
    EXPECT_FALSE(sync->is_sync_enabled());

    // buffer still usable
    write_str(*sync, "!");
    EXPECT_EQ(contents(*sync), "data!");
}

TEST_F(FileSyncDecoratorTest, EnableInMissingDirectoryFails) {
    EXPECT_THROW(sync->enable_sync(test_dir + "/no/such/dir/file"), IoError);
    EXPECT_FALSE(sync->is_sync_enabled());
}

TEST_F(FileSyncDecoratorTest, FailedSwitchLeavesSyncDisabled) {
    sync->enable_sync(test_file);
    write_str(*sync, "abc");
    EXPECT_THROW(sync->enable_sync(test_dir), IoError);
    EXPECT_FALSE(sync->is_sync_enabled());

    write_str(*sync, "def");
    EXPECT_EQ(file(), "abc");
}

TEST_F(FileSyncDecoratorTest, CreatesFileWithConfiguredMode) {
    BufferConfig cfg = BufferConfig::defaults();
    cfg.file_mode = 0600;
    mode_t old_mask = umask(0);

    auto s = std::make_unique<FileSyncDecorator>(std::make_unique<SeekBuffer>(), cfg);
    s->enable_sync(test_file);
    umask(old_mask);

    struct stat st;
    ASSERT_EQ(stat(test_file.c_str(), &st), 0);
    EXPECT_EQ(st.st_mode & 0777, 0600u);
}

TEST_F(FileSyncDecoratorTest, DurableSyncMirrorsTheSame) {
    auto s = std::make_unique<FileSyncDecorator>(std::make_unique<SeekBuffer>(),
                                                 BufferConfig::durable());
    s->enable_sync(test_file);
    std::vector<uint8_t> data = generate_test_data(100000, 3);
    s->write(data.data(), data.size());

    std::string f = file();
    EXPECT_EQ(std::vector<uint8_t>(f.begin(), f.end()), data);
}

// Caps the size of files this process may write, so the mirror fails with
// EFBIG after a short write.
class FileSizeLimit {
public:
    explicit FileSizeLimit(rlim_t bytes) {
        old_handler_ = std::signal(SIGXFSZ, SIG_IGN);
        getrlimit(RLIMIT_FSIZE, &saved_);
        struct rlimit lim = saved_;
        lim.rlim_cur = bytes;
        active_ = setrlimit(RLIMIT_FSIZE, &lim) == 0;
    }

    ~FileSizeLimit() { lift(); }

    void lift() {
        if (active_) {
            setrlimit(RLIMIT_FSIZE, &saved_);
            std::signal(SIGXFSZ, old_handler_);
            active_ = false;
        }
    }

    bool active() const { return active_; }

private:
    struct rlimit saved_;
    void (*old_handler_)(int);
    bool active_ = false;
};

TEST_F(FileSyncDecoratorTest, WriteKeepsBytesWhenMirrorFails) {
    sync->enable_sync(test_file);
    write_str(*sync, "0123456789");

    FileSizeLimit limit(12);
    ASSERT_TRUE(limit.active());

    try {
        write_str(*sync, "ABCDEFGH");
        FAIL() << "expected SyncError";
    } catch (const SyncError& e) {
        EXPECT_EQ(e.bytes_accepted(), 8u);
        EXPECT_EQ(e.error_code(), EFBIG);
        EXPECT_EQ(e.path(), test_file);
    }

    // memory has everything, the file only what fit
    EXPECT_EQ(contents(*sync), "0123456789ABCDEFGH");
    EXPECT_EQ(sync->synced_length(), 12u);
    EXPECT_TRUE(sync->is_sync_enabled());

    limit.lift();
    sync->sync();
    EXPECT_EQ(file(), "0123456789ABCDEFGH");
    EXPECT_EQ(sync->synced_length(), 18u);
}

TEST_F(FileSyncDecoratorTest, AppendReportsSyncFailure) {
    sync->enable_sync(test_file);
    append_str(*sync, "head");

    FileSizeLimit limit(4);
    ASSERT_TRUE(limit.active());

    try {
        append_str(*sync, "-body");
        FAIL() << "expected SyncError";
    } catch (const SyncError& e) {
        EXPECT_EQ(e.bytes_accepted(), 5u);
    }
    EXPECT_EQ(contents(*sync), "head-body");
    EXPECT_EQ(file(), "head");

    limit.lift();

    // next successful mutation catches up the whole tail
    append_str(*sync, "!");
    EXPECT_EQ(file(), "head-body!");
}

TEST(FileSyncDecoratorConstruct, RejectsInvalidConfig) {
    BufferConfig cfg;
    cfg.file_mode = 0444;
    EXPECT_THROW(FileSyncDecorator(std::make_unique<SeekBuffer>(), cfg), std::invalid_argument);
    EXPECT_THROW(FileSyncDecorator(nullptr), std::invalid_argument);
}
