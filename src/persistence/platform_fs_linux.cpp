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

#include "platform_fs.h"
#include "../config.h"

#ifdef SEEKBUF_LINUX
#include <unistd.h>
#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <cerrno>
#include <cstring>

namespace seekbuf {
    namespace persist {

        FSResult FileHandle::close() {
            if (fd < 0) {
                return {true, 0};
            }
            int rc = ::close(fd);
            int ec = (rc == 0) ? 0 : errno;
            fd = -1;
            path.clear();
            return {rc == 0, ec};
        }

        FSResult PlatformFS::open_rw(const std::string& path, mode_t mode, FileHandle* out) {
            int flags = O_RDWR | O_CREAT;
#ifdef O_CLOEXEC
            flags |= O_CLOEXEC;
#endif
            int fd = ::open(path.c_str(), flags, mode);
            if (fd < 0) {
                return {false, errno};
            }
            out->fd = fd;
            out->path = path;
            return {true, 0};
        }

        FSResult PlatformFS::pwrite_all(const FileHandle& fh, const void* buf, size_t len,
                                        uint64_t offset, size_t* written) {
            const uint8_t* p = static_cast<const uint8_t*>(buf);
            size_t done = 0;
            while (done < len) {
                ssize_t n = ::pwrite(fh.fd, p + done, len - done, off_t(offset + done));
                if (n < 0) {
                    if (errno == EINTR) {
                        continue;
                    }
                    int ec = errno;
                    if (written) *written = done;
                    return {false, ec};
                }
                if (n == 0) {
                    if (written) *written = done;
                    return {false, EIO};
                }
                done += static_cast<size_t>(n);
            }
            if (written) *written = done;
            return {true, 0};
        }

        FSResult PlatformFS::truncate_file(const FileHandle& fh, uint64_t size) {
            int rc = ::ftruncate(fh.fd, off_t(size));
            return { rc == 0, rc == 0 ? 0 : errno };
        }

        FSResult PlatformFS::seek(const FileHandle& fh, uint64_t offset) {
            off_t rc = ::lseek(fh.fd, off_t(offset), SEEK_SET);
            return { rc >= 0, rc >= 0 ? 0 : errno };
        }

        std::pair<FSResult, uint64_t> PlatformFS::tell(const FileHandle& fh) {
            off_t rc = ::lseek(fh.fd, 0, SEEK_CUR);
            if (rc < 0) {
                return { {false, errno}, 0 };
            }
            return { {true, 0}, uint64_t(rc) };
        }

        FSResult PlatformFS::flush_file(const FileHandle& fh) {
            int rc = ::fdatasync(fh.fd);
            return { rc == 0, rc == 0 ? 0 : errno };
        }

        FSResult PlatformFS::write_file(const std::string& path, const void* buf, size_t len,
                                        bool append, mode_t mode) {
            int flags = O_WRONLY | O_CREAT | (append ? O_APPEND : O_TRUNC);
#ifdef O_CLOEXEC
            flags |= O_CLOEXEC;
#endif
            int fd = ::open(path.c_str(), flags, mode);
            if (fd < 0) {
                return {false, errno};
            }

            const uint8_t* p = static_cast<const uint8_t*>(buf);
            size_t done = 0;
            while (done < len) {
                ssize_t n = ::write(fd, p + done, len - done);
                if (n < 0) {
                    if (errno == EINTR) {
                        continue;
                    }
                    int ec = errno;
                    ::close(fd);
                    return {false, ec};
                }
                done += static_cast<size_t>(n);
            }

            if (::close(fd) != 0) {
                return {false, errno};
            }
            return {true, 0};
        }

        FSResult PlatformFS::read_file(const std::string& path, std::vector<uint8_t>* out) {
            int flags = O_RDONLY;
#ifdef O_CLOEXEC
            flags |= O_CLOEXEC;
#endif
            int fd = ::open(path.c_str(), flags);
            if (fd < 0) {
                return {false, errno};
            }

            std::vector<uint8_t> data;
            uint8_t chunk[SEEKBUF_FILE_CHUNK_SIZE];
            for (;;) {
                ssize_t n = ::read(fd, chunk, sizeof(chunk));
                if (n < 0) {
                    if (errno == EINTR) {
                        continue;
                    }
                    int ec = errno;
                    ::close(fd);
                    return {false, ec};
                }
                if (n == 0) {
                    break;
                }
                data.insert(data.end(), chunk, chunk + n);
            }

            if (::close(fd) != 0) {
                return {false, errno};
            }
            out->swap(data);
            return {true, 0};
        }

        std::pair<FSResult, size_t> PlatformFS::file_size(const std::string& path) {
            struct stat st{};
            int rc = ::stat(path.c_str(), &st);
            return { { rc == 0, rc == 0 ? 0 : errno }, rc == 0 ? (size_t)st.st_size : 0 };
        }

        FSResult PlatformFS::truncate(const std::string& path, size_t size) {
            if (::truncate(path.c_str(), off_t(size)) == 0) {
                return {true, 0};
            }
            return {false, errno};
        }

    } // namespace persist
} // namespace seekbuf
#endif
