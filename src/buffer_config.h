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
#include <cstdint>
#include <cstdlib>
#include <string>
#include <sys/types.h>
#include "config.h"  // For defaults

namespace seekbuf {

/**
 * Runtime configuration for file mirroring and operation logging.
 * Can be customized per buffer stack instead of compile-time constants.
 */
struct BufferConfig {
    // Permission bits used when a sync target has to be created
    mode_t file_mode      = SEEKBUF_DEFAULT_FILE_MODE;

    // fdatasync() after every catch-up sync
    bool durable_sync     = false;

    // Prefix used by LoggingDecorator when no name is given
    std::string log_name  = SEEKBUF_DEFAULT_LOG_NAME;

    /**
     * Create config with defaults, optionally reading from environment
     */
    static BufferConfig defaults() {
        BufferConfig cfg;

        if (const char* env = std::getenv("SEEKBUF_FILE_MODE")) {
            cfg.file_mode = static_cast<mode_t>(std::stoul(env, nullptr, 8));
        }

        if (const char* env = std::getenv("SEEKBUF_DURABLE_SYNC")) {
            cfg.durable_sync = (std::string(env) != "0");
        }

        if (const char* env = std::getenv("SEEKBUF_LOG_NAME")) {
            if (*env) {
                cfg.log_name = env;
            }
        }

        return cfg;
    }

    /**
     * Config for mirrors that must survive a crash right after each write
     */
    static BufferConfig durable() {
        BufferConfig cfg = defaults();
        cfg.durable_sync = true;
        return cfg;
    }

    /**
     * Validate configuration
     */
    bool validate() const {
        if ((file_mode & 0600) != 0600) {
            // Owner must be able to read back and rewrite the mirror
            return false;
        }
        if (file_mode & ~mode_t(07777)) {
            return false;
        }
        return !log_name.empty();
    }
};

} // namespace seekbuf
